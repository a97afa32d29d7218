#ifndef UPGRADE_JOURNEY_SRC_COMMON_ERRORS_H_
#define UPGRADE_JOURNEY_SRC_COMMON_ERRORS_H_

#include <cstdint>
#include <stdexcept>
#include <string>

namespace UpgradeJourney {

enum class ErrorKind {
    kSequence,
    kConfig,
    kClusterStart,
    kRollingUpdate,
    kSchema,
    kImport,
    kDataLoss,
    kAggregateMismatch,
    kTimeout,
    kService,
    kUnknown,
};

const char* ErrorKindName(ErrorKind kind);

/**
 * Base of every error the harness raises. The kind survives propagation up to
 * the run coordinator, which reports it as the terminal failure.
 */
class HarnessError : public std::runtime_error {
public:
    HarnessError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class SequenceError : public HarnessError {
public:
    explicit SequenceError(const std::string& message)
        : HarnessError(ErrorKind::kSequence, message) {}
};

class ConfigError : public HarnessError {
public:
    explicit ConfigError(const std::string& message)
        : HarnessError(ErrorKind::kConfig, message) {}
};

class ClusterStartError : public HarnessError {
public:
    explicit ClusterStartError(const std::string& message)
        : HarnessError(ErrorKind::kClusterStart, message) {}
};

class RollingUpdateError : public HarnessError {
public:
    RollingUpdateError(int node_index, const std::string& message)
        : HarnessError(ErrorKind::kRollingUpdate,
                       "node " + std::to_string(node_index) + ": " + message),
          node_index_(node_index) {}

    int node_index() const { return node_index_; }

private:
    int node_index_;
};

class SchemaError : public HarnessError {
public:
    explicit SchemaError(const std::string& message)
        : HarnessError(ErrorKind::kSchema, message) {}
};

class ImportError : public HarnessError {
public:
    explicit ImportError(const std::string& message)
        : HarnessError(ErrorKind::kImport, message) {}
};

class DataLossError : public HarnessError {
public:
    DataLossError(const std::string& version, const std::string& message)
        : HarnessError(ErrorKind::kDataLoss, "version " + version + ": " + message),
          version_(version) {}

    const std::string& version() const { return version_; }

private:
    std::string version_;
};

class AggregateMismatchError : public HarnessError {
public:
    AggregateMismatchError(int64_t expected, int64_t actual)
        : HarnessError(ErrorKind::kAggregateMismatch,
                       "aggregation: wanted " + std::to_string(expected) +
                       ", got " + std::to_string(actual)),
          expected_(expected), actual_(actual) {}

    int64_t expected() const { return expected_; }
    int64_t actual() const { return actual_; }

private:
    int64_t expected_;
    int64_t actual_;
};

class TimeoutError : public HarnessError {
public:
    explicit TimeoutError(const std::string& operation)
        : HarnessError(ErrorKind::kTimeout, "timed out: " + operation),
          operation_(operation) {}

    const std::string& operation() const { return operation_; }

private:
    std::string operation_;
};

// Raised by capability adapters when the remote side fails or rejects a call.
class ServiceError : public HarnessError {
public:
    explicit ServiceError(const std::string& message)
        : HarnessError(ErrorKind::kService, message) {}
};

} // namespace UpgradeJourney

#endif // UPGRADE_JOURNEY_SRC_COMMON_ERRORS_H_
