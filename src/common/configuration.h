#ifndef UPGRADE_JOURNEY_CONFIGURATION_H_
#define UPGRADE_JOURNEY_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

#include "config.h"
#include "retry.h"

namespace UpgradeJourney {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

// Default upgrade path, oldest first.
std::vector<std::string> DefaultVersions();

// Splits "1.0, 1.1,1.2" into its trimmed, non-empty entries.
std::vector<std::string> ParseVersionList(const std::string& list);

/**
 * Main configuration structure
 */
struct HarnessConfig {
    // Ordered upgrade path; the first entry is the bootstrap version.
    // UPGRADE_JOURNEY_VERSIONS (comma separated) replaces it when set.
    std::vector<std::string> versions = DefaultVersions();

    struct Cluster {
        ConfigValue<int> size{kDefaultClusterSize, "UPGRADE_JOURNEY_CLUSTER_SIZE"};
        ConfigValue<std::string> network{kDefaultNetworkName, "UPGRADE_JOURNEY_NETWORK"};
    } cluster;

    // Node and cluster readiness polling
    struct Readiness {
        ConfigValue<int> poll_interval_ms{readiness_poll_interval_ms, "UPGRADE_JOURNEY_READINESS_POLL_MS"};
        ConfigValue<int> max_attempts{readiness_max_attempts, "UPGRADE_JOURNEY_READINESS_MAX_ATTEMPTS"};
    } readiness;

    // Read-after-write tolerance of the verifier
    struct Visibility {
        ConfigValue<int> initial_interval_ms{visibility_initial_interval_ms, "UPGRADE_JOURNEY_VISIBILITY_INTERVAL_MS"};
        ConfigValue<int> max_interval_ms{visibility_max_interval_ms, "UPGRADE_JOURNEY_VISIBILITY_MAX_INTERVAL_MS"};
        ConfigValue<double> backoff_multiplier{visibility_backoff_multiplier, "UPGRADE_JOURNEY_VISIBILITY_BACKOFF"};
        ConfigValue<int> max_attempts{visibility_max_attempts, "UPGRADE_JOURNEY_VISIBILITY_MAX_ATTEMPTS"};
    } visibility;

    // Endpoint of the agent that fronts the cluster and the service under test
    struct Service {
        ConfigValue<std::string> agent_address{kDefaultAgentAddress, "UPGRADE_JOURNEY_AGENT"};
        ConfigValue<int> rpc_timeout_ms{agent_rpc_timeout_ms, "UPGRADE_JOURNEY_RPC_TIMEOUT_MS"};
        ConfigValue<std::string> class_name{kCollectionClassName, "UPGRADE_JOURNEY_CLASS_NAME"};
    } service;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Restore built-in defaults
    void reset();

    // Get the configuration
    const HarnessConfig& config() const { return config_; }
    HarnessConfig& config() { return config_; }

    // Helper methods for common access patterns
    std::vector<std::string> getVersions() const;
    int getClusterSize() const { return config_.cluster.size.get(); }
    std::string getNetworkName() const { return config_.cluster.network.get(); }
    std::string getAgentAddress() const { return config_.service.agent_address.get(); }
    std::string getClassName() const { return config_.service.class_name.get(); }
    RetryPolicy getReadinessPolicy() const;
    RetryPolicy getVisibilityPolicy() const;

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    HarnessConfig config_;
    mutable std::vector<std::string> validation_errors_;
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

} // namespace UpgradeJourney

#endif // UPGRADE_JOURNEY_CONFIGURATION_H_
