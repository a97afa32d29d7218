#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "absl/container/flat_hash_map.h"

namespace UpgradeJourney {

using PropertyValue = std::variant<std::string, int64_t>;
using Properties = absl::flat_hash_map<std::string, PropertyValue>;

enum class PropertyType {
    kText,
    kInt,
};

struct PropertyDef {
    std::string name;
    PropertyType type;
};

struct ClassSchema {
    std::string name;
    std::vector<PropertyDef> properties;
};

struct DataObject {
    std::string id;
    Properties properties;
};

// Matches objects whose property at `path` equals `value`.
struct EqualityFilter {
    std::string path;
    PropertyValue value;
};

/**
 * Interface for the orchestration layer that runs the cluster nodes.
 * Implementations raise ServiceError when a request is rejected and
 * TimeoutError when it does not complete in time.
 */
class NodeLifecycle {
public:
    virtual ~NodeLifecycle() = default;

    // Creates the network shared by every node unless it already exists.
    virtual void EnsureNetwork(const std::string& network) = 0;
    virtual void StartNode(int index, const std::string& version) = 0;
    virtual void StopNode(int index) = 0;

    // Non-blocking checks; bounded waiting is the caller's job.
    virtual bool IsNodeReady(int index) = 0;
    virtual bool IsClusterHealthy() = 0;
};

/**
 * Interface for the client of the service under test
 */
class DataClient {
public:
    virtual ~DataClient() = default;

    virtual void CreateClass(const ClassSchema& schema) = 0;

    // Returns the id assigned by the service once the write is acknowledged.
    virtual std::string CreateObject(const std::string& class_name, const Properties& properties) = 0;

    // Returns matching objects carrying only the requested fields.
    virtual std::vector<DataObject> Query(const std::string& class_name,
                                          const EqualityFilter& filter,
                                          const std::vector<std::string>& fields) = 0;

    // Number of objects of the class, as counted by the service.
    virtual int64_t Aggregate(const std::string& class_name) = 0;
};

} // namespace UpgradeJourney
