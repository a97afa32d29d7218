#ifndef UPGRADE_JOURNEY_SRC_WORKLOAD_WORKLOAD_DRIVER_H_
#define UPGRADE_JOURNEY_SRC_WORKLOAD_WORKLOAD_DRIVER_H_

#include <cstdint>
#include <string>

#include "../common/interfaces.h"

namespace UpgradeJourney {

// Counters carried from one step of a run to the next.
struct RunState {
    int64_t objects_created = 0;
    size_t current_step = 0;
};

// Schema of the version-tagged records.
ClassSchema CollectionSchema(const std::string& class_name);

/**
 * Writes the version-tagged workload. One record per step; each record carries
 * the version active when it was written and the running write counter.
 */
class WorkloadDriver {
public:
    explicit WorkloadDriver(DataClient& client, std::string class_name);

    // Throws SchemaError when the service rejects the class.
    void CreateSchema();

    // Writes {version, object_count = state.objects_created} and increments
    // the counter once the service acknowledged. Throws ImportError.
    std::string ImportForVersion(const std::string& version, RunState& state);

    const std::string& class_name() const { return class_name_; }

private:
    DataClient& client_;
    std::string class_name_;
};

} // namespace UpgradeJourney

#endif // UPGRADE_JOURNEY_SRC_WORKLOAD_WORKLOAD_DRIVER_H_
