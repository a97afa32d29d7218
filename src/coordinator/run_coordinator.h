#ifndef UPGRADE_JOURNEY_SRC_COORDINATOR_RUN_COORDINATOR_H_
#define UPGRADE_JOURNEY_SRC_COORDINATOR_RUN_COORDINATOR_H_

#include <cstdint>
#include <optional>
#include <string>

#include "../cluster/cluster_controller.h"
#include "../cluster/version_sequence.h"
#include "../common/errors.h"
#include "../verifier/consistency_verifier.h"
#include "../workload/workload_driver.h"

namespace UpgradeJourney {

enum class RunPhase {
    kBootstrapping,
    kUpgrading,
    kCompleted,
    kFailed,
};

const char* RunPhaseName(RunPhase phase);

struct RunOutcome {
    RunPhase phase = RunPhase::kBootstrapping;
    size_t steps_completed = 0;
    int64_t objects_created = 0;

    // Set when phase == kFailed
    std::optional<size_t> failed_step;
    RunPhase failed_phase = RunPhase::kBootstrapping;
    ErrorKind error_kind = ErrorKind::kUnknown;
    std::string current_version;
    std::string target_version;
    std::string message;

    bool ok() const { return phase == RunPhase::kCompleted; }

    // One line diagnostic for the operator.
    std::string Describe() const;
};

/**
 * Drives the upgrade journey: step 0 bootstraps the cluster and the schema,
 * every later step rolls the cluster to the next version. Each step writes one
 * record and re-verifies everything written so far. The first error ends the
 * run; nothing after a broken step is attempted.
 */
class RunCoordinator {
public:
    RunCoordinator(const VersionSequence& sequence, ClusterController& cluster,
                   WorkloadDriver& workload, ConsistencyVerifier& verifier);

    RunOutcome Run();

    RunPhase phase() const { return phase_; }
    const RunState& run_state() const { return state_; }

private:
    void RunStep(size_t step);

    const VersionSequence& sequence_;
    ClusterController& cluster_;
    WorkloadDriver& workload_;
    ConsistencyVerifier& verifier_;

    RunPhase phase_ = RunPhase::kBootstrapping;
    RunState state_;
};

} // namespace UpgradeJourney

#endif // UPGRADE_JOURNEY_SRC_COORDINATOR_RUN_COORDINATOR_H_
