#include "run_coordinator.h"

#include <sstream>

#include <glog/logging.h>

namespace UpgradeJourney {

const char* RunPhaseName(RunPhase phase) {
    switch (phase) {
        case RunPhase::kBootstrapping: return "Bootstrapping";
        case RunPhase::kUpgrading:     return "Upgrading";
        case RunPhase::kCompleted:     return "Completed";
        case RunPhase::kFailed:        return "Failed";
    }
    return "Unknown";
}

std::string RunOutcome::Describe() const {
    std::stringstream ss;
    if (ok()) {
        ss << "PASS: " << steps_completed << " step(s) verified, "
           << objects_created << " object(s) written";
        return ss.str();
    }
    ss << "FAIL at step " << (failed_step ? std::to_string(*failed_step) : std::string("?"))
       << " (" << (current_version.empty() ? std::string("<none>") : current_version)
       << " -> " << target_version << "): " << ErrorKindName(error_kind) << ": " << message;
    return ss.str();
}

RunCoordinator::RunCoordinator(const VersionSequence& sequence, ClusterController& cluster,
                               WorkloadDriver& workload, ConsistencyVerifier& verifier)
    : sequence_(sequence), cluster_(cluster), workload_(workload), verifier_(verifier) {}

void RunCoordinator::RunStep(size_t step) {
    const std::string& version = step == 0 ? sequence_.Bootstrap() : sequence_.at(step);
    phase_ = step == 0 ? RunPhase::kBootstrapping : RunPhase::kUpgrading;
    LOG(INFO) << "[" << RunPhaseName(phase_) << "] step " << step << "/" << sequence_.size() - 1
              << " at version " << version;

    if (phase_ == RunPhase::kBootstrapping) {
        cluster_.StartAllNodes(version);
        workload_.CreateSchema();
    } else {
        cluster_.RollingUpdate(version);
    }

    workload_.ImportForVersion(version, state_);

    size_t found = verifier_.FindEachImportedObject(sequence_, step);
    verifier_.AggregateObjects(state_.objects_created);
    LOG(INFO) << "Step " << step << " (" << version << ") verified: " << found
              << " record(s), aggregate " << state_.objects_created;
}

RunOutcome RunCoordinator::Run() {
    state_ = RunState();
    RunOutcome outcome;
    LOG(INFO) << "Upgrade journey over " << sequence_.size() << " version(s): " << sequence_.ToString();

    for (size_t step = 0; step < sequence_.size(); ++step) {
        state_.current_step = step;
        bool failed = false;
        try {
            RunStep(step);
        } catch (const HarnessError& e) {
            outcome.error_kind = e.kind();
            outcome.message = e.what();
            failed = true;
        } catch (const std::exception& e) {
            outcome.error_kind = ErrorKind::kUnknown;
            outcome.message = e.what();
            failed = true;
        }

        if (failed) {
            outcome.failed_phase = phase_;
            phase_ = RunPhase::kFailed;
            outcome.phase = phase_;
            outcome.failed_step = step;
            outcome.current_version = step == 0 ? std::string() : sequence_[step - 1];
            outcome.target_version = sequence_[step];
            outcome.steps_completed = step;
            outcome.objects_created = state_.objects_created;
            LOG(ERROR) << outcome.Describe() << " while " << RunPhaseName(outcome.failed_phase);
            LOG(ERROR) << "Cluster at failure: " << cluster_.state().ToString();
            return outcome;
        }
    }

    phase_ = RunPhase::kCompleted;
    outcome.phase = phase_;
    outcome.steps_completed = sequence_.size();
    outcome.objects_created = state_.objects_created;
    LOG(INFO) << outcome.Describe();
    return outcome;
}

} // namespace UpgradeJourney
