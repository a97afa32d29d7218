#ifndef UPGRADE_JOURNEY_SRC_SIM_SIMULATED_CLUSTER_H_
#define UPGRADE_JOURNEY_SRC_SIM_SIMULATED_CLUSTER_H_

#include <chrono>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/synchronization/mutex.h"

#include "../common/interfaces.h"
#include "../common/retry.h"

namespace UpgradeJourney {

struct SimulationOptions {
	// Time a started node needs before it reports ready.
	std::chrono::milliseconds startup_delay{0};
	// Time a written object needs before reads can see it. Fixed per write
	// when the object is created.
	std::chrono::milliseconds visibility_lag{0};
};

/**
 * In-memory stand-in for a versioned, replicated service and the orchestration
 * layer running it. Serves both capabilities so the harness can run end to end
 * without containers, and supports failure injection for the unhappy paths.
 */
class SimulatedCluster : public NodeLifecycle, public DataClient {
	public:
		SimulatedCluster(int size, SimulationOptions options, Clock& clock = DefaultClock());

		// NodeLifecycle
		void EnsureNetwork(const std::string& network) override;
		void StartNode(int index, const std::string& version) override;
		void StopNode(int index) override;
		bool IsNodeReady(int index) override;
		bool IsClusterHealthy() override;

		// DataClient
		void CreateClass(const ClassSchema& schema) override;
		std::string CreateObject(const std::string& class_name, const Properties& properties) override;
		std::vector<DataObject> Query(const std::string& class_name, const EqualityFilter& filter,
				const std::vector<std::string>& fields) override;
		int64_t Aggregate(const std::string& class_name) override;

		// Failure injection
		void FailNodeAtVersion(int index, const std::string& version);
		void RejectClassCreation(bool reject);
		void RejectWrites(bool reject);
		// Both apply to objects written afterwards; a per-version lag wins.
		void SetVisibilityLag(std::chrono::milliseconds lag);
		void LagWritesOfVersion(const std::string& version, std::chrono::milliseconds lag);
		// Removes stored objects whose version property equals version.
		void DropObjectsWithVersion(const std::string& version);

		// Inspection
		int size() const { return static_cast<int>(nodes_.size()); }
		std::string NodeVersion(int index) const;
		bool IsNodeRunning(int index) const;
		std::vector<std::string> Events() const;
		int64_t StoredObjects() const;

	private:
		struct Node {
			bool running = false;
			std::string version;
			Clock::TimePoint started_at;
			absl::flat_hash_set<std::string> failing_versions;
		};

		struct StoredObject {
			std::string class_name;
			DataObject object;
			Clock::TimePoint visible_at;
		};

		Node& NodeAt(int index) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
		bool NodeReadyLocked(const Node& node) const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
		void RequireAvailableLocked(const std::string& operation) const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
		bool VisibleLocked(const StoredObject& stored) const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

		Clock& clock_;
		mutable absl::Mutex mutex_;
		SimulationOptions options_ ABSL_GUARDED_BY(mutex_);
		std::vector<Node> nodes_;
		absl::flat_hash_set<std::string> networks_ ABSL_GUARDED_BY(mutex_);
		absl::flat_hash_map<std::string, ClassSchema> classes_ ABSL_GUARDED_BY(mutex_);
		std::vector<StoredObject> objects_ ABSL_GUARDED_BY(mutex_);
		absl::flat_hash_map<std::string, std::chrono::milliseconds> version_lags_ ABSL_GUARDED_BY(mutex_);
		std::vector<std::string> events_ ABSL_GUARDED_BY(mutex_);
		uint64_t next_object_id_ ABSL_GUARDED_BY(mutex_) = 1;
		bool reject_class_creation_ ABSL_GUARDED_BY(mutex_) = false;
		bool reject_writes_ ABSL_GUARDED_BY(mutex_) = false;
};

} // End of namespace UpgradeJourney
#endif
