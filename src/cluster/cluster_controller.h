#ifndef UPGRADE_JOURNEY_SRC_CLUSTER_CLUSTER_CONTROLLER_H_
#define UPGRADE_JOURNEY_SRC_CLUSTER_CLUSTER_CONTROLLER_H_

#include <string>
#include <vector>

#include "../common/interfaces.h"
#include "../common/retry.h"

namespace UpgradeJourney {

enum class NodeState {
	kStopped,
	kStarting,
	kRunning,
};

const char* NodeStateName(NodeState state);

struct ClusterNode {
	int index;
	std::string version;
	NodeState state = NodeState::kStopped;
};

struct ClusterState {
	std::vector<ClusterNode> nodes;
	std::string network;
	bool network_ready = false;
	// Version most recently applied to the node(s) being upgraded.
	std::string current_version;

	bool AllRunningAt(const std::string& version) const;
	bool IsMixedVersion() const;
	std::string ToString() const;
};

/**
 * Owns the fixed set of nodes and drives their lifecycle. Node records are
 * updated as each transition completes, so after a failed rolling update
 * state() shows exactly which nodes were replaced. Nothing is rolled back.
 */
class ClusterController {
	public:
		ClusterController(NodeLifecycle& lifecycle, int size, const std::string& network,
				RetryPolicy readiness, Clock& clock = DefaultClock());

		// Brings every node up at version at once and waits for the cluster
		// to report healthy. Throws ClusterStartError.
		void StartAllNodes(const std::string& version);

		// Replaces nodes one at a time in ascending index order. Throws
		// RollingUpdateError naming the first node that failed to rejoin;
		// later nodes are left untouched.
		void RollingUpdate(const std::string& target_version);

		const ClusterState& state() const { return state_; }
		int size() const { return static_cast<int>(state_.nodes.size()); }

	private:
		bool WaitForNodeReady(int index);
		bool WaitForClusterHealthy(const std::string& operation);

		NodeLifecycle& lifecycle_;
		ClusterState state_;
		Retrier readiness_;
		bool started_ = false;
};

} // End of namespace UpgradeJourney
#endif
