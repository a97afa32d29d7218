#include "cluster_controller.h"

#include <sstream>

#include <glog/logging.h>

#include "../common/errors.h"

namespace UpgradeJourney {

namespace {

std::string DescribeBound(const RetryPolicy& policy) {
	return std::to_string(policy.max_attempts) + " checks over " +
		std::to_string(policy.TotalBudget().count()) + "ms";
}

} // namespace

const char* NodeStateName(NodeState state) {
	switch (state) {
		case NodeState::kStopped:  return "stopped";
		case NodeState::kStarting: return "starting";
		case NodeState::kRunning:  return "running";
	}
	return "unknown";
}

bool ClusterState::AllRunningAt(const std::string& version) const {
	for (const auto& node : nodes) {
		if (node.state != NodeState::kRunning || node.version != version) {
			return false;
		}
	}
	return !nodes.empty();
}

bool ClusterState::IsMixedVersion() const {
	for (const auto& node : nodes) {
		if (node.version != nodes.front().version) {
			return true;
		}
	}
	return false;
}

std::string ClusterState::ToString() const {
	std::stringstream ss;
	ss << "network=" << network << " nodes={";
	for (size_t i = 0; i < nodes.size(); ++i) {
		if (i > 0) ss << ", ";
		ss << nodes[i].index << ":" << (nodes[i].version.empty() ? "-" : nodes[i].version)
			<< "/" << NodeStateName(nodes[i].state);
	}
	ss << "}";
	return ss.str();
}

ClusterController::ClusterController(NodeLifecycle& lifecycle, int size, const std::string& network,
		RetryPolicy readiness, Clock& clock)
	: lifecycle_(lifecycle), readiness_(readiness, clock) {
	if (size < 1) {
		throw ClusterStartError("cluster size must be at least 1, got " + std::to_string(size));
	}
	state_.network = network;
	state_.nodes.reserve(size);
	for (int i = 0; i < size; ++i) {
		state_.nodes.push_back({i, "", NodeState::kStopped});
	}
}

bool ClusterController::WaitForNodeReady(int index) {
	return readiness_.Poll([this, index]() {
			return lifecycle_.IsNodeReady(index);
			}, "wait for node " + std::to_string(index) + " ready");
}

bool ClusterController::WaitForClusterHealthy(const std::string& operation) {
	return readiness_.Poll([this]() {
			return lifecycle_.IsClusterHealthy();
			}, operation);
}

void ClusterController::StartAllNodes(const std::string& version) {
	LOG(INFO) << "Starting " << size() << " node(s) at version " << version
		<< " on network " << state_.network;

	try {
		if (!state_.network_ready) {
			lifecycle_.EnsureNetwork(state_.network);
			state_.network_ready = true;
		}
		for (auto& node : state_.nodes) {
			lifecycle_.StartNode(node.index, version);
			node.version = version;
			node.state = NodeState::kStarting;
		}
		state_.current_version = version;

		for (auto& node : state_.nodes) {
			if (!WaitForNodeReady(node.index)) {
				throw ClusterStartError("node " + std::to_string(node.index) + " did not become ready at version " +
						version + " after " + DescribeBound(readiness_.policy()));
			}
			node.state = NodeState::kRunning;
			VLOG(1) << "Node " << node.index << " ready at " << version;
		}

		if (!WaitForClusterHealthy("wait for cluster healthy after start")) {
			throw ClusterStartError("cluster did not report healthy at version " + version);
		}
	} catch (const ClusterStartError&) {
		throw;
	} catch (const HarnessError& e) {
		throw ClusterStartError(std::string("starting cluster at ") + version + " failed: " + e.what());
	}

	started_ = true;
	LOG(INFO) << "Cluster up: " << state_.ToString();
}

void ClusterController::RollingUpdate(const std::string& target_version) {
	if (!started_) {
		throw ClusterStartError("rolling update to " + target_version + " requested before the cluster was started");
	}

	LOG(INFO) << "Rolling update " << state_.current_version << " -> " << target_version;
	state_.current_version = target_version;

	for (auto& node : state_.nodes) {
		const std::string previous = node.version;
		try {
			VLOG(1) << "Stopping node " << node.index << " (" << previous << ")";
			lifecycle_.StopNode(node.index);
			node.state = NodeState::kStopped;

			lifecycle_.StartNode(node.index, target_version);
			node.version = target_version;
			node.state = NodeState::kStarting;
		} catch (const HarnessError& e) {
			throw RollingUpdateError(node.index, std::string("replacing ") + previous + " with " +
					target_version + " failed: " + e.what());
		}

		bool rejoined = false;
		try {
			rejoined = WaitForNodeReady(node.index);
		} catch (const HarnessError& e) {
			throw RollingUpdateError(node.index, std::string("readiness check failed: ") + e.what());
		}
		if (!rejoined) {
			LOG(ERROR) << "Node " << node.index << " did not rejoin at " << target_version
				<< ", cluster left as " << state_.ToString();
			throw RollingUpdateError(node.index, "did not rejoin at version " + target_version + " after " +
					DescribeBound(readiness_.policy()));
		}
		node.state = NodeState::kRunning;

		bool healthy = false;
		try {
			healthy = WaitForClusterHealthy("wait for cluster healthy after node " + std::to_string(node.index));
		} catch (const HarnessError& e) {
			throw RollingUpdateError(node.index, std::string("health check failed: ") + e.what());
		}
		if (!healthy) {
			throw RollingUpdateError(node.index, "cluster did not report healthy after the node rejoined at " +
					target_version);
		}
		LOG(INFO) << "Node " << node.index << " upgraded " << previous << " -> " << target_version;
	}

	LOG(INFO) << "Rolling update to " << target_version << " complete: " << state_.ToString();
}

} // End of namespace UpgradeJourney
