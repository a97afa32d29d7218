#ifndef UPGRADE_JOURNEY_SRC_AGENT_AGENT_CLIENT_H_
#define UPGRADE_JOURNEY_SRC_AGENT_AGENT_CLIENT_H_

#include <chrono>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include <harness_agent.grpc.pb.h>

#include "../common/interfaces.h"

namespace UpgradeJourney {

/**
 * NodeLifecycle backed by the ClusterAgent RPC service. Every call carries the
 * configured deadline; an expired deadline raises TimeoutError, any other
 * failure or a negative reply raises ServiceError. The readiness and health
 * checks instead report false when the agent is unreachable or too slow, so
 * the caller's poll counts it as one failed attempt.
 */
class GrpcNodeLifecycle : public NodeLifecycle {
	public:
		GrpcNodeLifecycle(const std::shared_ptr<grpc::Channel>& channel, std::chrono::milliseconds rpc_timeout);

		void EnsureNetwork(const std::string& network) override;
		void StartNode(int index, const std::string& version) override;
		void StopNode(int index) override;
		bool IsNodeReady(int index) override;
		bool IsClusterHealthy() override;

	private:
		std::unique_ptr<harness_agent::ClusterAgent::Stub> stub_;
		std::chrono::milliseconds rpc_timeout_;
};

// DataClient backed by the DataGateway RPC service.
class GrpcDataClient : public DataClient {
	public:
		GrpcDataClient(const std::shared_ptr<grpc::Channel>& channel, std::chrono::milliseconds rpc_timeout);

		void CreateClass(const ClassSchema& schema) override;
		std::string CreateObject(const std::string& class_name, const Properties& properties) override;
		std::vector<DataObject> Query(const std::string& class_name, const EqualityFilter& filter,
				const std::vector<std::string>& fields) override;
		int64_t Aggregate(const std::string& class_name) override;

	private:
		std::unique_ptr<harness_agent::DataGateway::Stub> stub_;
		std::chrono::milliseconds rpc_timeout_;
};

} // End of namespace UpgradeJourney
#endif
