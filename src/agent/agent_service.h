#ifndef UPGRADE_JOURNEY_SRC_AGENT_AGENT_SERVICE_H_
#define UPGRADE_JOURNEY_SRC_AGENT_AGENT_SERVICE_H_

#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include <harness_agent.grpc.pb.h>

#include "../common/interfaces.h"

namespace UpgradeJourney {

using grpc::Server;
using grpc::ServerBuilder;
using grpc::ServerContext;
using grpc::Status;

// Serves a NodeLifecycle implementation over RPC. Capability errors are
// returned as negative replies, never as transport failures.
class ClusterAgentServiceImpl final : public harness_agent::ClusterAgent::Service {
	public:
		explicit ClusterAgentServiceImpl(NodeLifecycle& lifecycle) : lifecycle_(lifecycle) {}

		Status EnsureNetwork(ServerContext* context, const harness_agent::NetworkRequest* request,
				harness_agent::AgentReply* reply) override;
		Status StartNode(ServerContext* context, const harness_agent::StartNodeRequest* request,
				harness_agent::AgentReply* reply) override;
		Status StopNode(ServerContext* context, const harness_agent::NodeRequest* request,
				harness_agent::AgentReply* reply) override;
		Status GetNodeStatus(ServerContext* context, const harness_agent::NodeRequest* request,
				harness_agent::NodeStatus* reply) override;
		Status GetClusterHealth(ServerContext* context, const harness_agent::HealthRequest* request,
				harness_agent::ClusterHealth* reply) override;

	private:
		NodeLifecycle& lifecycle_;
};

class DataGatewayServiceImpl final : public harness_agent::DataGateway::Service {
	public:
		explicit DataGatewayServiceImpl(DataClient& client) : client_(client) {}

		Status CreateClass(ServerContext* context, const harness_agent::ClassSchema* request,
				harness_agent::AgentReply* reply) override;
		Status CreateObject(ServerContext* context, const harness_agent::CreateObjectRequest* request,
				harness_agent::CreateObjectReply* reply) override;
		Status Query(ServerContext* context, const harness_agent::QueryRequest* request,
				harness_agent::QueryReply* reply) override;
		Status Aggregate(ServerContext* context, const harness_agent::AggregateRequest* request,
				harness_agent::AggregateReply* reply) override;

	private:
		DataClient& client_;
};

/**
 * Owns the RPC server hosting both agent services.
 */
class AgentServer {
	public:
		// address should be host:port; an empty address serves in-process only.
		AgentServer(const std::string& address, NodeLifecycle& lifecycle, DataClient& client);
		~AgentServer();

		// Stops accepting calls and waits for in-flight ones to finish.
		void Shutdown();

		// Channel that reaches the server without a network hop.
		std::shared_ptr<grpc::Channel> InProcessChannel();

	private:
		ClusterAgentServiceImpl cluster_service_;
		DataGatewayServiceImpl data_service_;
		std::unique_ptr<Server> server_;
};

} // End of namespace UpgradeJourney
#endif
