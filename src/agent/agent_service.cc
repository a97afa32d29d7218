#include "agent_service.h"

#include <glog/logging.h>

#include "agent_codec.h"
#include "../common/errors.h"

namespace UpgradeJourney {

//
// ClusterAgentServiceImpl implementation
//

Status ClusterAgentServiceImpl::EnsureNetwork(ServerContext* context,
		const harness_agent::NetworkRequest* request, harness_agent::AgentReply* reply) {
	try {
		lifecycle_.EnsureNetwork(request->network());
		reply->set_success(true);
	} catch (const HarnessError& e) {
		reply->set_success(false);
		reply->set_message(e.what());
	}
	return Status::OK;
}

Status ClusterAgentServiceImpl::StartNode(ServerContext* context,
		const harness_agent::StartNodeRequest* request, harness_agent::AgentReply* reply) {
	try {
		lifecycle_.StartNode(request->node_index(), request->version());
		reply->set_success(true);
	} catch (const HarnessError& e) {
		LOG(WARNING) << "[ClusterAgent] StartNode " << request->node_index() << " failed: " << e.what();
		reply->set_success(false);
		reply->set_message(e.what());
	}
	return Status::OK;
}

Status ClusterAgentServiceImpl::StopNode(ServerContext* context,
		const harness_agent::NodeRequest* request, harness_agent::AgentReply* reply) {
	try {
		lifecycle_.StopNode(request->node_index());
		reply->set_success(true);
	} catch (const HarnessError& e) {
		LOG(WARNING) << "[ClusterAgent] StopNode " << request->node_index() << " failed: " << e.what();
		reply->set_success(false);
		reply->set_message(e.what());
	}
	return Status::OK;
}

Status ClusterAgentServiceImpl::GetNodeStatus(ServerContext* context,
		const harness_agent::NodeRequest* request, harness_agent::NodeStatus* reply) {
	try {
		reply->set_ready(lifecycle_.IsNodeReady(request->node_index()));
	} catch (const HarnessError& e) {
		return Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
	}
	return Status::OK;
}

Status ClusterAgentServiceImpl::GetClusterHealth(ServerContext* context,
		const harness_agent::HealthRequest* request, harness_agent::ClusterHealth* reply) {
	try {
		reply->set_healthy(lifecycle_.IsClusterHealthy());
	} catch (const HarnessError& e) {
		LOG(WARNING) << "[ClusterAgent] GetClusterHealth failed: " << e.what();
		return Status(grpc::StatusCode::INTERNAL, e.what());
	}
	return Status::OK;
}

//
// DataGatewayServiceImpl implementation
//

Status DataGatewayServiceImpl::CreateClass(ServerContext* context,
		const harness_agent::ClassSchema* request, harness_agent::AgentReply* reply) {
	try {
		client_.CreateClass(FromProto(*request));
		reply->set_success(true);
	} catch (const HarnessError& e) {
		reply->set_success(false);
		reply->set_message(e.what());
	}
	return Status::OK;
}

Status DataGatewayServiceImpl::CreateObject(ServerContext* context,
		const harness_agent::CreateObjectRequest* request, harness_agent::CreateObjectReply* reply) {
	try {
		reply->set_id(client_.CreateObject(request->class_name(), FromProto(request->properties())));
		reply->set_success(true);
	} catch (const HarnessError& e) {
		reply->set_success(false);
		reply->set_message(e.what());
	}
	return Status::OK;
}

Status DataGatewayServiceImpl::Query(ServerContext* context,
		const harness_agent::QueryRequest* request, harness_agent::QueryReply* reply) {
	try {
		EqualityFilter filter{request->filter_path(), FromProto(request->filter_value())};
		std::vector<std::string> fields(request->fields().begin(), request->fields().end());
		for (const auto& object : client_.Query(request->class_name(), filter, fields)) {
			auto* out = reply->add_objects();
			out->set_id(object.id);
			ToProto(object.properties, out->mutable_properties());
		}
		reply->set_success(true);
	} catch (const HarnessError& e) {
		reply->clear_objects();
		reply->set_success(false);
		reply->set_message(e.what());
	}
	return Status::OK;
}

Status DataGatewayServiceImpl::Aggregate(ServerContext* context,
		const harness_agent::AggregateRequest* request, harness_agent::AggregateReply* reply) {
	try {
		reply->set_count(client_.Aggregate(request->class_name()));
		reply->set_success(true);
	} catch (const HarnessError& e) {
		reply->set_success(false);
		reply->set_message(e.what());
	}
	return Status::OK;
}

//
// AgentServer implementation
//

AgentServer::AgentServer(const std::string& address, NodeLifecycle& lifecycle, DataClient& client)
	: cluster_service_(lifecycle), data_service_(client) {
	ServerBuilder builder;
	if (!address.empty()) {
		builder.AddListeningPort(address, grpc::InsecureServerCredentials());
	}
	builder.RegisterService(&cluster_service_);
	builder.RegisterService(&data_service_);
	server_ = builder.BuildAndStart();
	if (!server_) {
		throw std::runtime_error("Failed to start gRPC server on " + address);
	}
	LOG(INFO) << "[AgentServer] serving" << (address.empty() ? std::string(" in-process") : " on " + address);
}

AgentServer::~AgentServer() {
	Shutdown();
	LOG(INFO) << "[AgentServer] Destructed";
}

void AgentServer::Shutdown() {
	if (server_) {
		server_->Shutdown();
	}
}

std::shared_ptr<grpc::Channel> AgentServer::InProcessChannel() {
	return server_->InProcessChannel(grpc::ChannelArguments());
}

} // End of namespace UpgradeJourney
