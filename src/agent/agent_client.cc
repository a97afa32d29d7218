#include "agent_client.h"

#include <glog/logging.h>

#include "agent_codec.h"
#include "../common/errors.h"

namespace UpgradeJourney {

namespace {

void SetDeadline(grpc::ClientContext& context, std::chrono::milliseconds timeout) {
	context.set_deadline(std::chrono::system_clock::now() + timeout);
}

void CheckStatus(const grpc::Status& status, const std::string& operation) {
	if (status.ok()) {
		return;
	}
	if (status.error_code() == grpc::StatusCode::DEADLINE_EXCEEDED) {
		throw TimeoutError(operation);
	}
	LOG(WARNING) << operation << " RPC failed: " << status.error_code() << " " << status.error_message();
	throw ServiceError(operation + " RPC failed: " + status.error_message());
}

// Check results that only mean "not yet": the agent is briefly unreachable
// while a node restarts, or too busy to answer within the deadline.
bool CheckNotAnswered(const grpc::Status& status) {
	return status.error_code() == grpc::StatusCode::UNAVAILABLE ||
		status.error_code() == grpc::StatusCode::DEADLINE_EXCEEDED;
}

void CheckReply(bool success, const std::string& message, const std::string& operation) {
	if (!success) {
		throw ServiceError(operation + " rejected: " + message);
	}
}

} // namespace

//
// GrpcNodeLifecycle
//

GrpcNodeLifecycle::GrpcNodeLifecycle(const std::shared_ptr<grpc::Channel>& channel,
		std::chrono::milliseconds rpc_timeout)
	: stub_(harness_agent::ClusterAgent::NewStub(channel)), rpc_timeout_(rpc_timeout) {}

void GrpcNodeLifecycle::EnsureNetwork(const std::string& network) {
	harness_agent::NetworkRequest request;
	request.set_network(network);
	harness_agent::AgentReply reply;
	grpc::ClientContext context;
	SetDeadline(context, rpc_timeout_);

	CheckStatus(stub_->EnsureNetwork(&context, request, &reply), "EnsureNetwork");
	CheckReply(reply.success(), reply.message(), "EnsureNetwork " + network);
}

void GrpcNodeLifecycle::StartNode(int index, const std::string& version) {
	harness_agent::StartNodeRequest request;
	request.set_node_index(index);
	request.set_version(version);
	harness_agent::AgentReply reply;
	grpc::ClientContext context;
	SetDeadline(context, rpc_timeout_);

	VLOG(2) << "StartNode " << index << " " << version;
	CheckStatus(stub_->StartNode(&context, request, &reply), "StartNode");
	CheckReply(reply.success(), reply.message(), "StartNode " + std::to_string(index));
}

void GrpcNodeLifecycle::StopNode(int index) {
	harness_agent::NodeRequest request;
	request.set_node_index(index);
	harness_agent::AgentReply reply;
	grpc::ClientContext context;
	SetDeadline(context, rpc_timeout_);

	VLOG(2) << "StopNode " << index;
	CheckStatus(stub_->StopNode(&context, request, &reply), "StopNode");
	CheckReply(reply.success(), reply.message(), "StopNode " + std::to_string(index));
}

bool GrpcNodeLifecycle::IsNodeReady(int index) {
	harness_agent::NodeRequest request;
	request.set_node_index(index);
	harness_agent::NodeStatus reply;
	grpc::ClientContext context;
	SetDeadline(context, rpc_timeout_);

	grpc::Status status = stub_->GetNodeStatus(&context, request, &reply);
	if (CheckNotAnswered(status)) {
		VLOG(3) << "GetNodeStatus " << index << " not answered: " << status.error_message();
		return false;
	}
	CheckStatus(status, "GetNodeStatus");
	return reply.ready();
}

bool GrpcNodeLifecycle::IsClusterHealthy() {
	harness_agent::HealthRequest request;
	harness_agent::ClusterHealth reply;
	grpc::ClientContext context;
	SetDeadline(context, rpc_timeout_);

	grpc::Status status = stub_->GetClusterHealth(&context, request, &reply);
	if (CheckNotAnswered(status)) {
		VLOG(3) << "GetClusterHealth not answered: " << status.error_message();
		return false;
	}
	CheckStatus(status, "GetClusterHealth");
	return reply.healthy();
}

//
// GrpcDataClient
//

GrpcDataClient::GrpcDataClient(const std::shared_ptr<grpc::Channel>& channel,
		std::chrono::milliseconds rpc_timeout)
	: stub_(harness_agent::DataGateway::NewStub(channel)), rpc_timeout_(rpc_timeout) {}

void GrpcDataClient::CreateClass(const ClassSchema& schema) {
	harness_agent::ClassSchema request;
	ToProto(schema, &request);
	harness_agent::AgentReply reply;
	grpc::ClientContext context;
	SetDeadline(context, rpc_timeout_);

	CheckStatus(stub_->CreateClass(&context, request, &reply), "CreateClass");
	CheckReply(reply.success(), reply.message(), "CreateClass " + schema.name);
}

std::string GrpcDataClient::CreateObject(const std::string& class_name, const Properties& properties) {
	harness_agent::CreateObjectRequest request;
	request.set_class_name(class_name);
	ToProto(properties, request.mutable_properties());
	harness_agent::CreateObjectReply reply;
	grpc::ClientContext context;
	SetDeadline(context, rpc_timeout_);

	CheckStatus(stub_->CreateObject(&context, request, &reply), "CreateObject");
	CheckReply(reply.success(), reply.message(), "CreateObject " + class_name);
	return reply.id();
}

std::vector<DataObject> GrpcDataClient::Query(const std::string& class_name, const EqualityFilter& filter,
		const std::vector<std::string>& fields) {
	harness_agent::QueryRequest request;
	request.set_class_name(class_name);
	request.set_filter_path(filter.path);
	ToProto(filter.value, request.mutable_filter_value());
	for (const auto& field : fields) {
		request.add_fields(field);
	}
	harness_agent::QueryReply reply;
	grpc::ClientContext context;
	SetDeadline(context, rpc_timeout_);

	CheckStatus(stub_->Query(&context, request, &reply), "Query");
	CheckReply(reply.success(), reply.message(), "Query " + class_name);

	std::vector<DataObject> objects;
	objects.reserve(reply.objects_size());
	for (const auto& object : reply.objects()) {
		objects.push_back({object.id(), FromProto(object.properties())});
	}
	return objects;
}

int64_t GrpcDataClient::Aggregate(const std::string& class_name) {
	harness_agent::AggregateRequest request;
	request.set_class_name(class_name);
	harness_agent::AggregateReply reply;
	grpc::ClientContext context;
	SetDeadline(context, rpc_timeout_);

	CheckStatus(stub_->Aggregate(&context, request, &reply), "Aggregate");
	CheckReply(reply.success(), reply.message(), "Aggregate " + class_name);
	return reply.count();
}

} // End of namespace UpgradeJourney
