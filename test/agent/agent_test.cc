#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <memory>
#include <thread>
#include "../../src/agent/agent_client.h"
#include "../../src/agent/agent_codec.h"
#include "../../src/agent/agent_service.h"
#include "../../src/common/errors.h"
#include "../../src/coordinator/run_coordinator.h"
#include "../../src/sim/simulated_cluster.h"
#include "../mock_capabilities.h"

using namespace UpgradeJourney;
using namespace std::chrono_literals;
using ::testing::Invoke;
using ::testing::Throw;

/**
 * Serves a simulated cluster through the agent services in-process and talks
 * to it with the same adapters the harness binary uses.
 */
class AgentTest : public ::testing::Test {
protected:
	AgentTest() : sim_(3, SimulationOptions{}) {}

	void SetUp() override {
		server_ = std::make_unique<AgentServer>("", sim_, sim_);
		auto channel = server_->InProcessChannel();
		lifecycle_ = std::make_unique<GrpcNodeLifecycle>(channel, 5000ms);
		client_ = std::make_unique<GrpcDataClient>(channel, 5000ms);
	}

	void TearDown() override {
		client_.reset();
		lifecycle_.reset();
		server_.reset();
	}

	void StartOneNode() {
		lifecycle_->EnsureNetwork("net");
		lifecycle_->StartNode(0, "1.0");
	}

	SimulatedCluster sim_;
	std::unique_ptr<AgentServer> server_;
	std::unique_ptr<GrpcNodeLifecycle> lifecycle_;
	std::unique_ptr<GrpcDataClient> client_;
};

TEST_F(AgentTest, LifecycleCallsReachTheCluster) {
	StartOneNode();
	EXPECT_TRUE(sim_.IsNodeRunning(0));
	EXPECT_EQ(sim_.NodeVersion(0), "1.0");
	EXPECT_TRUE(lifecycle_->IsNodeReady(0));
	EXPECT_FALSE(lifecycle_->IsNodeReady(1));
	EXPECT_FALSE(lifecycle_->IsClusterHealthy());

	lifecycle_->StopNode(0);
	EXPECT_FALSE(sim_.IsNodeRunning(0));
}

TEST_F(AgentTest, NegativeReplyBecomesServiceError) {
	StartOneNode();
	try {
		lifecycle_->StartNode(0, "1.1");
		FAIL() << "expected ServiceError";
	} catch (const ServiceError& e) {
		EXPECT_NE(std::string(e.what()).find("already running"), std::string::npos);
	}
}

TEST_F(AgentTest, UnknownNodeStatusIsServiceError) {
	EXPECT_THROW(lifecycle_->IsNodeReady(7), ServiceError);
}

TEST_F(AgentTest, DataCallsRoundTripTypedProperties) {
	StartOneNode();
	client_->CreateClass(CollectionSchema("Collection"));

	Properties properties;
	properties["version"] = std::string("1.0");
	properties["object_count"] = int64_t{0};
	std::string id = client_->CreateObject("Collection", properties);
	EXPECT_FALSE(id.empty());

	auto objects = client_->Query("Collection", EqualityFilter{"version", std::string("1.0")}, {"object_count"});
	ASSERT_EQ(objects.size(), 1u);
	EXPECT_EQ(objects[0].id, id);
	EXPECT_EQ(objects[0].properties.size(), 1u);
	EXPECT_EQ(std::get<int64_t>(objects[0].properties.at("object_count")), 0);

	EXPECT_EQ(client_->Aggregate("Collection"), 1);
}

TEST_F(AgentTest, DuplicateClassIsRejected) {
	StartOneNode();
	client_->CreateClass(CollectionSchema("Collection"));
	EXPECT_THROW(client_->CreateClass(CollectionSchema("Collection")), ServiceError);
}

TEST_F(AgentTest, JourneyRunsOverRpc) {
	VersionSequence sequence({"1.16.0", "1.16.1", "1.17.0"});
	ClusterController controller(*lifecycle_, 3, "journey-net", RetryPolicy::Fixed(20, 10ms));
	WorkloadDriver driver(*client_, "Collection");
	ConsistencyVerifier verifier(*client_, "Collection", RetryPolicy::Fixed(5, 10ms));
	RunCoordinator coordinator(sequence, controller, driver, verifier);

	RunOutcome outcome = coordinator.Run();

	EXPECT_TRUE(outcome.ok()) << outcome.Describe();
	EXPECT_EQ(outcome.objects_created, 3);
	for (int i = 0; i < 3; ++i) {
		EXPECT_EQ(sim_.NodeVersion(i), "1.17.0");
	}
}

TEST_F(AgentTest, RollingUpdateFailureSurfacesThroughRpc) {
	sim_.FailNodeAtVersion(1, "1.1");
	VersionSequence sequence({"1.0", "1.1"});
	ClusterController controller(*lifecycle_, 3, "journey-net", RetryPolicy::Fixed(3, 1ms));
	WorkloadDriver driver(*client_, "Collection");
	ConsistencyVerifier verifier(*client_, "Collection", RetryPolicy::Fixed(3, 1ms));
	RunCoordinator coordinator(sequence, controller, driver, verifier);

	RunOutcome outcome = coordinator.Run();

	EXPECT_EQ(outcome.error_kind, ErrorKind::kRollingUpdate);
	EXPECT_EQ(sim_.NodeVersion(2), "1.0");
}

TEST(AgentHealthTest, HealthCheckErrorIsServiceError) {
	MockNodeLifecycle lifecycle;
	SimulatedCluster data(1, SimulationOptions{});
	EXPECT_CALL(lifecycle, IsClusterHealthy()).WillOnce(Throw(ServiceError("orchestrator unreachable")));

	AgentServer server("", lifecycle, data);
	GrpcNodeLifecycle client(server.InProcessChannel(), 5000ms);
	try {
		client.IsClusterHealthy();
		FAIL() << "expected ServiceError";
	} catch (const ServiceError& e) {
		EXPECT_NE(std::string(e.what()).find("orchestrator unreachable"), std::string::npos) << e.what();
	}
}

TEST(AgentHealthTest, SlowReadinessChecksReadAsNotReady) {
	// Declared before the server so it outlives the in-flight handlers
	MockNodeLifecycle lifecycle;
	SimulatedCluster data(1, SimulationOptions{});
	EXPECT_CALL(lifecycle, IsNodeReady(0)).WillOnce(Invoke([](int) {
		std::this_thread::sleep_for(300ms);
		return true;
	}));
	EXPECT_CALL(lifecycle, IsClusterHealthy()).WillOnce(Invoke([] {
		std::this_thread::sleep_for(300ms);
		return true;
	}));
	EXPECT_CALL(lifecycle, StopNode(0)).WillOnce(Invoke([](int) {
		std::this_thread::sleep_for(300ms);
	}));

	AgentServer server("", lifecycle, data);
	GrpcNodeLifecycle client(server.InProcessChannel(), 50ms);
	EXPECT_FALSE(client.IsNodeReady(0));
	EXPECT_FALSE(client.IsClusterHealthy());
	// Commands still report the missed deadline
	EXPECT_THROW(client.StopNode(0), TimeoutError);
}

TEST(AgentCodecTest, ValueWithoutKindIsRejected) {
	harness_agent::Value value;
	EXPECT_THROW(FromProto(value), ServiceError);
}

TEST(AgentCodecTest, SchemaKeepsPropertyTypes) {
	harness_agent::ClassSchema proto;
	ToProto(CollectionSchema("Journey"), &proto);
	ClassSchema schema = FromProto(proto);

	EXPECT_EQ(schema.name, "Journey");
	ASSERT_EQ(schema.properties.size(), 2u);
	EXPECT_EQ(schema.properties[0].type, PropertyType::kText);
	EXPECT_EQ(schema.properties[1].type, PropertyType::kInt);
}
