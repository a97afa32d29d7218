#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/common/errors.h"
#include "../../src/sim/simulated_cluster.h"
#include "../../src/verifier/consistency_verifier.h"
#include "../../src/workload/workload_driver.h"
#include "../fake_clock.h"
#include "../mock_capabilities.h"

using namespace UpgradeJourney;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Return;

namespace {

// Sleeps 100, 200 and 400ms: a record must become visible within 700ms.
RetryPolicy VisibilityPolicy() {
    RetryPolicy policy;
    policy.max_attempts = 4;
    policy.initial_interval = 100ms;
    policy.backoff_multiplier = 2.0;
    policy.max_interval = 400ms;
    return policy;
}

} // namespace

class ConsistencyVerifierTest : public ::testing::Test {
protected:
    ConsistencyVerifierTest()
        : sim_(1, SimulationOptions{}, clock_),
          driver_(sim_, "Collection"),
          verifier_(sim_, "Collection", VisibilityPolicy(), clock_) {}

    void SetUp() override {
        sim_.EnsureNetwork("net");
        sim_.StartNode(0, "1.0");
        driver_.CreateSchema();
    }

    FakeClock clock_;
    SimulatedCluster sim_;
    WorkloadDriver driver_;
    ConsistencyVerifier verifier_;
    RunState state_;
};

TEST_F(ConsistencyVerifierTest, FindsEveryRecordWrittenSoFar) {
    VersionSequence sequence({"1.0", "1.1", "1.2"});
    for (size_t step = 0; step < sequence.size(); ++step) {
        driver_.ImportForVersion(sequence[step], state_);
        EXPECT_EQ(verifier_.FindEachImportedObject(sequence, step), step + 1);
        verifier_.AggregateObjects(state_.objects_created);
    }
    EXPECT_TRUE(clock_.sleeps().empty());
}

TEST_F(ConsistencyVerifierTest, LagWithinTheBoundIsTolerated) {
    VersionSequence sequence({"1.0", "1.1"});
    driver_.ImportForVersion("1.0", state_);
    clock_.Advance(1000ms);

    sim_.SetVisibilityLag(500ms);
    driver_.ImportForVersion("1.1", state_);

    EXPECT_EQ(verifier_.FindEachImportedObject(sequence, 1), 2u);
    EXPECT_EQ(clock_.TotalSlept(), 700ms);
    verifier_.AggregateObjects(2);
}

TEST_F(ConsistencyVerifierTest, LagBeyondTheBoundIsDataLoss) {
    VersionSequence sequence({"1.0", "1.1"});
    driver_.ImportForVersion("1.0", state_);
    clock_.Advance(1000ms);

    sim_.SetVisibilityLag(800ms);
    driver_.ImportForVersion("1.1", state_);

    try {
        verifier_.FindEachImportedObject(sequence, 1);
        FAIL() << "expected DataLossError";
    } catch (const DataLossError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::kDataLoss);
        EXPECT_EQ(e.version(), "1.1");
        EXPECT_NE(std::string(e.what()).find("after 4 read(s) over 700ms"), std::string::npos) << e.what();
    }
    // Bounded: no sleep after the last read
    EXPECT_EQ(clock_.TotalSlept(), 700ms);
}

TEST_F(ConsistencyVerifierTest, DroppedRecordIsDataLossNamingItsVersion) {
    VersionSequence sequence({"1.0", "1.1"});
    driver_.ImportForVersion("1.0", state_);
    driver_.ImportForVersion("1.1", state_);
    sim_.DropObjectsWithVersion("1.0");

    try {
        verifier_.FindEachImportedObject(sequence, 1);
        FAIL() << "expected DataLossError";
    } catch (const DataLossError& e) {
        EXPECT_EQ(e.version(), "1.0");
    }
}

TEST_F(ConsistencyVerifierTest, RepeatedVersionsAreEachAccountedFor) {
    VersionSequence sequence({"1.0", "1.1", "1.1"});
    for (size_t step = 0; step < sequence.size(); ++step) {
        driver_.ImportForVersion(sequence[step], state_);
    }
    EXPECT_EQ(verifier_.FindEachImportedObject(sequence, 2), 3u);
}

TEST_F(ConsistencyVerifierTest, UnexpectedExtraRecordIsDataLoss) {
    VersionSequence sequence({"1.0", "1.1"});
    driver_.ImportForVersion("1.0", state_);
    Properties stray;
    stray["version"] = std::string("1.0");
    stray["object_count"] = int64_t{42};
    sim_.CreateObject("Collection", stray);

    EXPECT_THROW(verifier_.FindEachImportedObject(sequence, 0), DataLossError);
    EXPECT_TRUE(clock_.sleeps().empty());
}

TEST_F(ConsistencyVerifierTest, VerifyingPastTheSequenceIsRejected) {
    VersionSequence sequence({"1.0"});
    EXPECT_THROW(verifier_.FindEachImportedObject(sequence, 1), SequenceError);
}

TEST_F(ConsistencyVerifierTest, AggregateBelowExpectedIsAMismatch) {
    driver_.ImportForVersion("1.0", state_);
    try {
        verifier_.AggregateObjects(2);
        FAIL() << "expected AggregateMismatchError";
    } catch (const AggregateMismatchError& e) {
        EXPECT_EQ(e.expected(), 2);
        EXPECT_EQ(e.actual(), 1);
        EXPECT_STREQ(e.what(), "aggregation: wanted 2, got 1");
    }
}

TEST_F(ConsistencyVerifierTest, AggregateAboveExpectedFailsWithoutWaiting) {
    driver_.ImportForVersion("1.0", state_);
    driver_.ImportForVersion("1.1", state_);
    EXPECT_THROW(verifier_.AggregateObjects(1), AggregateMismatchError);
    EXPECT_TRUE(clock_.sleeps().empty());
}

TEST_F(ConsistencyVerifierTest, ServiceErrorsPropagate) {
    VersionSequence sequence({"1.0"});
    driver_.ImportForVersion("1.0", state_);
    sim_.StopNode(0);
    EXPECT_THROW(verifier_.FindEachImportedObject(sequence, 0), ServiceError);
    EXPECT_THROW(verifier_.AggregateObjects(1), ServiceError);
}

TEST(ConsistencyVerifierMockTest, WrongVersionFromServiceIsDataLoss) {
    FakeClock clock;
    MockDataClient client;
    ConsistencyVerifier verifier(client, "Collection", VisibilityPolicy(), clock);
    VersionSequence sequence({"1.0"});

    DataObject object;
    object.id = "id-0";
    object.properties["version"] = std::string("9.9");
    object.properties["object_count"] = int64_t{0};
    EXPECT_CALL(client, Query("Collection", _, _)).WillOnce(Return(std::vector<DataObject>{object}));

    try {
        verifier.FindEachImportedObject(sequence, 0);
        FAIL() << "expected DataLossError";
    } catch (const DataLossError& e) {
        EXPECT_EQ(e.version(), "1.0");
        EXPECT_NE(std::string(e.what()).find("wanted 1.0 got 9.9"), std::string::npos);
    }
}

TEST(ConsistencyVerifierMockTest, MissingCounterFieldIsDataLoss) {
    FakeClock clock;
    MockDataClient client;
    ConsistencyVerifier verifier(client, "Collection", VisibilityPolicy(), clock);
    VersionSequence sequence({"1.0"});

    DataObject object;
    object.id = "id-0";
    object.properties["version"] = std::string("1.0");
    EXPECT_CALL(client, Query(_, _, _)).WillOnce(Return(std::vector<DataObject>{object}));

    EXPECT_THROW(verifier.FindEachImportedObject(sequence, 0), DataLossError);
}
