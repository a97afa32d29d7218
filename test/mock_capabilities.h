#pragma once

#include <gmock/gmock.h>

#include "../src/common/interfaces.h"

namespace UpgradeJourney {

class MockNodeLifecycle : public NodeLifecycle {
public:
    MOCK_METHOD(void, EnsureNetwork, (const std::string& network), (override));
    MOCK_METHOD(void, StartNode, (int index, const std::string& version), (override));
    MOCK_METHOD(void, StopNode, (int index), (override));
    MOCK_METHOD(bool, IsNodeReady, (int index), (override));
    MOCK_METHOD(bool, IsClusterHealthy, (), (override));
};

class MockDataClient : public DataClient {
public:
    MOCK_METHOD(void, CreateClass, (const ClassSchema& schema), (override));
    MOCK_METHOD(std::string, CreateObject, (const std::string& class_name, const Properties& properties), (override));
    MOCK_METHOD(std::vector<DataObject>, Query, (const std::string& class_name, const EqualityFilter& filter,
                const std::vector<std::string>& fields), (override));
    MOCK_METHOD(int64_t, Aggregate, (const std::string& class_name), (override));
};

} // namespace UpgradeJourney
