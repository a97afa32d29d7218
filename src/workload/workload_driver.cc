#include "workload_driver.h"

#include <glog/logging.h>

#include "../common/config.h"
#include "../common/errors.h"

namespace UpgradeJourney {

ClassSchema CollectionSchema(const std::string& class_name) {
    ClassSchema schema;
    schema.name = class_name;
    schema.properties = {
        {kVersionProperty, PropertyType::kText},
        {kObjectCountProperty, PropertyType::kInt},
    };
    return schema;
}

WorkloadDriver::WorkloadDriver(DataClient& client, std::string class_name)
    : client_(client), class_name_(std::move(class_name)) {}

void WorkloadDriver::CreateSchema() {
    try {
        client_.CreateClass(CollectionSchema(class_name_));
    } catch (const ServiceError& e) {
        throw SchemaError("creating class " + class_name_ + " failed: " + e.what());
    }
    LOG(INFO) << "Created class " << class_name_;
}

std::string WorkloadDriver::ImportForVersion(const std::string& version, RunState& state) {
    Properties props;
    props[kVersionProperty] = version;
    props[kObjectCountProperty] = state.objects_created;

    std::string id;
    try {
        id = client_.CreateObject(class_name_, props);
    } catch (const ServiceError& e) {
        throw ImportError("writing " + class_name_ + " object for version " + version + " failed: " + e.what());
    }

    VLOG(1) << "Imported " << class_name_ << " object " << id << " version=" << version
            << " object_count=" << state.objects_created;
    state.objects_created++;
    return id;
}

} // namespace UpgradeJourney
