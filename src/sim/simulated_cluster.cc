#include "simulated_cluster.h"

#include <algorithm>

#include <glog/logging.h>
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"

#include "../common/config.h"
#include "../common/errors.h"

namespace UpgradeJourney {

namespace {

bool TypeMatches(PropertyType type, const PropertyValue& value) {
	switch (type) {
		case PropertyType::kText: return std::holds_alternative<std::string>(value);
		case PropertyType::kInt:  return std::holds_alternative<int64_t>(value);
	}
	return false;
}

} // namespace

SimulatedCluster::SimulatedCluster(int size, SimulationOptions options, Clock& clock)
	: clock_(clock), options_(options), nodes_(std::max(size, 0)) {}

SimulatedCluster::Node& SimulatedCluster::NodeAt(int index) {
	if (index < 0 || index >= static_cast<int>(nodes_.size())) {
		throw ServiceError(absl::StrCat("no such node ", index, " (cluster of ", nodes_.size(), ")"));
	}
	return nodes_[index];
}

bool SimulatedCluster::NodeReadyLocked(const Node& node) const {
	if (!node.running || node.failing_versions.contains(node.version)) {
		return false;
	}
	return clock_.Now() >= node.started_at + options_.startup_delay;
}

void SimulatedCluster::RequireAvailableLocked(const std::string& operation) const {
	for (const auto& node : nodes_) {
		if (NodeReadyLocked(node)) {
			return;
		}
	}
	throw ServiceError(operation + ": no node is available to serve the request");
}

bool SimulatedCluster::VisibleLocked(const StoredObject& stored) const {
	return clock_.Now() >= stored.visible_at;
}

//
// NodeLifecycle
//

void SimulatedCluster::EnsureNetwork(const std::string& network) {
	absl::MutexLock lock(&mutex_);
	if (networks_.insert(network).second) {
		events_.push_back(absl::StrCat("network ", network));
		VLOG(2) << "[SimulatedCluster] created network " << network;
	}
}

void SimulatedCluster::StartNode(int index, const std::string& version) {
	absl::MutexLock lock(&mutex_);
	Node& node = NodeAt(index);
	if (networks_.empty()) {
		throw ServiceError(absl::StrCat("cannot start node ", index, ": no network"));
	}
	if (node.running) {
		throw ServiceError(absl::StrCat("node ", index, " is already running ", node.version));
	}
	node.running = true;
	node.version = version;
	node.started_at = clock_.Now();
	events_.push_back(absl::StrCat("start ", index, " ", version));
	VLOG(2) << "[SimulatedCluster] started node " << index << " at " << version;
}

void SimulatedCluster::StopNode(int index) {
	absl::MutexLock lock(&mutex_);
	Node& node = NodeAt(index);
	if (!node.running) {
		throw ServiceError(absl::StrCat("node ", index, " is not running"));
	}
	node.running = false;
	events_.push_back(absl::StrCat("stop ", index));
	VLOG(2) << "[SimulatedCluster] stopped node " << index;
}

bool SimulatedCluster::IsNodeReady(int index) {
	absl::MutexLock lock(&mutex_);
	return NodeReadyLocked(NodeAt(index));
}

bool SimulatedCluster::IsClusterHealthy() {
	absl::MutexLock lock(&mutex_);
	if (nodes_.empty()) {
		return false;
	}
	for (const auto& node : nodes_) {
		if (!NodeReadyLocked(node)) {
			return false;
		}
	}
	return true;
}

//
// DataClient
//

void SimulatedCluster::CreateClass(const ClassSchema& schema) {
	absl::MutexLock lock(&mutex_);
	RequireAvailableLocked("create class");
	if (reject_class_creation_) {
		throw ServiceError("class creation rejected for " + schema.name);
	}
	if (classes_.contains(schema.name)) {
		throw ServiceError("class name " + schema.name + " already exists");
	}
	classes_[schema.name] = schema;
	events_.push_back("class " + schema.name);
}

std::string SimulatedCluster::CreateObject(const std::string& class_name, const Properties& properties) {
	absl::MutexLock lock(&mutex_);
	RequireAvailableLocked("create object");
	if (reject_writes_) {
		throw ServiceError("write rejected for class " + class_name);
	}
	auto class_it = classes_.find(class_name);
	if (class_it == classes_.end()) {
		throw ServiceError("class " + class_name + " does not exist");
	}
	for (const auto& [name, value] : properties) {
		const auto& defs = class_it->second.properties;
		auto def = std::find_if(defs.begin(), defs.end(), [&name = name](const PropertyDef& d) {
				return d.name == name;
				});
		if (def == defs.end()) {
			throw ServiceError("class " + class_name + " has no property " + name);
		}
		if (!TypeMatches(def->type, value)) {
			throw ServiceError("property " + name + " of class " + class_name + " has the wrong type");
		}
	}

	StoredObject stored;
	stored.class_name = class_name;
	stored.object.id = absl::StrFormat("00000000-0000-0000-0000-%012d", next_object_id_++);
	stored.object.properties = properties;
	std::chrono::milliseconds lag = options_.visibility_lag;
	auto version_it = properties.find(kVersionProperty);
	if (version_it != properties.end()) {
		if (const auto* version = std::get_if<std::string>(&version_it->second)) {
			auto lag_it = version_lags_.find(*version);
			if (lag_it != version_lags_.end()) {
				lag = lag_it->second;
			}
		}
	}
	stored.visible_at = clock_.Now() + lag;
	objects_.push_back(stored);
	return stored.object.id;
}

std::vector<DataObject> SimulatedCluster::Query(const std::string& class_name, const EqualityFilter& filter,
		const std::vector<std::string>& fields) {
	absl::MutexLock lock(&mutex_);
	RequireAvailableLocked("query");
	if (!classes_.contains(class_name)) {
		throw ServiceError("class " + class_name + " does not exist");
	}

	std::vector<DataObject> result;
	for (const auto& stored : objects_) {
		if (stored.class_name != class_name || !VisibleLocked(stored)) {
			continue;
		}
		auto it = stored.object.properties.find(filter.path);
		if (it == stored.object.properties.end() || it->second != filter.value) {
			continue;
		}
		DataObject projected;
		projected.id = stored.object.id;
		for (const auto& field : fields) {
			auto field_it = stored.object.properties.find(field);
			if (field_it != stored.object.properties.end()) {
				projected.properties[field] = field_it->second;
			}
		}
		result.push_back(std::move(projected));
	}
	return result;
}

int64_t SimulatedCluster::Aggregate(const std::string& class_name) {
	absl::MutexLock lock(&mutex_);
	RequireAvailableLocked("aggregate");
	if (!classes_.contains(class_name)) {
		throw ServiceError("class " + class_name + " does not exist");
	}
	return std::count_if(objects_.begin(), objects_.end(), [&](const StoredObject& stored) {
			return stored.class_name == class_name && VisibleLocked(stored);
			});
}

//
// Failure injection and inspection
//

void SimulatedCluster::FailNodeAtVersion(int index, const std::string& version) {
	absl::MutexLock lock(&mutex_);
	NodeAt(index).failing_versions.insert(version);
}

void SimulatedCluster::RejectClassCreation(bool reject) {
	absl::MutexLock lock(&mutex_);
	reject_class_creation_ = reject;
}

void SimulatedCluster::RejectWrites(bool reject) {
	absl::MutexLock lock(&mutex_);
	reject_writes_ = reject;
}

void SimulatedCluster::SetVisibilityLag(std::chrono::milliseconds lag) {
	absl::MutexLock lock(&mutex_);
	options_.visibility_lag = lag;
}

void SimulatedCluster::LagWritesOfVersion(const std::string& version, std::chrono::milliseconds lag) {
	absl::MutexLock lock(&mutex_);
	version_lags_[version] = lag;
}

void SimulatedCluster::DropObjectsWithVersion(const std::string& version) {
	absl::MutexLock lock(&mutex_);
	const PropertyValue target = version;
	objects_.erase(std::remove_if(objects_.begin(), objects_.end(), [&](const StoredObject& stored) {
				auto it = stored.object.properties.find(kVersionProperty);
				return it != stored.object.properties.end() && it->second == target;
				}), objects_.end());
}

std::string SimulatedCluster::NodeVersion(int index) const {
	absl::MutexLock lock(&mutex_);
	if (index < 0 || index >= static_cast<int>(nodes_.size())) {
		return "";
	}
	return nodes_[index].version;
}

bool SimulatedCluster::IsNodeRunning(int index) const {
	absl::MutexLock lock(&mutex_);
	if (index < 0 || index >= static_cast<int>(nodes_.size())) {
		return false;
	}
	return nodes_[index].running;
}

std::vector<std::string> SimulatedCluster::Events() const {
	absl::MutexLock lock(&mutex_);
	return events_;
}

int64_t SimulatedCluster::StoredObjects() const {
	absl::MutexLock lock(&mutex_);
	return static_cast<int64_t>(objects_.size());
}

} // End of namespace UpgradeJourney
