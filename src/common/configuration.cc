#include "configuration.h"
#include <algorithm>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>
#include "absl/strings/ascii.h"
#include "absl/strings/str_split.h"

namespace UpgradeJourney {

namespace {

void ApplyYAML(const YAML::Node& yaml, HarnessConfig& config) {
    if (!yaml["upgrade_journey"]) {
        LOG(WARNING) << "Configuration has no 'upgrade_journey' root, keeping defaults";
        return;
    }
    auto root = yaml["upgrade_journey"];

    if (root["versions"]) {
        config.versions.clear();
        for (const auto& version : root["versions"]) {
            config.versions.push_back(version.as<std::string>());
        }
    }

    // Cluster
    if (root["cluster"]) {
        auto cluster = root["cluster"];
        if (cluster["size"]) config.cluster.size.set(cluster["size"].as<int>());
        if (cluster["network"]) config.cluster.network.set(cluster["network"].as<std::string>());
    }

    // Readiness
    if (root["readiness"]) {
        auto readiness = root["readiness"];
        if (readiness["poll_interval_ms"]) config.readiness.poll_interval_ms.set(readiness["poll_interval_ms"].as<int>());
        if (readiness["max_attempts"]) config.readiness.max_attempts.set(readiness["max_attempts"].as<int>());
    }

    // Visibility
    if (root["visibility"]) {
        auto visibility = root["visibility"];
        if (visibility["initial_interval_ms"]) config.visibility.initial_interval_ms.set(visibility["initial_interval_ms"].as<int>());
        if (visibility["max_interval_ms"]) config.visibility.max_interval_ms.set(visibility["max_interval_ms"].as<int>());
        if (visibility["backoff_multiplier"]) config.visibility.backoff_multiplier.set(visibility["backoff_multiplier"].as<double>());
        if (visibility["max_attempts"]) config.visibility.max_attempts.set(visibility["max_attempts"].as<int>());
    }

    // Service
    if (root["service"]) {
        auto service = root["service"];
        if (service["agent_address"]) config.service.agent_address.set(service["agent_address"].as<std::string>());
        if (service["rpc_timeout_ms"]) config.service.rpc_timeout_ms.set(service["rpc_timeout_ms"].as<int>());
        if (service["class_name"]) config.service.class_name.set(service["class_name"].as<std::string>());
    }
}

} // namespace

std::vector<std::string> DefaultVersions() {
    return {
        "1.16.0", "1.16.1", "1.16.2", "1.16.3", "1.16.4", "1.16.5", "1.16.6",
        "1.16.7", "1.16.8", "1.16.9", "1.17.0", "1.17.1", "1.17.2",
    };
}

std::vector<std::string> ParseVersionList(const std::string& list) {
    std::vector<std::string> versions;
    for (absl::string_view part : absl::StrSplit(list, ',')) {
        absl::string_view trimmed = absl::StripAsciiWhitespace(part);
        if (!trimmed.empty()) {
            versions.emplace_back(trimmed);
        }
    }
    return versions;
}

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stod(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        ApplyYAML(yaml, config_);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        ApplyYAML(yaml, config_);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::reset() {
    config_ = HarnessConfig();
    validation_errors_.clear();
}

std::vector<std::string> Configuration::getVersions() const {
    const char* env_val = std::getenv("UPGRADE_JOURNEY_VERSIONS");
    if (env_val) {
        return ParseVersionList(env_val);
    }
    return config_.versions;
}

RetryPolicy Configuration::getReadinessPolicy() const {
    return RetryPolicy::Fixed(config_.readiness.max_attempts.get(),
                              std::chrono::milliseconds(config_.readiness.poll_interval_ms.get()));
}

RetryPolicy Configuration::getVisibilityPolicy() const {
    RetryPolicy policy;
    policy.max_attempts = config_.visibility.max_attempts.get();
    policy.initial_interval = std::chrono::milliseconds(config_.visibility.initial_interval_ms.get());
    policy.backoff_multiplier = config_.visibility.backoff_multiplier.get();
    policy.max_interval = std::chrono::milliseconds(config_.visibility.max_interval_ms.get());
    return policy;
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (getVersions().empty()) {
        validation_errors_.push_back("Version list must not be empty");
    }

    int size = config_.cluster.size.get();
    if (size < 1 || size > kMaxClusterSize) {
        validation_errors_.push_back("Cluster size must be between 1 and " + std::to_string(kMaxClusterSize));
    }

    if (config_.cluster.network.get().empty()) {
        validation_errors_.push_back("Network name must not be empty");
    }

    // Polling bounds
    if (config_.readiness.poll_interval_ms.get() < 1) {
        validation_errors_.push_back("Readiness poll interval must be at least 1ms");
    }
    if (config_.readiness.max_attempts.get() < 1) {
        validation_errors_.push_back("Readiness max attempts must be at least 1");
    }
    if (config_.visibility.max_attempts.get() < 1) {
        validation_errors_.push_back("Visibility max attempts must be at least 1");
    }
    if (config_.visibility.initial_interval_ms.get() < 0) {
        validation_errors_.push_back("Visibility interval must not be negative");
    }
    if (config_.visibility.max_interval_ms.get() < config_.visibility.initial_interval_ms.get()) {
        validation_errors_.push_back("Visibility max interval cannot be below the initial interval");
    }
    if (config_.visibility.backoff_multiplier.get() < 1.0) {
        validation_errors_.push_back("Visibility backoff multiplier must be at least 1.0");
    }

    // Service
    if (config_.service.agent_address.get().empty()) {
        validation_errors_.push_back("Agent address must not be empty");
    }
    if (config_.service.rpc_timeout_ms.get() < 1) {
        validation_errors_.push_back("RPC timeout must be at least 1ms");
    }
    if (config_.service.class_name.get().empty()) {
        validation_errors_.push_back("Class name must not be empty");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace UpgradeJourney
