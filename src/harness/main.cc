#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>
#include <grpcpp/grpcpp.h>

// Project includes
#include "../agent/agent_client.h"
#include "../cluster/cluster_controller.h"
#include "../cluster/version_sequence.h"
#include "../common/configuration.h"
#include "../coordinator/run_coordinator.h"
#include "../verifier/consistency_verifier.h"
#include "../workload/workload_driver.h"

namespace {

constexpr int kExitPassed = 0;
constexpr int kExitFailed = 1;
constexpr int kExitConfig = 2;

int RunJourney(const cxxopts::ParseResult& result) {
	UpgradeJourney::Configuration& configuration = UpgradeJourney::Configuration::getInstance();
	if (result.count("config") && !configuration.loadFromFile(result["config"].as<std::string>())) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Configuration: " << error;
		}
		return kExitConfig;
	}

	// Command line wins over file and environment
	auto& config = configuration.config();
	if (result.count("versions")) {
		config.versions = UpgradeJourney::ParseVersionList(result["versions"].as<std::string>());
		if (std::getenv("UPGRADE_JOURNEY_VERSIONS")) {
			LOG(WARNING) << "--versions given, ignoring UPGRADE_JOURNEY_VERSIONS";
			unsetenv("UPGRADE_JOURNEY_VERSIONS");
		}
	}
	if (result.count("cluster_size")) {
		config.cluster.size = UpgradeJourney::ConfigValue<int>(result["cluster_size"].as<int>());
	}
	if (result.count("agent")) {
		config.service.agent_address = UpgradeJourney::ConfigValue<std::string>(result["agent"].as<std::string>());
	}

	if (!configuration.validate()) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Configuration: " << error;
		}
		return kExitConfig;
	}

	std::unique_ptr<UpgradeJourney::VersionSequence> sequence;
	try {
		sequence = std::make_unique<UpgradeJourney::VersionSequence>(configuration.getVersions());
	} catch (const UpgradeJourney::SequenceError& e) {
		LOG(ERROR) << "Invalid version sequence: " << e.what();
		return kExitConfig;
	}

	auto rpc_timeout = std::chrono::milliseconds(config.service.rpc_timeout_ms.get());
	auto channel = grpc::CreateChannel(configuration.getAgentAddress(), grpc::InsecureChannelCredentials());
	UpgradeJourney::GrpcNodeLifecycle lifecycle(channel, rpc_timeout);
	UpgradeJourney::GrpcDataClient client(channel, rpc_timeout);

	LOG(INFO) << "Agent " << configuration.getAgentAddress() << ", " << configuration.getClusterSize()
		<< " node(s), class " << configuration.getClassName();

	UpgradeJourney::ClusterController cluster(lifecycle, configuration.getClusterSize(),
			configuration.getNetworkName(), configuration.getReadinessPolicy());
	UpgradeJourney::WorkloadDriver workload(client, configuration.getClassName());
	UpgradeJourney::ConsistencyVerifier verifier(client, configuration.getClassName(),
			configuration.getVisibilityPolicy());
	UpgradeJourney::RunCoordinator coordinator(*sequence, cluster, workload, verifier);

	UpgradeJourney::RunOutcome outcome = coordinator.Run();
	std::cout << outcome.Describe() << std::endl;
	return outcome.ok() ? kExitPassed : kExitFailed;
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();
	FLAGS_logtostderr = 1; // log only to console, no files.

	cxxopts::Options options("upgrade_journey", "Rolling-upgrade verification of a versioned cluster");
	options.add_options()
		("c,config", "YAML configuration file", cxxopts::value<std::string>())
		("versions", "Comma separated upgrade path, bootstrap version first", cxxopts::value<std::string>())
		("n,cluster_size", "Number of nodes in the cluster", cxxopts::value<int>())
		("a,agent", "Address of the cluster agent (host:port)", cxxopts::value<std::string>())
		("l,log_level", "Verbose log level", cxxopts::value<int>()->default_value("0"))
		("h,help", "Print usage");

	try {
		auto result = options.parse(argc, argv);
		if (result.count("help")) {
			std::cout << options.help() << std::endl;
			return kExitPassed;
		}
		FLAGS_v = result["log_level"].as<int>();
		return RunJourney(result);
	} catch (const cxxopts::exceptions::exception& e) {
		std::cerr << e.what() << std::endl << options.help() << std::endl;
		return kExitConfig;
	}
}
