#include <chrono>
#include <csignal>
#include <iostream>
#include <string>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>

// Project includes
#include "agent_service.h"
#include "../common/config.h"
#include "../common/errors.h"
#include "../common/shutdown_signals.h"
#include "../sim/simulated_cluster.h"

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();
	FLAGS_logtostderr = 1; // log only to console, no files.

	cxxopts::Options options("upgrade_agent_sim", "Cluster agent serving a simulated versioned cluster");
	options.add_options()
		("a,address", "Listen address (host:port)", cxxopts::value<std::string>()->default_value(kDefaultAgentAddress))
		("n,cluster_size", "Number of simulated nodes", cxxopts::value<int>()->default_value(std::to_string(kDefaultClusterSize)))
		("startup_delay_ms", "Time a started node needs to become ready", cxxopts::value<int>()->default_value("500"))
		("visibility_lag_ms", "Time a write needs to become readable", cxxopts::value<int>()->default_value("0"))
		("lag_version", "Version whose writes use --lag_version_ms instead", cxxopts::value<std::string>()->default_value(""))
		("lag_version_ms", "Visibility lag of writes tagged --lag_version", cxxopts::value<int>()->default_value("0"))
		("fail_node", "Index of a node that never becomes ready at --fail_version", cxxopts::value<int>()->default_value("-1"))
		("fail_version", "Version at which --fail_node never becomes ready", cxxopts::value<std::string>()->default_value(""))
		("l,log_level", "Verbose log level", cxxopts::value<int>()->default_value("0"))
		("h,help", "Print usage");

	try {
		auto result = options.parse(argc, argv);
		if (result.count("help")) {
			std::cout << options.help() << std::endl;
			return 0;
		}
		FLAGS_v = result["log_level"].as<int>();

		UpgradeJourney::SimulationOptions sim_options;
		sim_options.startup_delay = std::chrono::milliseconds(result["startup_delay_ms"].as<int>());
		sim_options.visibility_lag = std::chrono::milliseconds(result["visibility_lag_ms"].as<int>());
		UpgradeJourney::SimulatedCluster cluster(result["cluster_size"].as<int>(), sim_options);

		int fail_node = result["fail_node"].as<int>();
		if (fail_node >= 0) {
			cluster.FailNodeAtVersion(fail_node, result["fail_version"].as<std::string>());
			LOG(INFO) << "Node " << fail_node << " will not become ready at "
				<< result["fail_version"].as<std::string>();
		}

		const std::string lag_version = result["lag_version"].as<std::string>();
		if (!lag_version.empty()) {
			cluster.LagWritesOfVersion(lag_version, std::chrono::milliseconds(result["lag_version_ms"].as<int>()));
			LOG(INFO) << "Writes of " << lag_version << " become visible after "
				<< result["lag_version_ms"].as<int>() << "ms";
		}

		// Blocked before the server spawns its threads, so none of them runs a handler
		UpgradeJourney::ShutdownSignals signals({SIGINT, SIGTERM});
		UpgradeJourney::AgentServer server(result["address"].as<std::string>(), cluster, cluster);
		int sig = signals.Wait();
		LOG(INFO) << "Signal " << sig << " received, shutting down";
		server.Shutdown();
	} catch (const cxxopts::exceptions::exception& e) {
		std::cerr << e.what() << std::endl << options.help() << std::endl;
		return 2;
	} catch (const UpgradeJourney::HarnessError& e) {
		LOG(ERROR) << "Simulation setup failed: " << e.what();
		return 1;
	} catch (const std::runtime_error& e) {
		LOG(ERROR) << e.what();
		return 1;
	}
	return 0;
}
