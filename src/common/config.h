#pragma once

#include <cstdint>

/// Readiness polling defaults
/// The interval between two readiness checks of a node or the cluster
const int64_t readiness_poll_interval_ms = 1000;
/// The number of checks before a node is considered unable to (re)join.
const int64_t readiness_max_attempts = 120;

/// Read-after-write visibility defaults
/// The delay before re-reading a record that was not yet visible
const int64_t visibility_initial_interval_ms = 100;
/// Upper bound for a single back-off sleep
const int64_t visibility_max_interval_ms = 2000;
/// Growth factor applied to the sleep after every miss
const double visibility_backoff_multiplier = 1.5;
/// The number of reads before a missing record is declared lost.
const int64_t visibility_max_attempts = 8;

/// Agent RPC defaults
const int64_t agent_rpc_timeout_ms = 10000;
const char kDefaultAgentAddress[] = "localhost:50061";

/// Cluster defaults
const int kDefaultClusterSize = 3;
const int kMaxClusterSize = 16;
const char kDefaultNetworkName[] = "upgrade-journey";

/// Schema of the version-tagged workload
const char kCollectionClassName[] = "Collection";
const char kVersionProperty[] = "version";
const char kObjectCountProperty[] = "object_count";
