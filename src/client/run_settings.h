#pragma once

#include <cstdint>
#include <string>

#include "../common/configuration.h"
#include "../loadgen/conflict_retry_state_machine.h"

namespace Occbench {

/**
 * Validated, clamped settings for one run. Built once at startup; workers
 * only ever read it.
 */
struct RunSettings {
	StateMachineOptions machine;

	int64_t threads = 1;
	int64_t id_pool_size = 10;
	// True when the value came from the documented default, not the input.
	bool threads_defaulted = false;
	bool id_pool_size_defaulted = false;

	int duration_seconds = 30;
	size_t max_requests_per_worker = 0;
	int target_rps = 0;
	bool count_fallback_toward_rate = true;
	uint64_t seed = 0;

	// "http://host:port", see NormalizeBaseUrl.
	std::string url;
	std::string ids_file;
	int connect_timeout_ms = 5000;
	int request_timeout_ms = 30000;

	bool record_results = false;
	std::string data_dir;
};

/**
 * Resolves |config| into RunSettings.
 *
 * Bad numeric values (thread count, pool size, retry count, backoff max) are
 * replaced by their defaults with a warning. Structurally invalid settings
 * (unknown variant or backoff policy, unusable URL, unbounded run) throw
 * std::invalid_argument carrying every validation error.
 */
RunSettings ResolveRunSettings(const OccbenchConfig& config);

} // namespace Occbench
