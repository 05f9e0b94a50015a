#include "run_settings.h"

#include <chrono>
#include <stdexcept>

#include <glog/logging.h>

#include "../common/env_flags.h"
#include "http_transport.h"

namespace Occbench {

namespace {

constexpr int64_t kDefaultThreads = 1;
constexpr int64_t kDefaultPoolSize = 10;
constexpr int64_t kDefaultBackoffMax = 16;

// Applies the ">= min else default" rule to an already parsed value.
EnvInt ClampAtLeast(int64_t value, int64_t min_value, int64_t default_value, const char* name) {
	if (value < min_value) {
		LOG(WARNING) << "Invalid " << name << " (" << value << "), defaulting to " << default_value;
		return {default_value, true};
	}
	return {value, false};
}

} // namespace

RunSettings ResolveRunSettings(const OccbenchConfig& config) {
	std::vector<std::string> errors = ValidateConfig(config);
	if (!errors.empty()) {
		std::string joined;
		for (const auto& error : errors) {
			LOG(ERROR) << "Configuration error: " << error;
			if (!joined.empty()) joined += "; ";
			joined += error;
		}
		throw std::invalid_argument(joined);
	}

	RunSettings settings;
	StateMachineOptions& machine = settings.machine;

	machine.variant = config.load.variant.get() == "status"
		? UpdateVariant::kStatusTransition
		: UpdateVariant::kField;
	machine.backoff_policy = config.load.backoff_policy.get() == "fixed"
		? BackoffPolicy::kFixed
		: BackoffPolicy::kFullJitter;

	const int retry_count = config.load.retry_count.get();
	if (retry_count == -1) {
		machine.retry_count = DefaultRetryCount(machine.variant);
	} else {
		machine.retry_count = static_cast<int>(
			ClampAtLeast(retry_count, 0, DefaultRetryCount(machine.variant), "RETRY_COUNT").value);
	}
	machine.backoff_max =
		ClampAtLeast(config.load.retry_backoff_max.get(), 1, kDefaultBackoffMax, "RETRY_BACKOFF_MAX").value;
	machine.update_types = ParseUpdateTypeList(config.load.update_types.get());
	machine.resource_path = config.target.resource_path.get();
	machine.fallback_path = config.target.fallback_path.get();
	while (machine.resource_path.size() > 1 && machine.resource_path.back() == '/') {
		machine.resource_path.pop_back();
	}

	EnvInt threads = ClampAtLeast(config.load.threads.get(), 1, kDefaultThreads, "WRK_THREADS");
	EnvInt pool = ClampAtLeast(config.load.id_pool_size.get(), 1, kDefaultPoolSize, "ID_POOL_SIZE");
	settings.threads = threads.value;
	settings.threads_defaulted = threads.defaulted;
	settings.id_pool_size = pool.value;
	settings.id_pool_size_defaulted = pool.defaulted;

	settings.duration_seconds = config.load.duration_seconds.get();
	settings.max_requests_per_worker = config.load.max_requests_per_worker.get();
	settings.target_rps = config.load.target_rps.get();
	settings.count_fallback_toward_rate = config.load.count_fallback_toward_rate.get();
	settings.seed = config.load.seed.get();
	if (settings.seed == 0) {
		settings.seed = static_cast<uint64_t>(
			std::chrono::system_clock::now().time_since_epoch().count());
		LOG(INFO) << "No SEED given, using " << settings.seed;
	}

	// Throws for a URL that passed the prefix check but is still unusable.
	settings.url = NormalizeBaseUrl(config.target.url.get());
	settings.ids_file = config.target.ids_file.get();
	settings.connect_timeout_ms = config.network.connect_timeout_ms.get();
	settings.request_timeout_ms = config.network.request_timeout_ms.get();

	settings.record_results = config.output.record_results.get();
	settings.data_dir = config.output.data_dir.get();
	if (!settings.data_dir.empty() && settings.data_dir.back() != '/') {
		settings.data_dir += '/';
	}
	return settings;
}

} // namespace Occbench
