#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "../common/configuration.h"
#include "http_transport.h"
#include "load_runner.h"
#include "resource_ids.h"
#include "result_aggregator.h"
#include "result_writer.h"
#include "run_settings.h"

namespace {

std::atomic<bool> g_stop{false};

void HandleSignal(int) {
	g_stop.store(true);
}

} // namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();
	FLAGS_logtostderr = 1; // log only to console, no files.

	// Setup command line options
	cxxopts::Options options("occbench", "Optimistic-concurrency conflict load generator");

	options.add_options()
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
		("config", "YAML configuration file", cxxopts::value<std::string>())
		("t,threads", "Number of workers (overrides WRK_THREADS)", cxxopts::value<int>())
		("p,pool", "Id pool size (overrides ID_POOL_SIZE)", cxxopts::value<int>())
		("r,retry_count", "Retries per conflict (overrides RETRY_COUNT)", cxxopts::value<int>())
		("backoff_max", "Backoff window cap in cycles (overrides RETRY_BACKOFF_MAX)", cxxopts::value<int>())
		("backoff_policy", "full_jitter or fixed", cxxopts::value<std::string>())
		("v,variant", "Update variant: field or status", cxxopts::value<std::string>())
		("u,url", "Target base URL", cxxopts::value<std::string>())
		("d,duration", "Run duration in seconds", cxxopts::value<int>())
		("n,max_requests", "Requests per worker, 0 for unbounded", cxxopts::value<size_t>())
		("rps", "Aggregate target requests per second, 0 for unpaced", cxxopts::value<int>())
		("ids_file", "File with one resource id per line", cxxopts::value<std::string>())
		("seed", "RNG seed, 0 for time-seeded", cxxopts::value<size_t>())
		("seed_resources", "Create this many resources before the run instead of reading ids",
			cxxopts::value<int>()->default_value("0"))
		("record_results", "Record results in a csv file")
		("h,help", "Print usage");

	cxxopts::ParseResult result;
	try {
		result = options.parse(argc, argv);
	} catch (const std::exception& e) {
		LOG(ERROR) << "Invalid command line: " << e.what();
		std::cerr << options.help() << std::endl;
		return 1;
	}
	if (result.count("help")) {
		std::cout << options.help() << std::endl;
		return 0;
	}
	FLAGS_v = result["log_level"].as<int>();

	Occbench::Configuration& configuration = Occbench::Configuration::getInstance();
	if (result.count("config")) {
		const std::string path = result["config"].as<std::string>();
		if (!configuration.loadFromFile(path)) {
			for (const auto& error : configuration.getValidationErrors()) {
				LOG(ERROR) << "Configuration error: " << error;
			}
			LOG(ERROR) << "Could not load configuration from " << path;
			return 1;
		}
	}

	Occbench::OccbenchConfig& config = configuration.config();
	if (result.count("threads")) config.load.threads.set(result["threads"].as<int>());
	if (result.count("pool")) config.load.id_pool_size.set(result["pool"].as<int>());
	if (result.count("retry_count")) config.load.retry_count.set(result["retry_count"].as<int>());
	if (result.count("backoff_max")) config.load.retry_backoff_max.set(result["backoff_max"].as<int>());
	if (result.count("backoff_policy")) config.load.backoff_policy.set(result["backoff_policy"].as<std::string>());
	if (result.count("variant")) config.load.variant.set(result["variant"].as<std::string>());
	if (result.count("duration")) config.load.duration_seconds.set(result["duration"].as<int>());
	if (result.count("max_requests")) config.load.max_requests_per_worker.set(result["max_requests"].as<size_t>());
	if (result.count("rps")) config.load.target_rps.set(result["rps"].as<int>());
	if (result.count("seed")) config.load.seed.set(result["seed"].as<size_t>());
	if (result.count("url")) config.target.url.set(result["url"].as<std::string>());
	if (result.count("ids_file")) config.target.ids_file.set(result["ids_file"].as<std::string>());
	if (result.count("record_results")) config.output.record_results.set(true);

	Occbench::RunSettings settings;
	try {
		settings = Occbench::ResolveRunSettings(config);
	} catch (const std::invalid_argument& e) {
		LOG(ERROR) << "Invalid configuration: " << e.what();
		return 1;
	}

	Occbench::CurlGlobal curl_global;
	Occbench::TransportFactory make_transport = [&settings](int) {
		return std::make_unique<Occbench::HttpTransport>(
			settings.url, settings.connect_timeout_ms, settings.request_timeout_ms);
	};

	std::vector<std::string> ids;
	const int seed_resources = result["seed_resources"].as<int>();
	if (seed_resources > 0) {
		auto transport = make_transport(-1);
		ids = Occbench::SeedResources(*transport, settings.machine.resource_path, seed_resources);
		if (ids.empty()) {
			LOG(ERROR) << "Could not create any resources at " << settings.url
				<< settings.machine.resource_path;
			return 1;
		}
	} else {
		ids = Occbench::ResolveResourceIds(settings.ids_file);
	}

	Occbench::VersionedResourceStore store(ids);
	store.ResetAll();

	LOG(INFO) << "Target " << settings.url << settings.machine.resource_path
		<< ", variant=" << Occbench::VariantName(settings.machine.variant)
		<< ", threads=" << settings.threads << ", id_pool_size=" << settings.id_pool_size
		<< ", RETRY_COUNT=" << settings.machine.retry_count
		<< ", BACKOFF_MAX=" << settings.machine.backoff_max;

	Occbench::ResultWriter writer(settings);

	std::signal(SIGINT, HandleSignal);
	std::signal(SIGTERM, HandleSignal);

	const auto start = std::chrono::steady_clock::now();
	std::vector<Occbench::WorkerReport> reports = Occbench::RunLoad(settings, store, make_transport, g_stop);
	const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

	Occbench::RunSummary summary = Occbench::AggregateReports(reports);
	std::cout << Occbench::FormatRunReport(summary, reports, settings, elapsed) << std::flush;
	writer.SetSummary(summary, elapsed);

	return summary.consistent ? 0 : 2;
}
