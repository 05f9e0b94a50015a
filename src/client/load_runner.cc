#include "load_runner.h"

#include <algorithm>
#include <chrono>
#include <future>
#include <thread>

#include <glog/logging.h>

namespace Occbench {

std::vector<WorkerReport> RunLoad(const RunSettings& settings, VersionedResourceStore& store,
		const TransportFactory& make_transport, const std::atomic<bool>& stop) {
	const int64_t pool_size = std::min<int64_t>(settings.id_pool_size, static_cast<int64_t>(store.Size()));
	const int num_workers = static_cast<int>(settings.threads);
	if (pool_size < settings.id_pool_size) {
		LOG(WARNING) << "ID_POOL_SIZE=" << settings.id_pool_size << " but only " << store.Size()
			<< " ids are loaded, partitioning " << pool_size;
	}

	WorkerOptions worker_options;
	if (settings.duration_seconds > 0) {
		worker_options.deadline = std::chrono::steady_clock::now() + std::chrono::seconds(settings.duration_seconds);
	}
	worker_options.max_requests = settings.max_requests_per_worker;
	worker_options.target_rps = settings.target_rps > 0
		? static_cast<double>(settings.target_rps) / num_workers
		: 0.0;
	worker_options.count_fallback_toward_rate = settings.count_fallback_toward_rate;

	std::vector<std::unique_ptr<Worker>> workers;
	for (int i = 0; i < num_workers; ++i) {
		WorkerPartition partition = ComputePartition(pool_size, num_workers, i);
		auto machine = std::make_unique<ConflictRetryStateMachine>(
			i, partition, store, settings.machine, settings.seed + static_cast<uint64_t>(i));
		workers.push_back(std::make_unique<Worker>(i, make_transport(i), std::move(machine), worker_options));
	}

	LOG(INFO) << "Running " << num_workers << " workers (" << ActiveWorkerCount(pool_size, num_workers)
		<< " active) over " << pool_size << " ids, variant=" << VariantName(settings.machine.variant);

	std::vector<std::thread> threads;
	std::vector<std::promise<WorkerReport>> promises(num_workers);
	std::vector<std::future<WorkerReport>> futures;
	for (int i = 0; i < num_workers; ++i) {
		futures.push_back(promises[i].get_future());
	}

	for (int i = 0; i < num_workers; ++i) {
		threads.emplace_back([&workers, &promises, &stop, i]() {
			promises[i].set_value(workers[i]->Run(stop));
		});
	}

	std::vector<WorkerReport> reports;
	for (int i = 0; i < num_workers; ++i) {
		if (threads[i].joinable()) {
			threads[i].join();
			reports.push_back(futures[i].get());
		}
	}
	return reports;
}

} // namespace Occbench
