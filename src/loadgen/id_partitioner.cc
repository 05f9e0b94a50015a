#include "id_partitioner.h"

#include <glog/logging.h>

namespace Occbench {

namespace {
constexpr int64_t kDefaultPoolSize = 10;
constexpr int64_t kDefaultWorkerCount = 1;
} // namespace

int64_t ActiveWorkerCount(int64_t pool_size, int64_t worker_count) {
	if (pool_size < 1) pool_size = kDefaultPoolSize;
	if (worker_count < 1) worker_count = kDefaultWorkerCount;
	return worker_count < pool_size ? worker_count : pool_size;
}

WorkerPartition ComputePartition(int64_t pool_size, int64_t worker_count, int64_t worker_index) {
	if (pool_size < 1) {
		LOG(WARNING) << "Invalid pool size " << pool_size << ", defaulting to " << kDefaultPoolSize;
		pool_size = kDefaultPoolSize;
	}
	if (worker_count < 1) {
		LOG(WARNING) << "Invalid worker count " << worker_count << ", defaulting to " << kDefaultWorkerCount;
		worker_count = kDefaultWorkerCount;
	}

	if (pool_size < worker_count) {
		LOG_FIRST_N(WARNING, 1) << "ID_POOL_SIZE (" << pool_size << ") < worker count ("
			<< worker_count << "), using " << pool_size << " active workers";
		worker_count = pool_size;
	}

	WorkerPartition partition;
	if (worker_index < 0 || worker_index >= worker_count) {
		LOG(WARNING) << "Worker " << worker_index << " suppressed (ID_POOL_SIZE=" << pool_size << ")";
		partition.suppressed = true;
		return partition;
	}

	partition.range_size = pool_size / worker_count;
	partition.start_index = worker_index * partition.range_size;
	return partition;
}

} // namespace Occbench
