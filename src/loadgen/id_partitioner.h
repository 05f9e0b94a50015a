#pragma once

#include <cstddef>
#include <cstdint>

namespace Occbench {

/**
 * Contiguous slice of the resource pool targeted by one worker.
 * start_index is 0-based; the store index of the k-th id in range is
 * start_index + k + 1.
 */
struct WorkerPartition {
	int64_t start_index = 0;
	int64_t range_size = 0;
	bool suppressed = false;

	int64_t end_index() const { return start_index + range_size - 1; }
};

/**
 * Splits a pool of |pool_size| ids across |worker_count| workers.
 *
 * When the pool is smaller than the worker count, the worker count is clamped
 * to the pool size (with a warning) and workers at index >= pool_size are
 * suppressed. Trailing ids beyond range_size * worker_count are never
 * targeted. Non-positive sizes are replaced by the configuration defaults
 * (10 ids, 1 worker).
 */
WorkerPartition ComputePartition(int64_t pool_size, int64_t worker_count, int64_t worker_index);

/**
 * Number of workers that will receive a non-empty range.
 */
int64_t ActiveWorkerCount(int64_t pool_size, int64_t worker_count);

} // namespace Occbench
