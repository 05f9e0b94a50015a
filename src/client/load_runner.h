#pragma once

#include <atomic>
#include <vector>

#include "../loadgen/resource_store.h"
#include "interfaces.h"
#include "run_settings.h"
#include "worker.h"

namespace Occbench {

/**
 * Starts settings.threads workers, each with its own transport and state
 * machine over a partition of |store|, and waits for all of them.
 * The partitioned pool is min(id_pool_size, store.Size()). Setting |stop|
 * ends every worker after its in-flight request.
 * @return One report per worker, ordered by worker id
 */
std::vector<WorkerReport> RunLoad(const RunSettings& settings, VersionedResourceStore& store,
		const TransportFactory& make_transport, const std::atomic<bool>& stop);

} // namespace Occbench
