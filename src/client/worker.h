#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "../loadgen/conflict_retry_state_machine.h"
#include "interfaces.h"
#include "latency_stats.h"

namespace Occbench {

struct WorkerOptions {
	// Unset means no time bound.
	std::optional<std::chrono::steady_clock::time_point> deadline;
	// 0 means no request bound.
	size_t max_requests = 0;
	// Requests per second for this worker, 0 for unpaced.
	double target_rps = 0.0;
	// When false, backoff, suppressed and fallback requests do not wait for
	// a pacing slot.
	bool count_fallback_toward_rate = true;
};

/**
 * Everything one worker observed. Status and latency figures cover executed
 * requests only.
 */
struct WorkerReport {
	int worker_id = 0;
	WorkerPartition partition;
	RequestCounters counters;
	uint64_t issued = 0;
	uint64_t completed = 0;
	RetryStats retry;
	std::map<int, uint64_t> status_counts;
	// Indexed by TransportError.
	std::array<uint64_t, 5> transport_errors{};
	LatencyStats latency;
};

/**
 * Runs one state machine against one transport, one request in flight at a
 * time, until the deadline, the request bound, or |stop| is reached.
 */
class Worker {
	public:
		Worker(int worker_id, std::unique_ptr<ITransport> transport,
				std::unique_ptr<ConflictRetryStateMachine> machine, WorkerOptions options);

		WorkerReport Run(const std::atomic<bool>& stop);

		const ConflictRetryStateMachine& machine() const { return *machine_; }

	private:
		bool ShouldStop(const std::atomic<bool>& stop, uint64_t issued) const;

		const int worker_id_;
		std::unique_ptr<ITransport> transport_;
		std::unique_ptr<ConflictRetryStateMachine> machine_;
		WorkerOptions options_;
};

} // namespace Occbench
