#include "worker.h"

#include <algorithm>
#include <thread>
#include <utility>

#include <glog/logging.h>

namespace Occbench {

Worker::Worker(int worker_id, std::unique_ptr<ITransport> transport,
		std::unique_ptr<ConflictRetryStateMachine> machine, WorkerOptions options)
	: worker_id_(worker_id),
	  transport_(std::move(transport)),
	  machine_(std::move(machine)),
	  options_(options) {}

bool Worker::ShouldStop(const std::atomic<bool>& stop, uint64_t issued) const {
	if (stop.load(std::memory_order_relaxed)) return true;
	if (options_.max_requests > 0 && issued >= options_.max_requests) return true;
	if (options_.deadline.has_value() && std::chrono::steady_clock::now() >= *options_.deadline) {
		return true;
	}
	return false;
}

WorkerReport Worker::Run(const std::atomic<bool>& stop) {
	WorkerReport report;
	report.worker_id = worker_id_;
	report.partition = machine_->partition();

	using Clock = std::chrono::steady_clock;
	const bool paced = options_.target_rps > 0.0;
	const auto interval = paced
		? std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(1.0 / options_.target_rps))
		: Clock::duration::zero();
	Clock::time_point next_slot = Clock::now();

	VLOG(1) << "Worker " << worker_id_ << " starting, range [" << report.partition.start_index
		<< ", " << report.partition.end_index() << "]"
		<< (report.partition.suppressed ? " (suppressed)" : "");

	uint64_t completed = 0;
	while (!ShouldStop(stop, machine_->classifier().issued())) {
		HttpRequest request = machine_->NextRequest();

		const bool executed = machine_->classifier().pending() == RequestCategory::kExecuted;
		if (paced && (executed || options_.count_fallback_toward_rate)) {
			Clock::time_point now = Clock::now();
			if (next_slot > now) {
				std::this_thread::sleep_until(next_slot);
			}
			next_slot = std::max(next_slot, now) + interval;
		}

		const auto start = Clock::now();
		HttpResponse response = transport_->Execute(request);
		const auto latency = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start);

		RequestCategory category = machine_->OnResponse(response);
		++completed;

		if (response.error != TransportError::kNone) {
			report.transport_errors[static_cast<size_t>(response.error)]++;
		}
		if (category == RequestCategory::kExecuted) {
			report.status_counts[response.status]++;
			report.latency.Record(latency);
		}
	}

	report.counters = machine_->classifier().counters();
	report.issued = machine_->classifier().issued();
	report.completed = completed;
	report.retry = machine_->retry_stats();
	VLOG(1) << "Worker " << worker_id_ << " finished after " << completed << " requests";
	return report;
}

} // namespace Occbench
