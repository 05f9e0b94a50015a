#include "result_aggregator.h"

#include <iomanip>
#include <sstream>
#include <utility>

#include <glog/logging.h>

namespace Occbench {

namespace {

bool IsErrorBucket(const std::string& bucket) {
	if (bucket == "other") return true;
	int code = std::stoi(bucket);
	return code >= 400 && code < 600;
}

double Percent(uint64_t part, uint64_t whole) {
	return whole == 0 ? 0.0 : (static_cast<double>(part) / static_cast<double>(whole)) * 100.0;
}

const char* TransportErrorName(size_t index) {
	switch (static_cast<TransportError>(index)) {
		case TransportError::kNone: return "none";
		case TransportError::kConnect: return "connect";
		case TransportError::kRead: return "read";
		case TransportError::kWrite: return "write";
		case TransportError::kTimeout: return "timeout";
	}
	return "unknown";
}

} // namespace

std::string StatusBucket(int status) {
	for (int reported : kReportedStatuses) {
		if (status == reported) return std::to_string(status);
	}
	return "other";
}

RunSummary AggregateReports(const std::vector<WorkerReport>& reports) {
	RunSummary summary;
	LatencyStats latency;

	for (const auto& report : reports) {
		if (report.counters.Total() != report.completed) {
			LOG(WARNING) << "Worker " << report.worker_id << " inconsistency: completed="
				<< report.completed << ", sum(categories)=" << report.counters.Total();
			summary.consistent = false;
		}
		summary.counters += report.counters;
		summary.issued += report.issued;
		summary.completed += report.completed;

		summary.retry.successful_retries += report.retry.successful_retries;
		summary.retry.exhausted_retries += report.retry.exhausted_retries;
		summary.retry.abandoned_retries += report.retry.abandoned_retries;
		summary.retry.conflicts += report.retry.conflicts;

		for (const auto& [status, count] : report.status_counts) {
			summary.status_buckets[StatusBucket(status)] += count;
		}
		for (size_t i = 0; i < summary.transport_errors.size(); ++i) {
			summary.transport_errors[i] += report.transport_errors[i];
		}
		latency.Merge(report.latency);
	}

	if (summary.counters.Total() != summary.completed) {
		LOG(WARNING) << "Inconsistency detected: total=" << summary.completed
			<< ", sum(categories)=" << summary.counters.Total();
		summary.consistent = false;
	}

	for (const auto& [bucket, count] : summary.status_buckets) {
		summary.executed_responses += count;
		if (IsErrorBucket(bucket)) summary.error_responses += count;
	}
	summary.error_rate_percent = Percent(summary.error_responses, summary.executed_responses);
	summary.latency = latency.Summarize();
	return summary;
}

std::string FormatRunReport(const RunSummary& summary, const std::vector<WorkerReport>& reports,
		const RunSettings& settings, double elapsed_seconds) {
	std::ostringstream out;
	const RequestCounters& c = summary.counters;

	out << "\n--- Request Categories ---\n"
		<< "  Executed:   " << c.executed << "\n"
		<< "  Backoff:    " << c.backoff << "\n"
		<< "  Suppressed: " << c.suppressed << "\n"
		<< "  Fallback:   " << c.fallback << "\n"
		<< "  Total:      " << c.Total() << "\n"
		<< "  Excluded:   " << c.Excluded() << " (backoff + suppressed + fallback)\n";

	out << std::fixed << std::setprecision(2);
	if (elapsed_seconds > 0.0) {
		out << "\nRequests/sec: " << static_cast<double>(summary.completed) / elapsed_seconds
			<< " (" << summary.completed << " requests in " << elapsed_seconds << "s)\n";
	}

	out << "\n--- " << VariantName(settings.machine.variant) << " HTTP Status Distribution (all workers) ---\n";
	if (summary.executed_responses == 0) {
		out << "  No requests completed\n";
	} else {
		auto print_bucket = [&](const std::string& label) {
			auto it = summary.status_buckets.find(label);
			if (it == summary.status_buckets.end() || it->second == 0) return;
			out << "  " << label << ": " << it->second << " ("
				<< std::setprecision(1) << Percent(it->second, summary.executed_responses) << "%)\n"
				<< std::setprecision(2);
		};
		for (int status : kReportedStatuses) print_bucket(std::to_string(status));
		print_bucket("other");

		out << "\nActual Error Rate: " << summary.error_rate_percent << "% (" << summary.error_responses
			<< " errors / " << summary.executed_responses << " requests)\n";
	}
	out << "Note: " << c.backoff << " backoff + " << c.suppressed << " suppressed + " << c.fallback
		<< " fallback requests are excluded from metrics\n";

	bool any_transport_error = false;
	for (size_t i = 1; i < summary.transport_errors.size(); ++i) {
		if (summary.transport_errors[i] == 0) continue;
		if (!any_transport_error) out << "\nTransport errors:\n";
		any_transport_error = true;
		out << "  " << TransportErrorName(i) << ": " << summary.transport_errors[i] << "\n";
	}

	const LatencyStats::Summary& l = summary.latency;
	if (l.count > 0) {
		out << "\nLatency (us, executed only): avg=" << l.average_us << " p50=" << l.p50_us
			<< " p90=" << l.p90_us << " p95=" << l.p95_us << " p99=" << l.p99_us
			<< " p99.9=" << l.p999_us << " max=" << l.max_us << "\n";
	}

	out << "\nRetry config: RETRY_COUNT=" << settings.machine.retry_count
		<< ", BACKOFF_MAX=" << settings.machine.backoff_max
		<< ", RETRY_BACKOFF_POLICY="
		<< (settings.machine.backoff_policy == BackoffPolicy::kFixed ? "fixed" : "full_jitter") << "\n"
		<< "Conflicts: " << summary.retry.conflicts
		<< ", successful retries: " << summary.retry.successful_retries
		<< ", retries exhausted: " << summary.retry.exhausted_retries
		<< ", retries abandoned: " << summary.retry.abandoned_retries << "\n";
	for (const auto& report : reports) {
		if (report.retry.successful_retries == 0 && report.retry.exhausted_retries == 0) continue;
		out << "  worker " << report.worker_id << ": successful=" << report.retry.successful_retries
			<< " exhausted=" << report.retry.exhausted_retries << "\n";
	}
	if (!summary.consistent) {
		out << "\nWARNING: request category sums do not match completed request counts\n";
	}
	return out.str();
}

} // namespace Occbench
