#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "latency_stats.h"
#include "run_settings.h"
#include "worker.h"

namespace Occbench {

// Status codes reported individually; everything else lands in "other".
constexpr std::array<int, 9> kReportedStatuses = {200, 201, 207, 400, 404, 409, 422, 500, 502};

/**
 * Label of the distribution bucket |status| belongs to, e.g. "409" or "other".
 */
std::string StatusBucket(int status);

struct RunSummary {
	RequestCounters counters;
	uint64_t issued = 0;
	uint64_t completed = 0;
	RetryStats retry;
	// Keyed by StatusBucket().
	std::map<std::string, uint64_t> status_buckets;
	uint64_t executed_responses = 0;
	uint64_t error_responses = 0;
	double error_rate_percent = 0.0;
	std::array<uint64_t, 5> transport_errors{};
	LatencyStats::Summary latency;
	// Per worker and overall category sums matched the completed counts.
	bool consistent = true;
};

/**
 * Merges worker reports. Each worker's category sum is checked against its
 * completed count, then the sums are checked once more across all workers.
 * Errors are 4xx, 5xx and "other" buckets over executed responses.
 */
RunSummary AggregateReports(const std::vector<WorkerReport>& reports);

/**
 * Human-readable run report: category table, status distribution, error
 * rate with the excluded-request note, latency, retry config and per-worker
 * retry counts.
 */
std::string FormatRunReport(const RunSummary& summary, const std::vector<WorkerReport>& reports,
		const RunSettings& settings, double elapsed_seconds);

} // namespace Occbench
