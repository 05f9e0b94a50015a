#pragma once

#include <cstdint>
#include <string>

namespace Occbench {

/**
 * Accounting bucket of one generated request. kNone means no request is
 * awaiting its response.
 */
enum class RequestCategory : uint8_t {
	kNone = 0,
	kExecuted,
	kBackoff,
	kSuppressed,
	kFallback
};

const char* CategoryName(RequestCategory category);

struct RequestCounters {
	uint64_t executed = 0;
	uint64_t backoff = 0;
	uint64_t suppressed = 0;
	uint64_t fallback = 0;

	uint64_t Total() const { return executed + backoff + suppressed + fallback; }
	// backoff + suppressed + fallback; these never reach the metrics.
	uint64_t Excluded() const { return backoff + suppressed + fallback; }

	RequestCounters& operator+=(const RequestCounters& other) {
		executed += other.executed;
		backoff += other.backoff;
		suppressed += other.suppressed;
		fallback += other.fallback;
		return *this;
	}
};

/**
 * Tags every generated request with exactly one category.
 *
 * Classify() is called at generation time, before the request is sent, and
 * increments both the category counter and the issued count, so
 * counters().Total() == issued() holds after every call. The response path
 * calls TakePending() to route the response by the recorded category; the
 * response itself is never inspected to decide the bucket.
 */
class RequestClassifier {
	public:
		RequestClassifier() = default;

		void Classify(RequestCategory category);

		/**
		 * Returns the category recorded for the in-flight request and clears it.
		 * kNone when no request is pending.
		 */
		RequestCategory TakePending();

		RequestCategory pending() const { return pending_; }
		const RequestCounters& counters() const { return counters_; }
		uint64_t issued() const { return issued_; }

		/**
		 * Compares the category sum against the number of requests the load
		 * engine reports as completed. Logs a warning on mismatch.
		 * @return true when consistent
		 */
		bool VerifyConsistency(uint64_t completed, const std::string& label) const;

	private:
		RequestCounters counters_;
		uint64_t issued_ = 0;
		RequestCategory pending_ = RequestCategory::kNone;
};

} // namespace Occbench
