#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>

namespace Occbench {

/**
 * Fixed-size latency histogram of executed requests, in microseconds.
 *
 * Values below 1024us get one bucket each. Above that every power of two is
 * split into 64 buckets, so a reported percentile is at most 1/64 below the
 * true sample. Memory is the same for every run length (about 35 KB per
 * worker). min, max and average are exact.
 */
class LatencyStats {
public:
	struct Summary {
		double p50_us = 0.0;
		double p90_us = 0.0;
		double p95_us = 0.0;
		double p99_us = 0.0;
		double p999_us = 0.0;
		double max_us = 0.0;
		double min_us = 0.0;
		double average_us = 0.0;
		size_t count = 0;
	};

	static constexpr uint64_t kExactLimit = 1024;
	static constexpr int kExactBits = 10;
	static constexpr int kSubBucketBits = 6;
	static constexpr uint64_t kSubBuckets = uint64_t{1} << kSubBucketBits;
	static constexpr size_t kBucketCount = kExactLimit + (64 - kExactBits) * kSubBuckets;

	LatencyStats() : buckets_(kBucketCount, 0) {}

	void Record(std::chrono::microseconds latency) {
		const uint64_t us = latency.count() > 0 ? static_cast<uint64_t>(latency.count()) : 0;
		buckets_[BucketIndex(us)]++;
		count_++;
		sum_us_ += static_cast<long double>(us);
		min_us_ = std::min(min_us_, us);
		max_us_ = std::max(max_us_, us);
	}

	void Merge(const LatencyStats& other) {
		for (size_t i = 0; i < kBucketCount; ++i) {
			buckets_[i] += other.buckets_[i];
		}
		count_ += other.count_;
		sum_us_ += other.sum_us_;
		min_us_ = std::min(min_us_, other.min_us_);
		max_us_ = std::max(max_us_, other.max_us_);
	}

	size_t count() const { return static_cast<size_t>(count_); }
	bool empty() const { return count_ == 0; }

	Summary Summarize() const {
		Summary s{};
		if (count_ == 0) {
			return s;
		}
		s.count = static_cast<size_t>(count_);
		s.min_us = static_cast<double>(min_us_);
		s.max_us = static_cast<double>(max_us_);
		s.average_us = static_cast<double>(sum_us_ / static_cast<long double>(count_));
		s.p50_us = NearestRank(0.50);
		s.p90_us = NearestRank(0.90);
		s.p95_us = NearestRank(0.95);
		s.p99_us = NearestRank(0.99);
		s.p999_us = NearestRank(0.999);
		return s;
	}

	static size_t BucketIndex(uint64_t us) {
		if (us < kExactLimit) {
			return static_cast<size_t>(us);
		}
		int exponent = kExactBits;
		while (exponent < 63 && (us >> (exponent + 1)) != 0) {
			exponent++;
		}
		const uint64_t sub = (us >> (exponent - kSubBucketBits)) - kSubBuckets;
		return static_cast<size_t>(kExactLimit + (exponent - kExactBits) * kSubBuckets + sub);
	}

	static uint64_t BucketLowerBound(size_t index) {
		if (index < kExactLimit) {
			return index;
		}
		const uint64_t offset = index - kExactLimit;
		const int exponent = static_cast<int>(offset / kSubBuckets) + kExactBits;
		const uint64_t sub = offset % kSubBuckets;
		return (kSubBuckets + sub) << (exponent - kSubBucketBits);
	}

private:
	// Lower bound of the bucket holding the smallest sample with at least p of
	// the samples at or below it, clamped to the observed range.
	double NearestRank(double p) const {
		const double rank_f = std::ceil(p * static_cast<double>(count_));
		const uint64_t rank = rank_f < 1.0 ? 1 : static_cast<uint64_t>(rank_f);
		uint64_t seen = 0;
		for (size_t i = 0; i < kBucketCount; ++i) {
			seen += buckets_[i];
			if (seen >= rank) {
				const uint64_t value = std::min(std::max(BucketLowerBound(i), min_us_), max_us_);
				return static_cast<double>(value);
			}
		}
		return static_cast<double>(max_us_);
	}

	std::vector<uint64_t> buckets_;
	uint64_t count_ = 0;
	long double sum_us_ = 0.0L;
	uint64_t min_us_ = std::numeric_limits<uint64_t>::max();
	uint64_t max_us_ = 0;
};

} // namespace Occbench
