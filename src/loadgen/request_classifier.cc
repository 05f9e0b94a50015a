#include "request_classifier.h"

#include <glog/logging.h>

namespace Occbench {

const char* CategoryName(RequestCategory category) {
	switch (category) {
		case RequestCategory::kNone: return "none";
		case RequestCategory::kExecuted: return "executed";
		case RequestCategory::kBackoff: return "backoff";
		case RequestCategory::kSuppressed: return "suppressed";
		case RequestCategory::kFallback: return "fallback";
	}
	return "none";
}

void RequestClassifier::Classify(RequestCategory category) {
	if (pending_ != RequestCategory::kNone) {
		LOG(WARNING) << "Request classified as " << CategoryName(category)
			<< " while a " << CategoryName(pending_) << " response is still pending";
	}
	switch (category) {
		case RequestCategory::kExecuted:
			counters_.executed++;
			break;
		case RequestCategory::kBackoff:
			counters_.backoff++;
			break;
		case RequestCategory::kSuppressed:
			counters_.suppressed++;
			break;
		case RequestCategory::kFallback:
			counters_.fallback++;
			break;
		case RequestCategory::kNone:
			LOG(ERROR) << "Refusing to classify a request as none";
			return;
	}
	issued_++;
	pending_ = category;
}

RequestCategory RequestClassifier::TakePending() {
	RequestCategory category = pending_;
	pending_ = RequestCategory::kNone;
	return category;
}

bool RequestClassifier::VerifyConsistency(uint64_t completed, const std::string& label) const {
	const uint64_t sum = counters_.Total();
	if (sum != completed) {
		LOG(WARNING) << "[" << label << "] Inconsistency detected: total=" << completed
			<< ", sum(categories)=" << sum;
		return false;
	}
	return true;
}

} // namespace Occbench
