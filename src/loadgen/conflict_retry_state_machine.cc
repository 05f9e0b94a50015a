#include "conflict_retry_state_machine.h"

#include <utility>

#include <glog/logging.h>

#include "response_parser.h"

namespace Occbench {

const char* VariantName(UpdateVariant variant) {
	switch (variant) {
		case UpdateVariant::kField: return "field";
		case UpdateVariant::kStatusTransition: return "status";
	}
	return "field";
}

const char* StateName(MachineState state, UpdateVariant variant) {
	switch (state) {
		case MachineState::kUpdate: return "Update";
		case MachineState::kRetryGet: return "RetryGet";
		case MachineState::kRetryUpdate:
			return variant == UpdateVariant::kField ? "RetryPut" : "RetryPatch";
		case MachineState::kFallback: return "Fallback";
	}
	return "Update";
}

int DefaultRetryCount(UpdateVariant variant) {
	return variant == UpdateVariant::kField ? 0 : 1;
}

int64_t BackoffWindow(int attempt_count, int64_t backoff_base, int64_t backoff_max) {
	if (backoff_max <= 0) return 0;
	int64_t window = 1;
	for (int i = 0; i < attempt_count; ++i) {
		if (window >= backoff_max) break;
		window *= backoff_base;
	}
	return window < backoff_max ? window : backoff_max;
}

ConflictRetryStateMachine::ConflictRetryStateMachine(int worker_id, const WorkerPartition& partition,
		VersionedResourceStore& store, StateMachineOptions options, uint64_t seed)
	: worker_id_(worker_id),
	  partition_(partition),
	  store_(store),
	  options_(std::move(options)),
	  rng_(static_cast<std::mt19937::result_type>(seed)) {
	if (options_.update_types.empty()) {
		LOG(WARNING) << "[worker " << worker_id_ << "] Empty update type list, every update will be a full update";
	}
}

//********* Request generation

HttpRequest ConflictRetryStateMachine::NextRequest() {
	if (partition_.suppressed) {
		classifier_.Classify(RequestCategory::kSuppressed);
		return MakeFallbackRequest();
	}

	if (skip_counter_ < skip_target_) {
		skip_counter_++;
		classifier_.Classify(RequestCategory::kBackoff);
		return MakeFallbackRequest();
	}
	// Window elapsed; the next conflict opens a fresh one.
	skip_counter_ = 0;
	skip_target_ = 0;

	switch (state_) {
		case MachineState::kRetryGet:
			return BuildRetryGetRequest();
		case MachineState::kRetryUpdate:
			return BuildRetryUpdateRequest();
		case MachineState::kFallback:
			// Reset step only; this cycle's request is the regular update below.
			state_ = MachineState::kUpdate;
			break;
		case MachineState::kUpdate:
			break;
	}
	return BuildUpdateRequest();
}

HttpRequest ConflictRetryStateMachine::MakeFallbackRequest() const {
	HttpRequest request;
	request.method = HttpMethod::kGet;
	request.path = options_.fallback_path;
	return request;
}

HttpRequest ConflictRetryStateMachine::AbandonToFallback(const std::string& reason) {
	LOG(WARNING) << "[worker " << worker_id_ << "] " << reason << ", using fallback";
	ResetRetryState();
	state_ = MachineState::kFallback;
	last_update_index_.reset();
	last_sent_status_.reset();
	classifier_.Classify(RequestCategory::kFallback);
	return MakeFallbackRequest();
}

HttpRequest ConflictRetryStateMachine::MakeUpdateRequest(const std::string& id, const std::string& body) const {
	HttpRequest request;
	if (options_.variant == UpdateVariant::kField) {
		request.method = HttpMethod::kPut;
		request.path = options_.resource_path + "/" + id;
	} else {
		request.method = HttpMethod::kPatch;
		request.path = options_.resource_path + "/" + id + "/status";
	}
	request.headers.emplace_back("Content-Type", "application/json");
	request.body = body;
	return request;
}

HttpRequest ConflictRetryStateMachine::BuildUpdateRequest() {
	if (partition_.range_size <= 0) {
		return AbandonToFallback("Empty id range");
	}

	// The field variant always finds a body on the first id. The status variant
	// may skip terminal resources, for at most one sweep of the partition.
	const int64_t max_attempts =
		options_.variant == UpdateVariant::kStatusTransition ? partition_.range_size : 1;

	for (int64_t attempt = 0; attempt < max_attempts; ++attempt) {
		counter_++;
		const int64_t index = partition_.start_index +
			static_cast<int64_t>(counter_ % static_cast<uint64_t>(partition_.range_size)) + 1;

		absl::StatusOr<ResourceState> resource = store_.GetState(index);
		if (!resource.ok()) {
			return AbandonToFallback("Error getting resource state: " + std::string(resource.status().message()));
		}

		std::string body;
		std::optional<ResourceStatus> next_status;
		if (options_.variant == UpdateVariant::kField) {
			UpdateType type = UpdateType::kFull;
			if (!options_.update_types.empty()) {
				type = options_.update_types[counter_ % options_.update_types.size()];
			}
			body = BuildFieldUpdateBody(type, resource->version, counter_, rng_);
		} else {
			next_status = PickNextStatus(resource->status, rng_);
			if (!next_status.has_value()) {
				VLOG(2) << "[worker " << worker_id_ << "] Skipping terminal resource " << resource->id;
				continue;
			}
			body = BuildStatusUpdateBody(*next_status, resource->version);
		}

		last_update_index_ = index;
		last_sent_status_ = next_status;
		classifier_.Classify(RequestCategory::kExecuted);
		return MakeUpdateRequest(resource->id, body);
	}

	return AbandonToFallback("All resources in partition are in a terminal state");
}

HttpRequest ConflictRetryStateMachine::BuildRetryGetRequest() {
	if (!session_.has_value()) {
		return AbandonToFallback("RetryGet without a retry session");
	}
	absl::StatusOr<std::string> id = store_.GetId(session_->target_index);
	if (!id.ok()) {
		return AbandonToFallback("Error getting resource id for retry: " + std::string(id.status().message()));
	}

	classifier_.Classify(RequestCategory::kExecuted);
	HttpRequest request;
	request.method = HttpMethod::kGet;
	request.path = options_.resource_path + "/" + *id;
	request.headers.emplace_back("Accept", "application/json");
	return request;
}

HttpRequest ConflictRetryStateMachine::BuildRetryUpdateRequest() {
	if (!session_.has_value() || session_->pending_body.empty()) {
		return AbandonToFallback(std::string("Error in ") + StateName(state_, options_.variant) +
				": no pending body");
	}
	absl::StatusOr<std::string> id = store_.GetId(session_->target_index);
	if (!id.ok()) {
		return AbandonToFallback("Error getting resource id for retry: " + std::string(id.status().message()));
	}

	classifier_.Classify(RequestCategory::kExecuted);
	return MakeUpdateRequest(*id, session_->pending_body);
}

//********* Response handling

RequestCategory ConflictRetryStateMachine::OnResponse(const HttpResponse& response) {
	const RequestCategory category = classifier_.TakePending();
	if (category == RequestCategory::kNone) {
		LOG(WARNING) << "[worker " << worker_id_ << "] Response without a pending request";
		return category;
	}
	if (category != RequestCategory::kExecuted) {
		return category;
	}

	switch (state_) {
		case MachineState::kUpdate:
			HandleUpdateResponse(response);
			break;
		case MachineState::kRetryGet:
			HandleRetryGetResponse(response);
			break;
		case MachineState::kRetryUpdate:
			HandleRetryUpdateResponse(response);
			break;
		case MachineState::kFallback:
			break;
	}
	return category;
}

void ConflictRetryStateMachine::RecordSuccessfulWrite(int64_t index, std::optional<ResourceStatus> sent_status) {
	absl::StatusOr<int64_t> new_version = store_.IncrementVersion(index);
	if (!new_version.ok()) {
		LOG(ERROR) << "[worker " << worker_id_ << "] Error incrementing version: " << new_version.status();
		return;
	}
	if (sent_status.has_value()) {
		absl::Status status = store_.SetVersionAndStatus(index, *new_version, *sent_status);
		if (!status.ok()) {
			LOG(ERROR) << "[worker " << worker_id_ << "] Error setting status: " << status;
		}
	}
}

void ConflictRetryStateMachine::HandleUpdateResponse(const HttpResponse& response) {
	if (!last_update_index_.has_value()) {
		return;
	}
	const int64_t index = *last_update_index_;
	const std::optional<ResourceStatus> sent_status = last_sent_status_;
	last_update_index_.reset();
	last_sent_status_.reset();

	if (IsSuccessStatus(response.status)) {
		RecordSuccessfulWrite(index, sent_status);
		return;
	}

	if (response.status == kHttpConflict) {
		retry_stats_.conflicts++;
		if (options_.retry_count <= 0) {
			VLOG(1) << "[worker " << worker_id_ << "] Conflict detected but retries disabled";
			retry_stats_.exhausted_retries++;
			ResetRetryState();
			return;
		}
		RetrySession session;
		session.target_index = index;
		session.attempt_count = 0;
		session_ = std::move(session);
		ApplyBackoff();
		state_ = MachineState::kRetryGet;
		return;
	}

	if (response.status >= 400 || response.error != TransportError::kNone) {
		LOG_EVERY_N(WARNING, 100) << "[worker " << worker_id_ << "] Update failed with status "
			<< response.status << " (" << google::COUNTER << " so far)";
	}
}

void ConflictRetryStateMachine::HandleRetryGetResponse(const HttpResponse& response) {
	if (!session_.has_value()) {
		ResetRetryState();
		return;
	}
	if (!IsSuccessStatus(response.status)) {
		AbandonRetry("Retry GET failed with status " + std::to_string(response.status));
		return;
	}

	const bool status_variant = options_.variant == UpdateVariant::kStatusTransition;
	absl::StatusOr<RefreshResponse> refreshed = ParseRefreshResponse(response.body, status_variant);
	if (!refreshed.ok()) {
		AbandonRetry("Failed to parse GET response: " + std::string(refreshed.status().message()));
		return;
	}

	const int64_t index = session_->target_index;
	absl::Status synced = status_variant
		? store_.SetVersionAndStatus(index, refreshed->version, *refreshed->status)
		: store_.SetVersion(index, refreshed->version);
	if (!synced.ok()) {
		AbandonRetry("Failed to resync resource: " + std::string(synced.message()));
		return;
	}

	if (status_variant) {
		std::optional<ResourceStatus> next = PickNextStatus(*refreshed->status, rng_);
		if (!next.has_value()) {
			AbandonRetry("Resource became terminal while resolving conflict");
			return;
		}
		session_->pending_body = BuildStatusUpdateBody(*next, refreshed->version);
		session_->sent_status = next;
	} else {
		UpdateType type = UpdateType::kFull;
		if (!options_.update_types.empty()) {
			type = options_.update_types[static_cast<uint64_t>(index) % options_.update_types.size()];
		}
		session_->pending_body = BuildFieldUpdateBody(type, refreshed->version,
				static_cast<uint64_t>(index), rng_);
	}
	state_ = MachineState::kRetryUpdate;
}

void ConflictRetryStateMachine::HandleRetryUpdateResponse(const HttpResponse& response) {
	if (!session_.has_value()) {
		ResetRetryState();
		return;
	}

	if (IsSuccessStatus(response.status)) {
		RecordSuccessfulWrite(session_->target_index, session_->sent_status);
		retry_stats_.successful_retries++;
		ResetRetryState();
		return;
	}

	if (response.status == kHttpConflict) {
		retry_stats_.conflicts++;
		session_->attempt_count++;
		if (session_->attempt_count >= options_.retry_count) {
			VLOG(1) << "[worker " << worker_id_ << "] Retry exhausted after "
				<< options_.retry_count << " attempts";
			retry_stats_.exhausted_retries++;
			ResetRetryState();
			return;
		}
		VLOG(1) << "[worker " << worker_id_ << "] Retry " << StateName(state_, options_.variant)
			<< " got 409 (attempt " << session_->attempt_count << "/" << options_.retry_count << ")";
		session_->pending_body.clear();
		session_->sent_status.reset();
		ApplyBackoff();
		state_ = MachineState::kRetryGet;
		return;
	}

	AbandonRetry(std::string("Retry ") + StateName(state_, options_.variant) +
			" failed with status " + std::to_string(response.status));
}

//********* Retry bookkeeping

void ConflictRetryStateMachine::ApplyBackoff() {
	const int attempt = session_.has_value() ? session_->attempt_count : 0;
	const int64_t window = BackoffWindow(attempt, options_.backoff_base, options_.backoff_max);
	if (options_.backoff_policy == BackoffPolicy::kFullJitter) {
		std::uniform_int_distribution<int64_t> dist(0, window);
		skip_target_ = dist(rng_);
	} else {
		skip_target_ = window;
	}
	skip_counter_ = 0;
}

void ConflictRetryStateMachine::AbandonRetry(const std::string& reason) {
	LOG_EVERY_N(WARNING, 100) << "[worker " << worker_id_ << "] " << reason
		<< ", abandoning retry (" << google::COUNTER << " so far)";
	retry_stats_.abandoned_retries++;
	ResetRetryState();
}

void ConflictRetryStateMachine::ResetRetryState() {
	state_ = MachineState::kUpdate;
	session_.reset();
	skip_target_ = 0;
	skip_counter_ = 0;
}

} // namespace Occbench
