#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "http_types.h"
#include "id_partitioner.h"
#include "request_classifier.h"
#include "resource_store.h"
#include "update_body.h"

namespace Occbench {

/**
 * Field variant: PUT {resource_path}/{id} with mutated fields.
 * Status variant: PATCH {resource_path}/{id}/status following the
 * valid-transition table.
 */
enum class UpdateVariant {
	kField,
	kStatusTransition
};

enum class BackoffPolicy {
	kFixed,
	kFullJitter
};

enum class MachineState {
	kUpdate,
	kRetryGet,
	kRetryUpdate,  // RetryPut for the field variant, RetryPatch for the status variant
	kFallback
};

const char* VariantName(UpdateVariant variant);
const char* StateName(MachineState state, UpdateVariant variant);

// Retries are opt-in for field updates and on by default for status transitions.
int DefaultRetryCount(UpdateVariant variant);

/**
 * Number of cycles to skip for the given attempt:
 * min(base ^ attempt_count, backoff_max), saturating instead of overflowing.
 */
int64_t BackoffWindow(int attempt_count, int64_t backoff_base, int64_t backoff_max);

struct StateMachineOptions {
	UpdateVariant variant = UpdateVariant::kField;
	int retry_count = 0;
	int64_t backoff_base = 2;
	int64_t backoff_max = 16;
	BackoffPolicy backoff_policy = BackoffPolicy::kFullJitter;
	std::vector<UpdateType> update_types = {
		UpdateType::kPriority, UpdateType::kStatus, UpdateType::kDescription,
		UpdateType::kTitle, UpdateType::kFull};
	std::string resource_path = "/resources";
	std::string fallback_path = "/health";
};

/**
 * State held only while one conflict is being resolved.
 */
struct RetrySession {
	int64_t target_index = 0;
	std::string pending_body;
	int attempt_count = 0;
	// Status carried by pending_body (status variant only).
	std::optional<ResourceStatus> sent_status;
};

struct RetryStats {
	uint64_t successful_retries = 0;
	uint64_t exhausted_retries = 0;
	uint64_t abandoned_retries = 0;
	uint64_t conflicts = 0;
};

/**
 * Per-worker optimistic-concurrency update generator.
 *
 * Drives Update -> (409) -> RetryGet -> RetryPut/RetryPatch -> Update with
 * bounded retries, cycle-counted backoff and fallback requests. The caller
 * must alternate NextRequest() and OnResponse() strictly: one request in
 * flight per worker. Not thread-safe; each worker owns its own instance.
 */
class ConflictRetryStateMachine {
	public:
		/**
		 * @param worker_id Used in log lines only
		 * @param partition Slice of the store this worker targets
		 * @param store Shared resource store, must outlive the machine
		 * @param options Retry, backoff and endpoint settings
		 * @param seed Seed for update-body and jitter randomness
		 */
		ConflictRetryStateMachine(int worker_id, const WorkerPartition& partition,
				VersionedResourceStore& store, StateMachineOptions options, uint64_t seed);

		/**
		 * Generates the request for the next cycle and classifies it. Always
		 * returns exactly one request.
		 */
		HttpRequest NextRequest();

		/**
		 * Consumes the response to the last request. Responses to backoff,
		 * suppressed and fallback requests are ignored.
		 * @return The category the request was classified as
		 */
		RequestCategory OnResponse(const HttpResponse& response);

		MachineState state() const { return state_; }
		const std::optional<RetrySession>& session() const { return session_; }
		int64_t skip_counter() const { return skip_counter_; }
		int64_t skip_target() const { return skip_target_; }
		const RequestClassifier& classifier() const { return classifier_; }
		const RetryStats& retry_stats() const { return retry_stats_; }
		const WorkerPartition& partition() const { return partition_; }
		const StateMachineOptions& options() const { return options_; }

	private:
		HttpRequest MakeFallbackRequest() const;
		HttpRequest AbandonToFallback(const std::string& reason);
		HttpRequest BuildUpdateRequest();
		HttpRequest BuildRetryGetRequest();
		HttpRequest BuildRetryUpdateRequest();
		HttpRequest MakeUpdateRequest(const std::string& id, const std::string& body) const;

		void HandleUpdateResponse(const HttpResponse& response);
		void HandleRetryGetResponse(const HttpResponse& response);
		void HandleRetryUpdateResponse(const HttpResponse& response);

		void ApplyBackoff();
		void ResetRetryState();
		void AbandonRetry(const std::string& reason);
		void RecordSuccessfulWrite(int64_t index, std::optional<ResourceStatus> sent_status);

		const int worker_id_;
		const WorkerPartition partition_;
		VersionedResourceStore& store_;
		const StateMachineOptions options_;
		std::mt19937 rng_;

		MachineState state_ = MachineState::kUpdate;
		std::optional<RetrySession> session_;
		RequestClassifier classifier_;
		RetryStats retry_stats_;

		uint64_t counter_ = 0;
		int64_t skip_counter_ = 0;
		int64_t skip_target_ = 0;

		// Target of the last non-retry update, valid while its response is pending.
		std::optional<int64_t> last_update_index_;
		std::optional<ResourceStatus> last_sent_status_;
};

} // namespace Occbench
