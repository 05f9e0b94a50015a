#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace Occbench {

/**
 * Lifecycle status of a resource, used by the status-transition variant.
 */
enum class ResourceStatus : uint8_t {
	kPending = 0,
	kInProgress,
	kCompleted,
	kCancelled
};

const char* StatusName(ResourceStatus status);
std::optional<ResourceStatus> ParseStatus(std::string_view name);

/**
 * Valid next statuses for |from|. Empty for terminal statuses.
 */
const std::vector<ResourceStatus>& ValidTransitions(ResourceStatus from);

struct ResourceState {
	std::string id;
	int64_t version = 1;
	ResourceStatus status = ResourceStatus::kPending;

	bool operator==(const ResourceState& other) const {
		return id == other.id && version == other.version && status == other.status;
	}
};

/**
 * The generator's view of resource versions and statuses.
 *
 * Indices are 1-based and wrap around: any integer i maps to slot
 * ((i - 1) mod N) + 1, including 0 and negatives. Slots are shared between
 * workers without a cross-worker lock; each field is individually atomic but
 * read-modify-write sequences across fields are not. The partitioner keeps
 * workers on disjoint slots under normal configuration.
 */
class VersionedResourceStore {
	public:
		explicit VersionedResourceStore(const std::vector<std::string>& ids);

		VersionedResourceStore(const VersionedResourceStore&) = delete;
		VersionedResourceStore& operator=(const VersionedResourceStore&) = delete;

		size_t Size() const { return slots_.size(); }

		absl::StatusOr<ResourceState> GetState(int64_t index) const;
		absl::StatusOr<std::string> GetId(int64_t index) const;

		/**
		 * Unconditionally bumps the version. Only call after a response the caller
		 * has attributed as a successful write to this resource.
		 * @return The new version
		 */
		absl::StatusOr<int64_t> IncrementVersion(int64_t index);

		absl::Status SetVersion(int64_t index, int64_t version);
		absl::Status SetVersionAndStatus(int64_t index, int64_t version, ResourceStatus status);
		absl::Status SetVersionAndStatus(int64_t index, int64_t version, std::string_view status);

		// Every version back to 1 and every status back to pending.
		void ResetAll();

	private:
		struct Slot {
			std::string id;
			std::atomic<int64_t> version{1};
			std::atomic<ResourceStatus> status{ResourceStatus::kPending};
		};

		absl::StatusOr<size_t> Normalize(int64_t index) const;

		std::vector<Slot> slots_;
};

} // namespace Occbench
