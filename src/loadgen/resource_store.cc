#include "resource_store.h"

#include <glog/logging.h>

namespace Occbench {

namespace {

struct StatusEntry {
	ResourceStatus status;
	const char* name;
};

constexpr StatusEntry kStatusNames[] = {
	{ResourceStatus::kPending, "pending"},
	{ResourceStatus::kInProgress, "in_progress"},
	{ResourceStatus::kCompleted, "completed"},
	{ResourceStatus::kCancelled, "cancelled"},
};

} // namespace

const char* StatusName(ResourceStatus status) {
	for (const auto& entry : kStatusNames) {
		if (entry.status == status) return entry.name;
	}
	return "unknown";
}

std::optional<ResourceStatus> ParseStatus(std::string_view name) {
	for (const auto& entry : kStatusNames) {
		if (name == entry.name) return entry.status;
	}
	return std::nullopt;
}

const std::vector<ResourceStatus>& ValidTransitions(ResourceStatus from) {
	static const std::vector<ResourceStatus> kFromPending = {
		ResourceStatus::kInProgress, ResourceStatus::kCancelled};
	static const std::vector<ResourceStatus> kFromInProgress = {
		ResourceStatus::kCompleted, ResourceStatus::kPending, ResourceStatus::kCancelled};
	static const std::vector<ResourceStatus> kFromCompleted = {ResourceStatus::kPending};
	static const std::vector<ResourceStatus> kTerminal = {};

	switch (from) {
		case ResourceStatus::kPending:
			return kFromPending;
		case ResourceStatus::kInProgress:
			return kFromInProgress;
		case ResourceStatus::kCompleted:
			return kFromCompleted;
		case ResourceStatus::kCancelled:
			return kTerminal;
	}
	return kTerminal;
}

VersionedResourceStore::VersionedResourceStore(const std::vector<std::string>& ids)
	: slots_(ids.size()) {
	for (size_t i = 0; i < ids.size(); ++i) {
		slots_[i].id = ids[i];
	}
}

absl::StatusOr<size_t> VersionedResourceStore::Normalize(int64_t index) const {
	if (slots_.empty()) {
		return absl::OutOfRangeError("index error: resource pool is empty");
	}
	const int64_t n = static_cast<int64_t>(slots_.size());
	int64_t slot = (index - 1) % n;
	if (slot < 0) slot += n;
	return static_cast<size_t>(slot);
}

absl::StatusOr<ResourceState> VersionedResourceStore::GetState(int64_t index) const {
	absl::StatusOr<size_t> slot = Normalize(index);
	if (!slot.ok()) return slot.status();
	const Slot& s = slots_[*slot];
	ResourceState state;
	state.id = s.id;
	state.version = s.version.load(std::memory_order_relaxed);
	state.status = s.status.load(std::memory_order_relaxed);
	return state;
}

absl::StatusOr<std::string> VersionedResourceStore::GetId(int64_t index) const {
	absl::StatusOr<size_t> slot = Normalize(index);
	if (!slot.ok()) return slot.status();
	return slots_[*slot].id;
}

absl::StatusOr<int64_t> VersionedResourceStore::IncrementVersion(int64_t index) {
	absl::StatusOr<size_t> slot = Normalize(index);
	if (!slot.ok()) return slot.status();
	return slots_[*slot].version.fetch_add(1, std::memory_order_relaxed) + 1;
}

absl::Status VersionedResourceStore::SetVersion(int64_t index, int64_t version) {
	absl::StatusOr<size_t> slot = Normalize(index);
	if (!slot.ok()) return slot.status();
	if (version < 1) {
		return absl::InvalidArgumentError("validation error: version must be a positive integer");
	}
	slots_[*slot].version.store(version, std::memory_order_relaxed);
	return absl::OkStatus();
}

absl::Status VersionedResourceStore::SetVersionAndStatus(int64_t index, int64_t version,
		ResourceStatus status) {
	absl::StatusOr<size_t> slot = Normalize(index);
	if (!slot.ok()) return slot.status();
	if (version < 1) {
		return absl::InvalidArgumentError("validation error: version must be a positive integer");
	}
	slots_[*slot].version.store(version, std::memory_order_relaxed);
	slots_[*slot].status.store(status, std::memory_order_relaxed);
	return absl::OkStatus();
}

absl::Status VersionedResourceStore::SetVersionAndStatus(int64_t index, int64_t version,
		std::string_view status) {
	std::optional<ResourceStatus> parsed = ParseStatus(status);
	if (!parsed.has_value()) {
		return absl::InvalidArgumentError(
				"validation error: unrecognized status '" + std::string(status) + "'");
	}
	return SetVersionAndStatus(index, version, *parsed);
}

void VersionedResourceStore::ResetAll() {
	for (auto& s : slots_) {
		s.version.store(1, std::memory_order_relaxed);
		s.status.store(ResourceStatus::kPending, std::memory_order_relaxed);
	}
	VLOG(1) << "Reset " << slots_.size() << " resources to version 1";
}

} // namespace Occbench
