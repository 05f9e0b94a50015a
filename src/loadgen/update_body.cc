#include "update_body.h"

#include <sstream>

#include <glog/logging.h>
#include <nlohmann/json.hpp>

namespace Occbench {

namespace {

constexpr const char* kTitlePrefixes[] = {
	"Implement", "Fix", "Update", "Refactor", "Test", "Deploy", "Review", "Optimize"};
constexpr const char* kTitleSubjects[] = {
	"authentication", "database", "API", "cache", "logging", "metrics", "UI", "docs"};
constexpr const char* kPriorities[] = {"low", "medium", "high", "critical"};

template <typename T, size_t N>
const T& Pick(const T (&values)[N], std::mt19937& rng) {
	std::uniform_int_distribution<size_t> dist(0, N - 1);
	return values[dist(rng)];
}

constexpr UpdateType kAllUpdateTypes[] = {
	UpdateType::kPriority, UpdateType::kStatus, UpdateType::kDescription,
	UpdateType::kTitle, UpdateType::kFull};

} // namespace

const char* UpdateTypeName(UpdateType type) {
	switch (type) {
		case UpdateType::kPriority: return "priority";
		case UpdateType::kStatus: return "status";
		case UpdateType::kDescription: return "description";
		case UpdateType::kTitle: return "title";
		case UpdateType::kFull: return "full";
	}
	return "full";
}

std::optional<UpdateType> ParseUpdateType(std::string_view name) {
	for (UpdateType type : kAllUpdateTypes) {
		if (name == UpdateTypeName(type)) return type;
	}
	return std::nullopt;
}

std::vector<UpdateType> ParseUpdateTypeList(const std::string& csv) {
	std::vector<UpdateType> types;
	std::stringstream ss(csv);
	std::string token;
	while (std::getline(ss, token, ',')) {
		const size_t first = token.find_first_not_of(" \t");
		const size_t last = token.find_last_not_of(" \t");
		if (first == std::string::npos) continue;
		token = token.substr(first, last - first + 1);
		std::optional<UpdateType> type = ParseUpdateType(token);
		if (!type.has_value()) {
			LOG(WARNING) << "Ignoring unknown update type '" << token << "'";
			continue;
		}
		types.push_back(*type);
	}
	if (types.empty()) {
		LOG(WARNING) << "No valid update types in '" << csv << "', using all update types";
		types.assign(std::begin(kAllUpdateTypes), std::end(kAllUpdateTypes));
	}
	return types;
}

std::string RandomTitle(std::mt19937& rng) {
	std::string title = Pick(kTitlePrefixes, rng);
	title += " ";
	title += Pick(kTitleSubjects, rng);
	return title;
}

std::string RandomPriority(std::mt19937& rng) {
	return Pick(kPriorities, rng);
}

std::string RandomStatusName(std::mt19937& rng) {
	constexpr ResourceStatus kStatuses[] = {
		ResourceStatus::kPending, ResourceStatus::kInProgress,
		ResourceStatus::kCompleted, ResourceStatus::kCancelled};
	return StatusName(Pick(kStatuses, rng));
}

std::string BuildFieldUpdateBody(UpdateType type, int64_t version, uint64_t request_counter,
		std::mt19937& rng) {
	nlohmann::json body;
	switch (type) {
		case UpdateType::kPriority:
			body["priority"] = RandomPriority(rng);
			break;
		case UpdateType::kStatus:
			body["status"] = RandomStatusName(rng);
			break;
		case UpdateType::kDescription:
			body["description"] = "Updated description via Optional optic - request " +
				std::to_string(request_counter);
			break;
		case UpdateType::kTitle:
			body["title"] = RandomTitle(rng) + " (updated)";
			break;
		case UpdateType::kFull:
			body["title"] = RandomTitle(rng) + " (full update)";
			body["description"] = "Full update via combined optics";
			body["priority"] = RandomPriority(rng);
			body["status"] = RandomStatusName(rng);
			body["tags"] = nlohmann::json::array({"updated", "benchmark"});
			break;
	}
	body["version"] = version;
	return body.dump();
}

std::optional<ResourceStatus> PickNextStatus(ResourceStatus current, std::mt19937& rng) {
	const std::vector<ResourceStatus>& candidates = ValidTransitions(current);
	if (candidates.empty()) {
		return std::nullopt;
	}
	std::uniform_int_distribution<size_t> dist(0, candidates.size() - 1);
	return candidates[dist(rng)];
}

std::string BuildStatusUpdateBody(ResourceStatus next, int64_t version) {
	nlohmann::json body;
	body["status"] = StatusName(next);
	body["version"] = version;
	return body.dump();
}

} // namespace Occbench
