#include "response_parser.h"

#include <nlohmann/json.hpp>

namespace Occbench {

absl::StatusOr<RefreshResponse> ParseRefreshResponse(std::string_view body, bool require_status) {
	nlohmann::json json = nlohmann::json::parse(body.begin(), body.end(), nullptr, false);
	if (json.is_discarded() || !json.is_object()) {
		return absl::InvalidArgumentError("refresh body is not a JSON object");
	}

	auto version_it = json.find("version");
	if (version_it == json.end() || !version_it->is_number_integer()) {
		return absl::InvalidArgumentError("refresh body has no integer 'version'");
	}
	RefreshResponse response;
	response.version = version_it->get<int64_t>();
	if (response.version < 1) {
		return absl::InvalidArgumentError("refresh body 'version' is not positive");
	}

	auto status_it = json.find("status");
	if (status_it != json.end() && status_it->is_string()) {
		response.status = ParseStatus(status_it->get<std::string>());
	}
	if (require_status && !response.status.has_value()) {
		return absl::InvalidArgumentError("refresh body has no recognized 'status'");
	}
	return response;
}

absl::StatusOr<std::string> ParseCreatedId(std::string_view body) {
	nlohmann::json json = nlohmann::json::parse(body.begin(), body.end(), nullptr, false);
	if (json.is_discarded() || !json.is_object()) {
		return absl::InvalidArgumentError("create body is not a JSON object");
	}
	auto id_it = json.find("id");
	if (id_it == json.end()) {
		return absl::InvalidArgumentError("create body has no 'id'");
	}
	if (id_it->is_string()) {
		return id_it->get<std::string>();
	}
	if (id_it->is_number_integer()) {
		return std::to_string(id_it->get<int64_t>());
	}
	return absl::InvalidArgumentError("create body 'id' is neither string nor integer");
}

} // namespace Occbench
