#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "absl/status/statusor.h"
#include "resource_store.h"

namespace Occbench {

/**
 * Authoritative resource state returned by GET {resource_path}/{id}.
 */
struct RefreshResponse {
	int64_t version = 0;
	std::optional<ResourceStatus> status;
};

/**
 * Parses a refresh body. Fails (InvalidArgument) when the body is not JSON,
 * when "version" is missing or not a positive integer, or, with
 * |require_status|, when "status" is missing or not a known status.
 */
absl::StatusOr<RefreshResponse> ParseRefreshResponse(std::string_view body, bool require_status);

/**
 * Extracts the "id" of a newly created resource from a POST response body.
 * Accepts string or integer ids.
 */
absl::StatusOr<std::string> ParseCreatedId(std::string_view body);

} // namespace Occbench
