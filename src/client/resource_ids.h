#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "interfaces.h"

namespace Occbench {

/**
 * Reads resource ids from |path|, one per line. Blank lines and lines
 * starting with '#' are skipped; surrounding whitespace is trimmed.
 * NotFound when the file cannot be opened, FailedPrecondition when it holds
 * no ids.
 */
absl::StatusOr<std::vector<std::string>> LoadResourceIds(const std::string& path);

// Built-in ids used when no ids file is available.
const std::vector<std::string>& FallbackResourceIds();

/**
 * Creates |count| resources by POSTing to |resource_path| and returns the ids
 * the server assigned. Creation failures are logged and skipped, so the
 * result may be shorter than |count|.
 */
std::vector<std::string> SeedResources(ITransport& transport, const std::string& resource_path,
		int64_t count);

/**
 * Ids for a run: the ids file when set and readable, otherwise the fallback
 * set with a warning.
 */
std::vector<std::string> ResolveResourceIds(const std::string& ids_file);

} // namespace Occbench
