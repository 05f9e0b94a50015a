#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "resource_store.h"

namespace Occbench {

/**
 * Which fields a field-variant update mutates.
 */
enum class UpdateType {
	kPriority,
	kStatus,
	kDescription,
	kTitle,
	kFull
};

const char* UpdateTypeName(UpdateType type);
std::optional<UpdateType> ParseUpdateType(std::string_view name);

/**
 * Parses a comma separated list such as "priority,title". Unknown names are
 * dropped with a warning; an empty result falls back to all five types.
 */
std::vector<UpdateType> ParseUpdateTypeList(const std::string& csv);

std::string RandomTitle(std::mt19937& rng);
std::string RandomPriority(std::mt19937& rng);
std::string RandomStatusName(std::mt19937& rng);

/**
 * JSON body for a PUT of the given update type, carrying |version| as the
 * optimistic-concurrency token.
 */
std::string BuildFieldUpdateBody(UpdateType type, int64_t version, uint64_t request_counter,
		std::mt19937& rng);

/**
 * Uniform pick from ValidTransitions(current). nullopt for terminal statuses.
 */
std::optional<ResourceStatus> PickNextStatus(ResourceStatus current, std::mt19937& rng);

std::string BuildStatusUpdateBody(ResourceStatus next, int64_t version);

} // namespace Occbench
