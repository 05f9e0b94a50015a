#pragma once

#include <cerrno>
#include <cstdlib>
#include <cstdint>

namespace Occbench {

// Integer read from text together with whether the default had to be used.
struct EnvInt {
	int64_t value;
	bool defaulted;
};

// Parses |text| as a base-10 integer >= |min_value|. Missing, non-numeric,
// partially numeric or too-small input yields {default_value, true}.
inline EnvInt ParseIntAtLeast(const char* text, int64_t min_value, int64_t default_value) {
	if (!text || !text[0]) return {default_value, true};
	errno = 0;
	char* end = nullptr;
	long long parsed = std::strtoll(text, &end, 10);
	if (errno != 0 || end == text || *end != '\0') return {default_value, true};
	if (parsed < min_value) return {default_value, true};
	return {static_cast<int64_t>(parsed), false};
}

}  // namespace Occbench
