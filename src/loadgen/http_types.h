#pragma once

#include <string>
#include <utility>
#include <vector>

namespace Occbench {

enum class HttpMethod {
	kGet,
	kPost,
	kPut,
	kPatch
};

inline const char* MethodName(HttpMethod method) {
	switch (method) {
		case HttpMethod::kGet: return "GET";
		case HttpMethod::kPost: return "POST";
		case HttpMethod::kPut: return "PUT";
		case HttpMethod::kPatch: return "PATCH";
	}
	return "GET";
}

/**
 * Transport-level failure. Responses carrying one have status 0.
 */
enum class TransportError {
	kNone = 0,
	kConnect,
	kRead,
	kWrite,
	kTimeout
};

struct HttpRequest {
	HttpMethod method = HttpMethod::kGet;
	std::string path;
	std::vector<std::pair<std::string, std::string>> headers;
	std::string body;
};

struct HttpResponse {
	int status = 0;
	std::string body;
	TransportError error = TransportError::kNone;
};

inline bool IsSuccessStatus(int status) { return status >= 200 && status < 300; }

constexpr int kHttpConflict = 409;

} // namespace Occbench
