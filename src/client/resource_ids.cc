#include "resource_ids.h"

#include <fstream>

#include <glog/logging.h>
#include <nlohmann/json.hpp>

#include "absl/strings/str_cat.h"
#include "../loadgen/response_parser.h"

namespace Occbench {

namespace {

std::string Trim(const std::string& s) {
	const char* ws = " \t\r\n";
	size_t begin = s.find_first_not_of(ws);
	if (begin == std::string::npos) return "";
	size_t end = s.find_last_not_of(ws);
	return s.substr(begin, end - begin + 1);
}

std::string SeedPayload(int64_t index) {
	nlohmann::json body;
	body["title"] = "Benchmark Task " + std::to_string(index);
	body["description"] = "Test task for benchmarking";
	body["priority"] = "medium";
	body["tags"] = {"benchmark", "test"};
	return body.dump();
}

} // namespace

absl::StatusOr<std::vector<std::string>> LoadResourceIds(const std::string& path) {
	std::ifstream in(path);
	if (!in.is_open()) {
		return absl::NotFoundError(absl::StrCat("cannot open ids file: ", path));
	}
	std::vector<std::string> ids;
	std::string line;
	while (std::getline(in, line)) {
		std::string id = Trim(line);
		if (id.empty() || id[0] == '#') continue;
		ids.push_back(std::move(id));
	}
	if (ids.empty()) {
		return absl::FailedPreconditionError(absl::StrCat("ids file has no ids: ", path));
	}
	return ids;
}

const std::vector<std::string>& FallbackResourceIds() {
	static const std::vector<std::string> kIds = {
		"a1b2c3d4-e5f6-4789-abcd-ef0123456789",
		"b2c3d4e5-f6a7-4890-bcde-f01234567890",
		"c3d4e5f6-a7b8-4901-cdef-012345678901",
	};
	return kIds;
}

std::vector<std::string> SeedResources(ITransport& transport, const std::string& resource_path,
		int64_t count) {
	std::vector<std::string> ids;
	for (int64_t i = 1; i <= count; ++i) {
		HttpRequest request;
		request.method = HttpMethod::kPost;
		request.path = resource_path;
		request.headers.emplace_back("Content-Type", "application/json");
		request.body = SeedPayload(i);

		HttpResponse response = transport.Execute(request);
		if (!IsSuccessStatus(response.status)) {
			LOG(WARNING) << "Creating resource " << i << " failed with status " << response.status;
			continue;
		}
		auto id = ParseCreatedId(response.body);
		if (!id.ok()) {
			LOG(WARNING) << "Creating resource " << i << ": " << id.status();
			continue;
		}
		ids.push_back(*std::move(id));
	}
	LOG(INFO) << "Seeded " << ids.size() << "/" << count << " resources at " << resource_path;
	return ids;
}

std::vector<std::string> ResolveResourceIds(const std::string& ids_file) {
	if (!ids_file.empty()) {
		auto ids = LoadResourceIds(ids_file);
		if (ids.ok()) {
			LOG(INFO) << "Loaded " << ids->size() << " resource ids from " << ids_file;
			return *std::move(ids);
		}
		LOG(WARNING) << ids.status() << ", using fallback ids";
	} else {
		LOG(WARNING) << "No ids file given, using " << FallbackResourceIds().size() << " fallback ids";
	}
	return FallbackResourceIds();
}

} // namespace Occbench
