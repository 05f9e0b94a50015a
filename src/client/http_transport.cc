#include "http_transport.h"

#include <cstdlib>
#include <stdexcept>
#include <utility>

#include <glog/logging.h>

namespace Occbench {

namespace {

// Larger bodies abort the transfer as a read error.
constexpr size_t kMaxBodyBytes = 16 * 1024 * 1024;

size_t AppendBody(char* data, size_t size, size_t nmemb, void* userdata) {
	const size_t total = size * nmemb;
	auto* body = static_cast<std::string*>(userdata);
	if (body->size() + total > kMaxBodyBytes) {
		return 0;
	}
	body->append(data, total);
	return total;
}

// Reads one part of a parsed URL; empty when the part is absent.
std::string UrlPart(CURLU* url, CURLUPart part, unsigned int flags) {
	char* value = nullptr;
	if (curl_url_get(url, part, &value, flags) != CURLUE_OK || value == nullptr) {
		return "";
	}
	std::string result(value);
	curl_free(value);
	return result;
}

struct SlistDeleter {
	void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

} // namespace

std::string NormalizeBaseUrl(const std::string& url) {
	if (url.rfind("http://", 0) != 0) {
		throw std::invalid_argument("Only http:// URLs are supported: " + url);
	}

	std::unique_ptr<CURLU, decltype(&curl_url_cleanup)> parsed(curl_url(), &curl_url_cleanup);
	if (!parsed) {
		throw std::invalid_argument("Cannot allocate URL parser for " + url);
	}
	CURLUcode rc = curl_url_set(parsed.get(), CURLUPART_URL, url.c_str(), 0);
	if (rc != CURLUE_OK) {
		throw std::invalid_argument("Invalid URL '" + url + "': " + curl_url_strerror(rc));
	}

	const std::string host = UrlPart(parsed.get(), CURLUPART_HOST, 0);
	if (host.empty()) {
		throw std::invalid_argument("URL has no host: " + url);
	}
	const std::string port_text = UrlPart(parsed.get(), CURLUPART_PORT, CURLU_DEFAULT_PORT);
	char* end = nullptr;
	const long port = std::strtol(port_text.c_str(), &end, 10);
	if (port_text.empty() || *end != '\0' || port < 1 || port > 65535) {
		throw std::invalid_argument("URL port must be 1-65535: " + url);
	}
	return "http://" + host + ":" + std::to_string(port);
}

CurlGlobal::CurlGlobal() {
	CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
	if (code != CURLE_OK) {
		LOG(ERROR) << "curl_global_init failed: " << curl_easy_strerror(code);
	}
}

CurlGlobal::~CurlGlobal() {
	curl_global_cleanup();
}

TransportError ToTransportError(CURLcode code) {
	switch (code) {
		case CURLE_OK:
			return TransportError::kNone;
		case CURLE_COULDNT_RESOLVE_HOST:
		case CURLE_COULDNT_CONNECT:
			return TransportError::kConnect;
		case CURLE_OPERATION_TIMEDOUT:
			return TransportError::kTimeout;
		case CURLE_SEND_ERROR:
			return TransportError::kWrite;
		default:
			// Empty reply, truncated or badly framed body, oversized body.
			return TransportError::kRead;
	}
}

HttpTransport::HttpTransport(std::string base_url, int connect_timeout_ms, int request_timeout_ms)
	: base_url_(std::move(base_url)),
	  connect_timeout_ms_(connect_timeout_ms),
	  request_timeout_ms_(request_timeout_ms),
	  curl_(curl_easy_init()) {
	if (!curl_) {
		LOG(ERROR) << "curl_easy_init failed, every request to " << base_url_ << " will fail";
	}
}

HttpResponse HttpTransport::Execute(const HttpRequest& request) {
	HttpResponse response;
	if (!curl_) {
		response.error = TransportError::kConnect;
		return response;
	}
	CURL* curl = curl_.get();

	const std::string url = base_url_ + request.path;
	curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
	curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);
	curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout_ms_));
	curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request_timeout_ms_));
	curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);

	if (request.method == HttpMethod::kGet) {
		curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
		curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, static_cast<char*>(nullptr));
		curl_easy_setopt(curl, CURLOPT_FRESH_CONNECT, 0L);
	} else {
		curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
		curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
		curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, MethodName(request.method));
		curl_easy_setopt(curl, CURLOPT_FRESH_CONNECT, 1L);
	}

	curl_slist* raw_headers = curl_slist_append(nullptr, "Expect:");
	for (const auto& [name, value] : request.headers) {
		curl_slist* appended = curl_slist_append(raw_headers, (name + ": " + value).c_str());
		if (appended == nullptr) {
			LOG(ERROR) << "Dropping header " << name << ": out of memory";
			continue;
		}
		raw_headers = appended;
	}
	std::unique_ptr<curl_slist, SlistDeleter> headers(raw_headers);
	curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());

	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &AppendBody);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

	CURLcode code = curl_easy_perform(curl);
	curl_easy_setopt(curl, CURLOPT_HTTPHEADER, static_cast<curl_slist*>(nullptr));

	if (code != CURLE_OK) {
		LOG_EVERY_N(WARNING, 100) << MethodName(request.method) << " " << url << " failed: "
			<< curl_easy_strerror(code) << " (" << google::COUNTER << " so far)";
		response.status = 0;
		response.body.clear();
		response.error = ToTransportError(code);
		return response;
	}

	long status = 0;
	curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
	response.status = static_cast<int>(status);
	return response;
}

} // namespace Occbench
