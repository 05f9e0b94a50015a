#pragma once

#include <memory>
#include <string>

#include <curl/curl.h>

#include "interfaces.h"

namespace Occbench {

/**
 * Checks a target base URL and returns it as "http://host:port".
 * Throws std::invalid_argument for other schemes, a missing host, or a port
 * outside 1-65535.
 */
std::string NormalizeBaseUrl(const std::string& url);

/**
 * Process-wide libcurl setup. Construct once in main before any worker
 * thread starts.
 */
class CurlGlobal {
	public:
		CurlGlobal();
		~CurlGlobal();

		CurlGlobal(const CurlGlobal&) = delete;
		CurlGlobal& operator=(const CurlGlobal&) = delete;
};

/**
 * Blocking HTTP/1.1 transport on one libcurl easy handle, so GETs reuse a
 * kept-alive connection. PUT, PATCH and POST always go out on a fresh
 * connection: libcurl silently resends a request whose reused connection
 * died before any response byte, and a write must reach the server at most
 * once per call.
 */
class HttpTransport : public ITransport {
	public:
		/**
		 * @param base_url Output of NormalizeBaseUrl
		 * @param connect_timeout_ms Upper bound for establishing a connection
		 * @param request_timeout_ms Upper bound for one whole request
		 */
		HttpTransport(std::string base_url, int connect_timeout_ms, int request_timeout_ms);

		HttpTransport(const HttpTransport&) = delete;
		HttpTransport& operator=(const HttpTransport&) = delete;

		HttpResponse Execute(const HttpRequest& request) override;

	private:
		struct CurlDeleter {
			void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
		};

		std::string base_url_;
		int connect_timeout_ms_;
		int request_timeout_ms_;
		std::unique_ptr<CURL, CurlDeleter> curl_;
};

/**
 * Maps a failed transfer to the transport error reported with status 0.
 */
TransportError ToTransportError(CURLcode code);

} // namespace Occbench
