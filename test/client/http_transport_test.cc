#include <gtest/gtest.h>
#include "loopback_http_server.h"
#include "../../src/client/http_transport.h"

#include <memory>
#include <stdexcept>

using namespace Occbench;

TEST(NormalizeBaseUrlTest, AddsDefaultPort) {
    EXPECT_EQ(NormalizeBaseUrl("http://127.0.0.1:3002"), "http://127.0.0.1:3002");
    EXPECT_EQ(NormalizeBaseUrl("http://api.local/"), "http://api.local:80");
}

TEST(NormalizeBaseUrlTest, RejectsUnsupportedUrls) {
    EXPECT_THROW(NormalizeBaseUrl("https://example.com"), std::invalid_argument);
    EXPECT_THROW(NormalizeBaseUrl("http://"), std::invalid_argument);
    EXPECT_THROW(NormalizeBaseUrl("http://host:0"), std::invalid_argument);
    EXPECT_THROW(NormalizeBaseUrl("http://host:70000"), std::invalid_argument);
    EXPECT_THROW(NormalizeBaseUrl("http://host:80x"), std::invalid_argument);
    EXPECT_THROW(NormalizeBaseUrl("http://:8080"), std::invalid_argument);
}

TEST(ToTransportErrorTest, MapsCurlCodes) {
    EXPECT_EQ(ToTransportError(CURLE_OK), TransportError::kNone);
    EXPECT_EQ(ToTransportError(CURLE_COULDNT_CONNECT), TransportError::kConnect);
    EXPECT_EQ(ToTransportError(CURLE_OPERATION_TIMEDOUT), TransportError::kTimeout);
    EXPECT_EQ(ToTransportError(CURLE_SEND_ERROR), TransportError::kWrite);
    EXPECT_EQ(ToTransportError(CURLE_GOT_NOTHING), TransportError::kRead);
    EXPECT_EQ(ToTransportError(CURLE_PARTIAL_FILE), TransportError::kRead);
}

class HttpTransportTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() { curl_global_ = new CurlGlobal(); }
    static void TearDownTestSuite() {
        delete curl_global_;
        curl_global_ = nullptr;
    }

    std::unique_ptr<HttpTransport> MakeTransport(const LoopbackHttpServer& server, int request_timeout_ms = 2000) {
        return std::make_unique<HttpTransport>(NormalizeBaseUrl(server.url()), 1000, request_timeout_ms);
    }

    static HttpRequest Put(const std::string& path, const std::string& body) {
        HttpRequest request;
        request.method = HttpMethod::kPut;
        request.path = path;
        request.headers.emplace_back("Content-Type", "application/json");
        request.body = body;
        return request;
    }

    static HttpRequest Get(const std::string& path) {
        HttpRequest request;
        request.path = path;
        return request;
    }

    static CurlGlobal* curl_global_;
};

CurlGlobal* HttpTransportTest::curl_global_ = nullptr;

TEST_F(HttpTransportTest, GetsReuseOneConnection) {
    LoopbackHttpServer server([](const ReceivedRequest&) {
        CannedReply reply;
        reply.raw = OkReply("{\"ok\":true}");
        return reply;
    });
    auto transport = MakeTransport(server);

    for (int i = 0; i < 3; ++i) {
        HttpResponse response = transport->Execute(Get("/health"));
        EXPECT_EQ(response.status, 200);
        EXPECT_EQ(response.error, TransportError::kNone);
        EXPECT_EQ(response.body, "{\"ok\":true}");
    }
    EXPECT_EQ(server.CountMethod("GET"), 3u);
    EXPECT_EQ(server.connections(), 1);
}

TEST_F(HttpTransportTest, SendsMethodPathHeadersAndBody) {
    LoopbackHttpServer server([](const ReceivedRequest&) {
        CannedReply reply;
        reply.raw = "HTTP/1.1 409 Conflict\r\nContent-Length: 0\r\n\r\n";
        return reply;
    });
    auto transport = MakeTransport(server);

    HttpRequest request = Put("/resources/a/status", "{\"status\":\"completed\",\"version\":3}");
    request.method = HttpMethod::kPatch;
    HttpResponse response = transport->Execute(request);
    EXPECT_EQ(response.status, 409);
    EXPECT_EQ(response.error, TransportError::kNone);

    std::vector<ReceivedRequest> seen = server.requests();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].method, "PATCH");
    EXPECT_EQ(seen[0].path, "/resources/a/status");
    EXPECT_EQ(seen[0].body, "{\"status\":\"completed\",\"version\":3}");
    EXPECT_NE(seen[0].head.find("Content-Type: application/json"), std::string::npos);
}

TEST_F(HttpTransportTest, WriteDroppedWithoutReplyIsSentOnce) {
    LoopbackHttpServer server([](const ReceivedRequest& request) {
        CannedReply reply;
        if (request.method == "PUT") {
            reply.close_after = true;
        } else {
            reply.raw = OkReply("{}");
        }
        return reply;
    });
    auto transport = MakeTransport(server);

    // Leaves a kept-alive connection in the handle's pool.
    ASSERT_EQ(transport->Execute(Get("/health")).status, 200);

    HttpResponse response = transport->Execute(Put("/resources/a", "{\"version\":1}"));
    EXPECT_EQ(response.status, 0);
    EXPECT_EQ(response.error, TransportError::kRead);
    EXPECT_EQ(server.CountMethod("PUT"), 1u);

    // The transport is still usable afterwards.
    EXPECT_EQ(transport->Execute(Get("/health")).status, 200);
    EXPECT_EQ(server.CountMethod("PUT"), 1u);
}

TEST_F(HttpTransportTest, OversizedChunkSizeIsAReadError) {
    LoopbackHttpServer server([](const ReceivedRequest&) {
        CannedReply reply;
        reply.raw = "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                    "FFFFFFFFFFFFFFFF\r\nabcdefgh\r\n0\r\n\r\n";
        reply.close_after = true;
        return reply;
    });
    auto transport = MakeTransport(server);

    HttpResponse response = transport->Execute(Get("/resources/a"));
    EXPECT_EQ(response.status, 0);
    EXPECT_NE(response.error, TransportError::kNone);
    EXPECT_TRUE(response.body.empty());
}

TEST_F(HttpTransportTest, NonHexChunkSizeIsAReadError) {
    LoopbackHttpServer server([](const ReceivedRequest&) {
        CannedReply reply;
        reply.raw = "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\nWiki\r\n0\r\n\r\n";
        reply.close_after = true;
        return reply;
    });
    auto transport = MakeTransport(server);

    HttpResponse response = transport->Execute(Get("/resources/a"));
    EXPECT_EQ(response.status, 0);
    EXPECT_EQ(response.error, TransportError::kRead);
}

TEST_F(HttpTransportTest, TruncatedBodyIsAReadError) {
    LoopbackHttpServer server([](const ReceivedRequest&) {
        CannedReply reply;
        reply.raw = "HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\nshort";
        reply.close_after = true;
        return reply;
    });
    auto transport = MakeTransport(server);

    HttpResponse response = transport->Execute(Get("/resources/a"));
    EXPECT_EQ(response.status, 0);
    EXPECT_EQ(response.error, TransportError::kRead);
}

TEST_F(HttpTransportTest, SlowServerTimesOut) {
    LoopbackHttpServer server([](const ReceivedRequest&) {
        CannedReply reply;
        reply.raw = OkReply("{}");
        reply.delay_ms = 600;
        return reply;
    });
    auto transport = MakeTransport(server, 150);

    HttpResponse response = transport->Execute(Get("/health"));
    EXPECT_EQ(response.status, 0);
    EXPECT_EQ(response.error, TransportError::kTimeout);
}

TEST_F(HttpTransportTest, RefusedConnectionIsAConnectError) {
    std::string url;
    {
        LoopbackHttpServer server([](const ReceivedRequest&) { return CannedReply{}; });
        url = NormalizeBaseUrl(server.url());
    }
    HttpTransport transport(url, 500, 500);
    HttpResponse response = transport.Execute(Get("/health"));
    EXPECT_EQ(response.status, 0);
    EXPECT_EQ(response.error, TransportError::kConnect);
}
