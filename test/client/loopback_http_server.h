#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace Occbench {

struct ReceivedRequest {
    std::string method;
    std::string path;
    std::string head;
    std::string body;
};

struct CannedReply {
    // Raw bytes written back. Empty means no reply.
    std::string raw;
    bool close_after = false;
    int delay_ms = 0;
};

/**
 * Minimal HTTP/1.1 server on 127.0.0.1 with an ephemeral port. Each
 * connection is served on its own thread; every complete request is recorded
 * and answered with the handler's canned bytes.
 */
class LoopbackHttpServer {
public:
    using Handler = std::function<CannedReply(const ReceivedRequest&)>;

    explicit LoopbackHttpServer(Handler handler) : handler_(std::move(handler)) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0) throw std::runtime_error("socket failed");
        int one = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(listen_fd_, 16) != 0) {
            ::close(listen_fd_);
            throw std::runtime_error("bind/listen failed");
        }
        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        accept_thread_ = std::thread([this]() { AcceptLoop(); });
    }

    ~LoopbackHttpServer() {
        stop_.store(true);
        accept_thread_.join();
        for (auto& t : connection_threads_) t.join();
        ::close(listen_fd_);
    }

    int port() const { return port_; }
    std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }
    int connections() const { return connections_.load(); }

    std::vector<ReceivedRequest> requests() const {
        std::lock_guard<std::mutex> lock(mu_);
        return requests_;
    }

    size_t CountMethod(const std::string& method) const {
        std::lock_guard<std::mutex> lock(mu_);
        return static_cast<size_t>(std::count_if(requests_.begin(), requests_.end(),
                             [&method](const ReceivedRequest& r) { return r.method == method; }));
    }

private:
    static constexpr int kPollMs = 20;

    void AcceptLoop() {
        while (!stop_.load()) {
            pollfd pfd{listen_fd_, POLLIN, 0};
            if (::poll(&pfd, 1, kPollMs) <= 0) continue;
            int fd = ::accept(listen_fd_, nullptr, nullptr);
            if (fd < 0) continue;
            connections_++;
            connection_threads_.emplace_back([this, fd]() { Serve(fd); });
        }
    }

    // Pops one complete request off |buffer| if it holds one.
    static bool TakeRequest(std::string& buffer, ReceivedRequest& request) {
        const size_t head_end = buffer.find("\r\n\r\n");
        if (head_end == std::string::npos) return false;
        std::string head = buffer.substr(0, head_end);
        std::string lower = head;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        size_t body_len = 0;
        const size_t cl = lower.find("content-length:");
        if (cl != std::string::npos) {
            body_len = std::strtoul(lower.c_str() + cl + 15, nullptr, 10);
        }
        if (buffer.size() < head_end + 4 + body_len) return false;

        const size_t sp1 = head.find(' ');
        const size_t sp2 = head.find(' ', sp1 + 1);
        request.method = head.substr(0, sp1);
        request.path = head.substr(sp1 + 1, sp2 - sp1 - 1);
        request.head = head;
        request.body = buffer.substr(head_end + 4, body_len);
        buffer.erase(0, head_end + 4 + body_len);
        return true;
    }

    void Serve(int fd) {
        std::string buffer;
        char chunk[4096];
        bool open = true;
        while (open && !stop_.load()) {
            pollfd pfd{fd, POLLIN, 0};
            if (::poll(&pfd, 1, kPollMs) <= 0) continue;
            ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
            if (n <= 0) break;
            buffer.append(chunk, static_cast<size_t>(n));

            ReceivedRequest request;
            while (open && TakeRequest(buffer, request)) {
                {
                    std::lock_guard<std::mutex> lock(mu_);
                    requests_.push_back(request);
                }
                CannedReply reply = handler_(request);
                if (reply.delay_ms > 0) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(reply.delay_ms));
                }
                if (!reply.raw.empty()) {
                    ::send(fd, reply.raw.data(), reply.raw.size(), MSG_NOSIGNAL);
                }
                if (reply.close_after) open = false;
            }
        }
        ::close(fd);
    }

    Handler handler_;
    int listen_fd_ = -1;
    int port_ = 0;
    std::atomic<bool> stop_{false};
    std::atomic<int> connections_{0};
    std::thread accept_thread_;
    std::vector<std::thread> connection_threads_;
    mutable std::mutex mu_;
    std::vector<ReceivedRequest> requests_;
};

inline std::string OkReply(const std::string& body) {
    return "HTTP/1.1 200 OK\r\nContent-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

} // namespace Occbench
