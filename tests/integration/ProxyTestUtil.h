#pragma once

// Loopback helpers shared by the integration tests: blocking client sockets, a threaded
// backend double, and a way to run code on the proxy's loop thread and wait for it.

#include "traceproxy/network/EventLoop.h"
#include "traceproxy/trace/TraceEntry.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstring>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace testutil {

inline bool pollReadable(int fd, int timeoutMs) {
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN | POLLHUP | POLLERR;
    pfd.revents = 0;
    return ::poll(&pfd, 1, timeoutMs) == 1;
}

inline void sendAll(int fd, const std::string& s) {
    size_t off = 0;
    while (off < s.size()) {
        ssize_t n = ::send(fd, s.data() + off, s.size() - off, MSG_NOSIGNAL);
        if (n <= 0) return;
        off += static_cast<size_t>(n);
    }
}

inline int connectTo(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr) != 1) {
        ::close(fd);
        return -1;
    }
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

inline std::optional<uint16_t> bindEphemeralTcpPort(int* listenFdOut) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return std::nullopt;
    int opt = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(0);
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(fd, 64) != 0) {
        ::close(fd);
        return std::nullopt;
    }
    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        ::close(fd);
        return std::nullopt;
    }
    *listenFdOut = fd;
    return ntohs(addr.sin_port);
}

inline std::optional<uint16_t> reserveFreeTcpPort() {
    int fd = -1;
    auto port = bindEphemeralTcpPort(&fd);
    if (fd >= 0) ::close(fd);
    return port;
}

// Empty string on timeout, error or EOF.
inline std::string recvSome(int fd, int timeoutMs) {
    if (!pollReadable(fd, timeoutMs)) return std::string();
    char buf[4096];
    ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
    if (n <= 0) return std::string();
    return std::string(buf, buf + n);
}

// Reads until `want` bytes arrived or the deadline passed.
inline std::string recvAtLeast(int fd, size_t want, int timeoutMs) {
    std::string out;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (out.size() < want && std::chrono::steady_clock::now() < deadline) {
        const std::string part = recvSome(fd, 50);
        out += part;
    }
    return out;
}

// True when the peer closed its write side within the timeout.
inline bool waitEof(int fd, int timeoutMs) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < deadline) {
        if (!pollReadable(fd, 50)) continue;
        char buf[4096];
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n == 0) return true;
        if (n < 0) return false;
    }
    return false;
}

inline bool waitUntil(const std::function<bool()>& pred, int timeoutMs = 3000) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

// Runs `f` on the loop thread and returns its result.
template <typename F>
auto runInLoop(traceproxy::network::EventLoop* loop, F f) -> decltype(f()) {
    using R = decltype(f());
    auto task = std::make_shared<std::packaged_task<R()>>(std::move(f));
    std::future<R> fut = task->get_future();
    loop->RunInLoop([task]() { (*task)(); });
    return fut.get();
}

// Threaded blocking backend. Serves one connection at a time, records every byte and answers
// each read with reply(data) when that is non-empty. `onAccept` runs first on every connection.
class Backend {
public:
    using Reply = std::function<std::string(const std::string&)>;
    using OnAccept = std::function<void(int fd)>;

    explicit Backend(Reply reply = Reply(), OnAccept onAccept = OnAccept())
        : reply_(std::move(reply)), onAccept_(std::move(onAccept)) {
        auto port = bindEphemeralTcpPort(&lfd_);
        port_ = port ? *port : 0;
        thread_ = std::thread([this]() { Run(); });
    }

    ~Backend() {
        stop_.store(true);
        thread_.join();
    }

    uint16_t port() const { return port_; }
    int accepted() const { return accepted_.load(); }
    int eofs() const { return eofs_.load(); }

    std::string received() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

private:
    void Run() {
        while (!stop_.load()) {
            if (!pollReadable(lfd_, 50)) continue;
            int cfd = ::accept(lfd_, nullptr, nullptr);
            if (cfd < 0) continue;
            accepted_.fetch_add(1);
            if (onAccept_) onAccept_(cfd);
            while (!stop_.load()) {
                if (!pollReadable(cfd, 50)) continue;
                char buf[8192];
                ssize_t n = ::recv(cfd, buf, sizeof(buf), 0);
                if (n == 0) {
                    eofs_.fetch_add(1);
                    break;
                }
                if (n < 0) break;
                const std::string data(buf, buf + n);
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    received_ += data;
                }
                if (reply_) {
                    const std::string out = reply_(data);
                    if (!out.empty()) sendAll(cfd, out);
                }
            }
            ::close(cfd);
        }
        ::close(lfd_);
    }

    Reply reply_;
    OnAccept onAccept_;
    int lfd_{-1};
    uint16_t port_{0};
    std::atomic<bool> stop_{false};
    std::atomic<int> accepted_{0};
    std::atomic<int> eofs_{0};
    mutable std::mutex mutex_;
    std::string received_;
    std::thread thread_;
};

// Entries delivered through TcpProxyInstance::SetTraceEntryCallback, readable from the test thread.
class EntryLog {
public:
    void Add(const traceproxy::trace::TraceEntry& e) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(e);
    }

    std::vector<traceproxy::trace::TraceEntry> Snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<traceproxy::trace::TraceEntry> entries_;
};

} // namespace testutil
