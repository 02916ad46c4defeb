#pragma once

#include "traceproxy/common/noncopyable.h"

#include <chrono>
#include <functional>
#include <memory>

namespace traceproxy {
namespace network {

class EventLoop;

// One fd's epoll interest and the handlers its events are dispatched to. Does not own the fd.
// A channel tied to its owner only dispatches while the owner is still alive, and keeps it
// alive for the duration of the dispatch.
class Channel : traceproxy::common::noncopyable {
public:
    using EventCallback = std::function<void()>;
    using ReadEventCallback = std::function<void(std::chrono::system_clock::time_point)>;

    Channel(EventLoop* loop, int fd) : loop_(loop), fd_(fd) {}

    void HandleEvent(std::chrono::system_clock::time_point receiveTime);
    void Tie(const std::shared_ptr<void>& owner);

    void SetReadCallback(ReadEventCallback cb) { readCallback_ = std::move(cb); }
    void SetWriteCallback(EventCallback cb) { writeCallback_ = std::move(cb); }
    void SetCloseCallback(EventCallback cb) { closeCallback_ = std::move(cb); }
    void SetErrorCallback(EventCallback cb) { errorCallback_ = std::move(cb); }

    int fd() const { return fd_; }
    uint32_t events() const { return events_; }
    void set_revents(uint32_t revents) { revents_ = revents; }

    void EnableReading();
    void DisableReading();
    void EnableWriting();
    void DisableWriting();
    void DisableAll();

    bool IsNoneEvent() const { return events_ == 0; }
    bool IsWriting() const;
    bool IsReading() const;

    // Set by the poller: whether the fd is currently in the epoll set.
    bool registered() const { return registered_; }
    void set_registered(bool on) { registered_ = on; }

    // Drops the fd from the poller. Must be called before the fd is closed.
    void Remove();

private:
    void Update();
    void Dispatch(std::chrono::system_clock::time_point receiveTime);

    EventLoop* loop_;
    const int fd_;
    uint32_t events_{0};
    uint32_t revents_{0};
    bool registered_{false};

    bool tied_{false};
    std::weak_ptr<void> owner_;

    ReadEventCallback readCallback_;
    EventCallback writeCallback_;
    EventCallback closeCallback_;
    EventCallback errorCallback_;
};

} // namespace network
} // namespace traceproxy
