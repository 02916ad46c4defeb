#pragma once

#include "traceproxy/common/noncopyable.h"

#include <sys/epoll.h>

#include <chrono>
#include <vector>

namespace traceproxy {
namespace network {

class Channel;

// epoll(7) wrapper owned by one EventLoop. Level triggered.
class Poller : traceproxy::common::noncopyable {
public:
    using ChannelList = std::vector<Channel*>;

    Poller();
    ~Poller();

    // Waits up to `timeoutMs` and appends the ready channels (with their revents set).
    std::chrono::system_clock::time_point Poll(int timeoutMs, ChannelList* active);

    // Adds, modifies or drops the channel's fd according to its interest set. A channel
    // with no interest is kept out of the epoll set.
    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);

private:
    void Control(int op, Channel* channel);

    int epollfd_;
    std::vector<struct epoll_event> ready_;
};

} // namespace network
} // namespace traceproxy
