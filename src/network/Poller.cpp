#include "traceproxy/network/Poller.h"
#include "traceproxy/network/Channel.h"
#include "traceproxy/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <unistd.h>

namespace traceproxy {
namespace network {

namespace {
const size_t kInitialReadySlots = 32;
} // namespace

Poller::Poller()
    : epollfd_(::epoll_create1(EPOLL_CLOEXEC)),
      ready_(kInitialReadySlots) {
    if (epollfd_ < 0) {
        LOG_FATAL << "epoll_create1 failed: " << std::strerror(errno);
        throw std::runtime_error("epoll_create1 failed");
    }
}

Poller::~Poller() {
    ::close(epollfd_);
}

std::chrono::system_clock::time_point Poller::Poll(int timeoutMs, ChannelList* active) {
    const int n = ::epoll_wait(epollfd_, ready_.data(), static_cast<int>(ready_.size()), timeoutMs);
    const int savedErrno = errno;
    const auto now = std::chrono::system_clock::now();

    if (n < 0) {
        if (savedErrno != EINTR) {
            LOG_ERROR << "epoll_wait: " << std::strerror(savedErrno);
        }
        return now;
    }
    for (int i = 0; i < n; ++i) {
        Channel* channel = static_cast<Channel*>(ready_[i].data.ptr);
        channel->set_revents(ready_[i].events);
        active->push_back(channel);
    }
    // A full batch means more may be waiting; take more next round.
    if (static_cast<size_t>(n) == ready_.size()) {
        ready_.resize(ready_.size() * 2);
    }
    return now;
}

void Poller::UpdateChannel(Channel* channel) {
    if (!channel->registered()) {
        if (channel->IsNoneEvent()) return;
        Control(EPOLL_CTL_ADD, channel);
        channel->set_registered(true);
    } else if (channel->IsNoneEvent()) {
        Control(EPOLL_CTL_DEL, channel);
        channel->set_registered(false);
    } else {
        Control(EPOLL_CTL_MOD, channel);
    }
}

void Poller::RemoveChannel(Channel* channel) {
    if (channel->registered()) {
        Control(EPOLL_CTL_DEL, channel);
        channel->set_registered(false);
    }
}

void Poller::Control(int op, Channel* channel) {
    struct epoll_event ev;
    std::memset(&ev, 0, sizeof ev);
    ev.events = channel->events();
    ev.data.ptr = channel;
    if (::epoll_ctl(epollfd_, op, channel->fd(), &ev) < 0) {
        LOG_ERROR << "epoll_ctl op=" << op << " fd=" << channel->fd() << ": " << std::strerror(errno);
    }
}

} // namespace network
} // namespace traceproxy
