#include "traceproxy/network/EventLoop.h"
#include "traceproxy/network/Channel.h"
#include "traceproxy/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <sys/eventfd.h>
#include <unistd.h>

namespace traceproxy {
namespace network {

namespace {

thread_local EventLoop* t_currentLoop = nullptr;

// Upper bound on one poll; queued work always wakes the loop earlier.
const int kPollTimeoutMs = 10000;

int OpenWakeupFd() {
    const int fd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (fd < 0) {
        LOG_FATAL << "eventfd: " << std::strerror(errno);
        throw std::runtime_error("eventfd failed");
    }
    return fd;
}

} // namespace

EventLoop* EventLoop::GetEventLoopOfCurrentThread() {
    return t_currentLoop;
}

EventLoop::EventLoop()
    : threadId_(std::this_thread::get_id()),
      wakeupFd_(OpenWakeupFd()) {
    if (t_currentLoop) {
        ::close(wakeupFd_);
        LOG_FATAL << "thread " << threadId_ << " already runs EventLoop " << t_currentLoop;
        throw std::logic_error("one EventLoop per thread");
    }
    t_currentLoop = this;

    wakeupChannel_.reset(new Channel(this, wakeupFd_));
    wakeupChannel_->SetReadCallback([this](std::chrono::system_clock::time_point) { DrainWakeup(); });
    wakeupChannel_->EnableReading();
    LOG_DEBUG << "EventLoop " << this << " created in thread " << threadId_;
}

EventLoop::~EventLoop() {
    wakeupChannel_->DisableAll();
    wakeupChannel_->Remove();
    ::close(wakeupFd_);
    t_currentLoop = nullptr;
}

void EventLoop::Loop() {
    looping_ = true;
    while (!quit_) {
        active_.clear();
        const auto receiveTime = poller_.Poll(kPollTimeoutMs, &active_);
        for (Channel* channel : active_) {
            channel->HandleEvent(receiveTime);
        }
        RunQueued();
    }
    looping_ = false;
    LOG_DEBUG << "EventLoop " << this << " left its loop";
}

void EventLoop::Quit() {
    quit_ = true;
    if (!IsInLoopThread()) WakeUp();
}

void EventLoop::RunInLoop(Functor cb) {
    if (IsInLoopThread()) {
        cb();
        return;
    }
    QueueInLoop(std::move(cb));
}

void EventLoop::QueueInLoop(Functor cb) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queued_.push_back(std::move(cb));
    }
    // From inside the loop thread a wakeup is only needed while the queue is being run:
    // otherwise RunQueued() comes after the current round anyway.
    if (!IsInLoopThread() || runningQueued_) WakeUp();
}

void EventLoop::WakeUp() {
    const uint64_t one = 1;
    if (::write(wakeupFd_, &one, sizeof one) != static_cast<ssize_t>(sizeof one)) {
        LOG_ERROR << "EventLoop " << this << ": wakeup write failed: " << std::strerror(errno);
    }
}

void EventLoop::DrainWakeup() {
    uint64_t count = 0;
    if (::read(wakeupFd_, &count, sizeof count) != static_cast<ssize_t>(sizeof count)) {
        LOG_ERROR << "EventLoop " << this << ": wakeup read failed: " << std::strerror(errno);
    }
}

void EventLoop::UpdateChannel(Channel* channel) {
    poller_.UpdateChannel(channel);
}

void EventLoop::RemoveChannel(Channel* channel) {
    poller_.RemoveChannel(channel);
}

void EventLoop::RunQueued() {
    std::vector<Functor> batch;
    runningQueued_ = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(queued_);
    }
    for (Functor& f : batch) {
        f();
    }
    runningQueued_ = false;
}

} // namespace network
} // namespace traceproxy
