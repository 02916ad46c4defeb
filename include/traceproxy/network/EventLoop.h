#pragma once

#include "traceproxy/common/noncopyable.h"
#include "traceproxy/network/Poller.h"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace traceproxy {
namespace network {

class Channel;

// One loop per thread. Everything touching channels owned by this loop must run in its thread;
// other threads hand work over with RunInLoop/QueueInLoop.
class EventLoop : traceproxy::common::noncopyable {
public:
    using Functor = std::function<void()>;

    // Throws std::logic_error if the calling thread already has a loop.
    EventLoop();
    ~EventLoop();

    // Runs until Quit(). Must be called from the constructing thread.
    void Loop();
    void Quit();

    // Runs `cb` now when called from the loop thread, otherwise queues it.
    void RunInLoop(Functor cb);
    // Always defers `cb` until after the current round of event handling.
    void QueueInLoop(Functor cb);
    void WakeUp();

    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);

    bool IsInLoopThread() const { return threadId_ == std::this_thread::get_id(); }
    bool IsLooping() const { return looping_; }

    static EventLoop* GetEventLoopOfCurrentThread();

private:
    void DrainWakeup();
    void RunQueued();

    std::atomic<bool> looping_{false};
    std::atomic<bool> quit_{false};
    std::atomic<bool> runningQueued_{false};
    const std::thread::id threadId_;

    Poller poller_;
    const int wakeupFd_;
    std::unique_ptr<Channel> wakeupChannel_;
    Poller::ChannelList active_;

    std::mutex mutex_;
    std::vector<Functor> queued_;
};

} // namespace network
} // namespace traceproxy
