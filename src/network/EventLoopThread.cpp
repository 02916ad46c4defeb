#include "traceproxy/network/EventLoopThread.h"
#include "traceproxy/network/EventLoop.h"
#include "traceproxy/common/Logger.h"

namespace traceproxy {
namespace network {

EventLoopThread::~EventLoopThread() {
    if (loop_ != nullptr) loop_->Quit();
    if (thread_.joinable()) thread_.join();
}

EventLoop* EventLoopThread::StartLoop() {
    auto started = std::make_shared<std::promise<EventLoop*>>();
    std::future<EventLoop*> loop = started->get_future();
    thread_ = std::thread([this, started]() { Run(started.get()); });
    loop_ = loop.get();
    return loop_;
}

// The loop lives on this thread's stack until Quit() makes Loop() return.
void EventLoopThread::Run(std::promise<EventLoop*>* started) {
    EventLoop loop;
    started->set_value(&loop);
    loop.Loop();
    LOG_DEBUG << "EventLoopThread " << name_ << " exiting";
}

} // namespace network
} // namespace traceproxy
