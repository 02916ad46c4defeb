#pragma once

#include "traceproxy/common/noncopyable.h"

#include <future>
#include <memory>
#include <string>
#include <utility>
#include <thread>

namespace traceproxy {
namespace network {

class EventLoop;

// An EventLoop running on its own thread. Quit and joined on destruction.
class EventLoopThread : traceproxy::common::noncopyable {
public:
    explicit EventLoopThread(std::string name = std::string()) : name_(std::move(name)) {}
    ~EventLoopThread();

    // Spawns the thread and blocks until its loop is running. Call once.
    EventLoop* StartLoop();
    const std::string& name() const { return name_; }

private:
    void Run(std::promise<EventLoop*>* started);

    const std::string name_;
    EventLoop* loop_{nullptr};
    std::thread thread_;
};

} // namespace network
} // namespace traceproxy
