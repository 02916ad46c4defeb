#include "traceproxy/network/Channel.h"
#include "traceproxy/network/EventLoop.h"

#include <sys/epoll.h>

namespace traceproxy {
namespace network {

namespace {
const uint32_t kReadEvents = EPOLLIN | EPOLLPRI;
const uint32_t kWriteEvents = EPOLLOUT;
} // namespace

void Channel::Tie(const std::shared_ptr<void>& owner) {
    owner_ = owner;
    tied_ = true;
}

void Channel::EnableReading() {
    events_ |= kReadEvents;
    Update();
}

void Channel::DisableReading() {
    events_ &= ~kReadEvents;
    Update();
}

void Channel::EnableWriting() {
    events_ |= kWriteEvents;
    Update();
}

void Channel::DisableWriting() {
    events_ &= ~kWriteEvents;
    Update();
}

void Channel::DisableAll() {
    events_ = 0;
    Update();
}

bool Channel::IsWriting() const { return (events_ & kWriteEvents) != 0; }
bool Channel::IsReading() const { return (events_ & kReadEvents) != 0; }

void Channel::Update() {
    loop_->UpdateChannel(this);
}

void Channel::Remove() {
    loop_->RemoveChannel(this);
}

void Channel::HandleEvent(std::chrono::system_clock::time_point receiveTime) {
    if (!tied_) {
        Dispatch(receiveTime);
        return;
    }
    std::shared_ptr<void> guard = owner_.lock();
    if (guard) {
        Dispatch(receiveTime);
    }
}

// Every reported condition reaches its handler, a hang-up included: a refused connect
// shows up as EPOLLERR|EPOLLHUP|EPOLLOUT and must still reach the error/write handlers.
void Channel::Dispatch(std::chrono::system_clock::time_point receiveTime) {
    if ((revents_ & EPOLLHUP) && !(revents_ & EPOLLIN) && closeCallback_) {
        closeCallback_();
    }
    if ((revents_ & EPOLLERR) && errorCallback_) {
        errorCallback_();
    }
    if ((revents_ & (EPOLLIN | EPOLLPRI | EPOLLRDHUP)) && readCallback_) {
        readCallback_(receiveTime);
    }
    if ((revents_ & EPOLLOUT) && writeCallback_) {
        writeCallback_();
    }
}

} // namespace network
} // namespace traceproxy
