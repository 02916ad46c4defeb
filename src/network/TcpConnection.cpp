#include "traceproxy/network/TcpConnection.h"
#include "traceproxy/network/Channel.h"
#include "traceproxy/network/EventLoop.h"
#include "traceproxy/network/Socket.h"
#include "traceproxy/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <sys/socket.h>

namespace traceproxy {
namespace network {

namespace {
constexpr size_t kDefaultPressureLimit = 64 * 1024 * 1024;
}

TcpConnection::TcpConnection(EventLoop* loop,
                             std::string name,
                             int sockfd,
                             const InetAddress& localAddr,
                             const InetAddress& peerAddr)
    : loop_(loop),
      name_(std::move(name)),
      state_(State::kConnecting),
      peerClosed_(false),
      writeShut_(false),
      congested_(false),
      socket_(new Socket(sockfd)),
      channel_(new Channel(loop, sockfd)),
      localAddr_(localAddr),
      peerAddr_(peerAddr),
      pressureLimit_(kDefaultPressureLimit) {
    channel_->SetReadCallback([this](std::chrono::system_clock::time_point) { OnReadable(); });
    channel_->SetWriteCallback([this]() { OnWritable(); });
    channel_->SetCloseCallback([this]() { Close(); });
    channel_->SetErrorCallback([this]() { OnError(); });
    socket_->SetKeepAlive(true);
    LOG_DEBUG << "TcpConnection[" << name_ << "] created, fd=" << sockfd;
}

TcpConnection::~TcpConnection() {
    LOG_DEBUG << "TcpConnection[" << name_ << "] destroyed, fd=" << socket_->fd();
}

void TcpConnection::ConnectEstablished() {
    state_ = State::kOpen;
    channel_->Tie(shared_from_this());
    channel_->EnableReading();
    if (connectionCallback_) connectionCallback_(shared_from_this());
}

void TcpConnection::ConnectDestroyed() {
    if (state_ != State::kClosed) {
        state_ = State::kClosed;
        channel_->DisableAll();
        if (connectionCallback_) connectionCallback_(shared_from_this());
    }
    channel_->Remove();
}

void TcpConnection::OnReadable() {
    int err = 0;
    const ssize_t n = input_.ReadFd(channel_->fd(), &err);
    if (n > 0) {
        if (messageCallback_) messageCallback_(shared_from_this(), &input_);
        return;
    }
    if (n < 0) {
        if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR) return;
        RecordErrno(err);
        LOG_WARN << "TcpConnection[" << name_ << "] read failed: " << lastError_;
        Close();
        return;
    }

    if (!peerHalfCloseCallback_) {
        Close();
        return;
    }
    TcpConnectionPtr self(shared_from_this());
    peerClosed_ = true;
    channel_->DisableReading();
    LOG_DEBUG << "TcpConnection[" << name_ << "] peer half-closed";
    peerHalfCloseCallback_(self);
    if (writeShut_) Close();
}

void TcpConnection::OnWritable() {
    if (!channel_->IsWriting()) return;
    if (!Flush()) {
        LOG_WARN << "TcpConnection[" << name_ << "] write failed: " << lastError_;
        Close();
        return;
    }
    if (output_.ReadableBytes() > 0) return;

    channel_->DisableWriting();
    UpdatePressure();
    if (state_ == State::kShuttingDown) ShutdownIfDrained();
}

void TcpConnection::OnError() {
    const int err = Socket::GetSocketError(channel_->fd());
    if (err != 0) RecordErrno(err);
    LOG_WARN << "TcpConnection[" << name_ << "] socket error: " << lastError_;
}

void TcpConnection::Close() {
    if (state_ == State::kClosed) return;
    LOG_DEBUG << "TcpConnection[" << name_ << "] closing";
    state_ = State::kClosed;
    channel_->DisableAll();

    TcpConnectionPtr self(shared_from_this());
    if (connectionCallback_) connectionCallback_(self);
    if (closeCallback_) closeCallback_(self);
}

bool TcpConnection::Send(const std::string& data) {
    if (state_ != State::kOpen) return false;

    const bool idle = output_.ReadableBytes() == 0;
    output_.Append(data);
    if (idle && !Flush()) {
        LOG_WARN << "TcpConnection[" << name_ << "] send failed: " << lastError_;
        output_.RetrieveAll();
        return false;
    }
    if (output_.ReadableBytes() > 0 && !channel_->IsWriting()) {
        channel_->EnableWriting();
    }
    UpdatePressure();
    return true;
}

bool TcpConnection::Flush() {
    while (output_.ReadableBytes() > 0) {
        const ssize_t n = ::send(channel_->fd(), output_.Peek(), output_.ReadableBytes(), MSG_NOSIGNAL);
        if (n > 0) {
            output_.Retrieve(static_cast<size_t>(n));
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else if (n == 0 || errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        } else {
            RecordErrno(errno);
            return false;
        }
    }
    return true;
}

void TcpConnection::UpdatePressure() {
    if (!pressureCallback_) return;
    const size_t pending = output_.ReadableBytes();
    if (!congested_ && pending >= pressureLimit_) {
        congested_ = true;
    } else if (congested_ && pending == 0) {
        congested_ = false;
    } else {
        return;
    }
    // Reported from the loop's queue so callers of Send() are never re-entered.
    loop_->QueueInLoop([self = shared_from_this(), cb = pressureCallback_, on = congested_]() { cb(self, on); });
}

void TcpConnection::Shutdown() {
    if (state_ != State::kOpen) return;
    state_ = State::kShuttingDown;
    ShutdownIfDrained();
}

void TcpConnection::ShutdownIfDrained() {
    if (writeShut_ || state_ == State::kClosed || output_.ReadableBytes() > 0) return;
    socket_->ShutdownWrite();
    writeShut_ = true;
    if (peerClosed_) Close();
}

void TcpConnection::ForceClose() {
    Close();
}

void TcpConnection::StartRead() {
    if (state_ == State::kClosed || peerClosed_ || channel_->IsReading()) return;
    channel_->EnableReading();
}

void TcpConnection::StopRead() {
    if (channel_->IsReading()) channel_->DisableReading();
}

void TcpConnection::RecordErrno(int err) {
    lastError_ = std::strerror(err);
}

} // namespace network
} // namespace traceproxy
