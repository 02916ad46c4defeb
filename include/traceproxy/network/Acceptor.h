#pragma once

#include "traceproxy/common/noncopyable.h"
#include "traceproxy/network/Channel.h"
#include "traceproxy/network/InetAddress.h"
#include "traceproxy/network/Socket.h"

#include <functional>
#include <string>

namespace traceproxy {
namespace network {

class EventLoop;

class Acceptor : traceproxy::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd, const InetAddress&)>;

    Acceptor(EventLoop* loop, const InetAddress& listenAddr);
    ~Acceptor();

    void SetNewConnectionCallback(const NewConnectionCallback& cb) {
        new_connection_callback_ = cb;
    }

    // Binds and listens. On failure returns false and describes the error in `err`.
    bool Listen(std::string* err);

private:
    void HandleRead();

    EventLoop* loop_;
    InetAddress listen_addr_;
    Socket accept_socket_;
    Channel accept_channel_;
    NewConnectionCallback new_connection_callback_;
    bool listenning_;
};

} // namespace network
} // namespace traceproxy
