#include "traceproxy/network/Acceptor.h"
#include "traceproxy/network/EventLoop.h"
#include "traceproxy/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

namespace traceproxy {
namespace network {

Acceptor::Acceptor(EventLoop* loop, const InetAddress& listenAddr)
    : loop_(loop),
      listen_addr_(listenAddr),
      accept_socket_(Socket::CreateNonblocking()),
      accept_channel_(loop, accept_socket_.fd()),
      listenning_(false) {
    if (accept_socket_.fd() >= 0) {
        accept_socket_.SetReuseAddr(true);
    }
    accept_channel_.SetReadCallback(std::bind(&Acceptor::HandleRead, this));
}

Acceptor::~Acceptor() {
    if (listenning_) {
        accept_channel_.DisableAll();
        accept_channel_.Remove();
    }
}

bool Acceptor::Listen(std::string* err) {
    auto fail = [&](const char* what) {
        const int saved = errno;
        std::string msg = std::string(what) + " " + listen_addr_.toIpPort() + ": " + std::strerror(saved);
        LOG_ERROR << msg;
        if (err) *err = msg;
        return false;
    };

    if (accept_socket_.fd() < 0) return fail("socket");
    if (!accept_socket_.BindAddress(listen_addr_)) return fail("bind");
    if (!accept_socket_.Listen()) return fail("listen");

    listenning_ = true;
    accept_channel_.EnableReading();
    return true;
}

void Acceptor::HandleRead() {
    InetAddress peerAddr;
    int connfd = accept_socket_.Accept(&peerAddr);
    if (connfd >= 0) {
        if (new_connection_callback_) {
            new_connection_callback_(connfd, peerAddr);
        } else {
            ::close(connfd);
        }
    } else {
        const int saved = errno;
        if (saved == EAGAIN || saved == EINTR) return;
        LOG_ERROR << "accept on " << listen_addr_.toIpPort() << ": " << std::strerror(saved);
        if (saved == EMFILE) {
            LOG_ERROR << "sockfd reached limit";
        }
    }
}

} // namespace network
} // namespace traceproxy
