#include "traceproxy/network/Socket.h"
#include "traceproxy/network/InetAddress.h"
#include "traceproxy/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

namespace traceproxy {
namespace network {

Socket::~Socket() {
    if (sockfd_ >= 0) {
        ::close(sockfd_);
    }
}

bool Socket::BindAddress(const InetAddress& localaddr) {
    return ::bind(sockfd_, localaddr.getSockAddr(), sizeof(struct sockaddr_in)) == 0;
}

bool Socket::Listen() {
    return ::listen(sockfd_, SOMAXCONN) == 0;
}

int Socket::Accept(InetAddress* peeraddr) {
    struct sockaddr_in addr;
    socklen_t len = sizeof addr;
    std::memset(&addr, 0, sizeof addr);
    int connfd = ::accept4(sockfd_, (struct sockaddr*)&addr, &len, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (connfd >= 0) {
        peeraddr->setSockAddr(addr);
    }
    return connfd;
}

void Socket::ShutdownWrite() {
    if (::shutdown(sockfd_, SHUT_WR) < 0) {
        LOG_WARN << "shutdown(SHUT_WR) fd=" << sockfd_ << ": " << std::strerror(errno);
    }
}

void Socket::SetReuseAddr(bool on) {
    int optval = on ? 1 : 0;
    ::setsockopt(sockfd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof optval);
}

void Socket::SetKeepAlive(bool on) {
    int optval = on ? 1 : 0;
    ::setsockopt(sockfd_, SOL_SOCKET, SO_KEEPALIVE, &optval, sizeof optval);
}

int Socket::CreateNonblocking() {
    int sockfd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (sockfd < 0) {
        LOG_ERROR << "socket() failed: " << std::strerror(errno);
    }
    return sockfd;
}

int Socket::GetSocketError(int sockfd) {
    int optval = 0;
    socklen_t optlen = sizeof optval;
    if (::getsockopt(sockfd, SOL_SOCKET, SO_ERROR, &optval, &optlen) < 0) {
        return errno;
    }
    return optval;
}

struct sockaddr_in Socket::GetLocalAddr(int sockfd) {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof addr);
    socklen_t len = sizeof addr;
    if (::getsockname(sockfd, (struct sockaddr*)&addr, &len) < 0) {
        LOG_ERROR << "getsockname fd=" << sockfd << ": " << std::strerror(errno);
    }
    return addr;
}

struct sockaddr_in Socket::GetPeerAddr(int sockfd) {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof addr);
    socklen_t len = sizeof addr;
    if (::getpeername(sockfd, (struct sockaddr*)&addr, &len) < 0) {
        LOG_DEBUG << "getpeername fd=" << sockfd << ": " << std::strerror(errno);
    }
    return addr;
}

} // namespace network
} // namespace traceproxy
