#pragma once

#include "traceproxy/common/noncopyable.h"

#include <netinet/in.h>

namespace traceproxy {
namespace network {

class InetAddress;

// Owns a socket fd; closes it on destruction.
class Socket : traceproxy::common::noncopyable {
public:
    explicit Socket(int sockfd)
        : sockfd_(sockfd) {}
    ~Socket();

    int fd() const { return sockfd_; }

    // Return false and leave errno set on failure.
    bool BindAddress(const InetAddress& localaddr);
    bool Listen();
    int Accept(InetAddress* peeraddr);

    void ShutdownWrite();

    void SetReuseAddr(bool on);
    void SetKeepAlive(bool on);

    static int CreateNonblocking();
    static int GetSocketError(int sockfd);
    static struct sockaddr_in GetLocalAddr(int sockfd);
    static struct sockaddr_in GetPeerAddr(int sockfd);

private:
    const int sockfd_;
};

} // namespace network
} // namespace traceproxy
