#pragma once

#include <netinet/in.h>
#include <string>

namespace traceproxy {
namespace network {

// IPv4 endpoint.
class InetAddress {
public:
    explicit InetAddress(uint16_t port = 0, bool loopbackOnly = false);
    InetAddress(const std::string& ip, uint16_t port);
    explicit InetAddress(const struct sockaddr_in& addr)
        : addr_(addr), valid_(true) {}

    // Accepts dotted quads and host names (first IPv4 result of getaddrinfo).
    static bool Resolve(const std::string& host, uint16_t port, InetAddress* out);

    bool valid() const { return valid_; }
    sa_family_t family() const { return addr_.sin_family; }
    std::string toIp() const;
    std::string toIpPort() const;
    uint16_t toPort() const;

    const struct sockaddr* getSockAddr() const { return reinterpret_cast<const struct sockaddr*>(&addr_); }
    void setSockAddr(const struct sockaddr_in& addr) { addr_ = addr; valid_ = true; }

private:
    struct sockaddr_in addr_;
    bool valid_;
};

} // namespace network
} // namespace traceproxy
