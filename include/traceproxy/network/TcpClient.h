#pragma once

#include "traceproxy/common/noncopyable.h"
#include "traceproxy/network/TcpConnection.h"

#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace traceproxy {
namespace network {

class Channel;
class EventLoop;

// One outbound connection, no reconnect. A single non-blocking connect is made and its
// outcome reported once: the connection callback on success, the connect-failed callback
// with the errno otherwise. All calls must be made in the loop thread.
class TcpClient : traceproxy::common::noncopyable {
public:
    using ConnectFailedCallback = std::function<void(int err)>;

    TcpClient(EventLoop* loop, const InetAddress& serverAddr, std::string name);
    ~TcpClient();

    void Connect();

    TcpConnectionPtr connection() const { return connection_; }
    const std::string& name() const { return name_; }
    const InetAddress& serverAddress() const { return serverAddr_; }

    void SetConnectionCallback(ConnectionCallback cb) { connectionCallback_ = std::move(cb); }
    void SetMessageCallback(MessageCallback cb) { messageCallback_ = std::move(cb); }
    void SetPeerHalfCloseCallback(PeerHalfCloseCallback cb) { peerHalfCloseCallback_ = std::move(cb); }
    void SetConnectFailedCallback(ConnectFailedCallback cb) { connectFailedCallback_ = std::move(cb); }

private:
    void OnConnectWritable();
    void OnConnectError();
    int ReleaseConnecting();
    void Fail(int sockfd, int err);
    void Established(int sockfd);
    void OnClosed(const TcpConnectionPtr& conn);

    EventLoop* loop_;
    const InetAddress serverAddr_;
    const std::string name_;

    // Watches the socket while the connect is in flight.
    std::unique_ptr<Channel> connecting_;
    TcpConnectionPtr connection_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    PeerHalfCloseCallback peerHalfCloseCallback_;
    ConnectFailedCallback connectFailedCallback_;
};

} // namespace network
} // namespace traceproxy
