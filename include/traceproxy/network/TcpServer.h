#pragma once

#include "traceproxy/common/noncopyable.h"
#include "traceproxy/network/Callbacks.h"
#include "traceproxy/network/InetAddress.h"
#include "traceproxy/network/TcpConnection.h"

#include <map>
#include <memory>
#include <string>
#include <utility>

namespace traceproxy {
namespace network {

class EventLoop;
class Acceptor;

// Listener plus the connections it accepted, all on one loop thread.
// Stop() closes the listener only; accepted connections keep running until they close.
class TcpServer : traceproxy::common::noncopyable {
public:
    TcpServer(EventLoop* loop, const InetAddress& listenAddr, std::string name);
    ~TcpServer();

    const std::string& hostport() const { return hostport_; }
    const std::string& name() const { return name_; }

    // Returns false (and fills `err`) when bind or listen fails.
    bool Start(std::string* err = nullptr);
    void Stop();
    bool listening() const { return acceptor_ != nullptr; }
    size_t connectionCount() const { return connections_.size(); }

    void SetConnectionCallback(ConnectionCallback cb) { connectionCallback_ = std::move(cb); }
    void SetMessageCallback(MessageCallback cb) { messageCallback_ = std::move(cb); }
    void SetPeerHalfCloseCallback(PeerHalfCloseCallback cb) { peerHalfCloseCallback_ = std::move(cb); }

private:
    void OnAccepted(int sockfd, const InetAddress& peerAddr);
    void OnClosed(const TcpConnectionPtr& conn);

    EventLoop* loop_;
    const InetAddress listenAddr_;
    const std::string hostport_;
    const std::string name_;
    std::unique_ptr<Acceptor> acceptor_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    PeerHalfCloseCallback peerHalfCloseCallback_;

    int nextConnId_;
    std::map<std::string, TcpConnectionPtr> connections_;
};

} // namespace network
} // namespace traceproxy
