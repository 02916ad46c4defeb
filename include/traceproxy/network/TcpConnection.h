#pragma once

#include "traceproxy/common/noncopyable.h"
#include "traceproxy/network/Buffer.h"
#include "traceproxy/network/Callbacks.h"
#include "traceproxy/network/InetAddress.h"

#include <any>
#include <memory>
#include <string>
#include <utility>

namespace traceproxy {
namespace network {

class Channel;
class EventLoop;
class Socket;

// One established TCP stream, owned through shared_ptr by TcpServer or TcpClient.
// Everything except the accessors must be called in the loop thread.
//
// With a PeerHalfCloseCallback installed, EOF from the peer only stops reading and the
// stream closes once our write side is shut down as well. Without one, EOF closes it.
class TcpConnection : traceproxy::common::noncopyable,
                      public std::enable_shared_from_this<TcpConnection> {
public:
    TcpConnection(EventLoop* loop,
                  std::string name,
                  int sockfd,
                  const InetAddress& localAddr,
                  const InetAddress& peerAddr);
    ~TcpConnection();

    const std::string& name() const { return name_; }
    const InetAddress& localAddress() const { return localAddr_; }
    const InetAddress& peerAddress() const { return peerAddr_; }
    bool connected() const { return state_ == State::kOpen; }
    bool peerClosed() const { return peerClosed_; }
    // strerror() text of the last socket failure, empty when none.
    const std::string& lastError() const { return lastError_; }

    void SetContext(const std::any& context) { context_ = context; }
    const std::any& GetContext() const { return context_; }

    // Writes now or buffers the rest. False when nothing can be written any more:
    // the connection is not open, its write side is shut down, or the socket failed.
    bool Send(const std::string& data);
    // Half-closes once the buffered output has been written.
    void Shutdown();
    void ForceClose();
    void StartRead();
    void StopRead();

    void SetConnectionCallback(ConnectionCallback cb) { connectionCallback_ = std::move(cb); }
    void SetMessageCallback(MessageCallback cb) { messageCallback_ = std::move(cb); }
    void SetPeerHalfCloseCallback(PeerHalfCloseCallback cb) { peerHalfCloseCallback_ = std::move(cb); }
    void SetCloseCallback(CloseCallback cb) { closeCallback_ = std::move(cb); }
    void SetOutputPressureCallback(OutputPressureCallback cb, size_t limit) {
        pressureCallback_ = std::move(cb);
        pressureLimit_ = limit;
    }

    // The owner calls this once the connection is in its map.
    void ConnectEstablished();
    // The owner calls this after dropping the connection from its map.
    void ConnectDestroyed();

private:
    enum class State { kConnecting, kOpen, kShuttingDown, kClosed };

    void OnReadable();
    void OnWritable();
    void OnError();
    void Close();

    // Writes as much buffered output as the socket takes. False on a hard socket error.
    bool Flush();
    void ShutdownIfDrained();
    void UpdatePressure();
    void RecordErrno(int err);

    EventLoop* loop_;
    const std::string name_;
    State state_;
    bool peerClosed_;
    bool writeShut_;
    bool congested_;
    std::string lastError_;

    std::unique_ptr<Socket> socket_;
    std::unique_ptr<Channel> channel_;
    const InetAddress localAddr_;
    const InetAddress peerAddr_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    PeerHalfCloseCallback peerHalfCloseCallback_;
    CloseCallback closeCallback_;
    OutputPressureCallback pressureCallback_;
    size_t pressureLimit_;

    Buffer input_;
    Buffer output_;
    std::any context_;
};

} // namespace network
} // namespace traceproxy
