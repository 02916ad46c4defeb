#pragma once

#include <functional>
#include <memory>

namespace traceproxy {
namespace network {

class TcpConnection;
class Buffer;

using TcpConnectionPtr = std::shared_ptr<TcpConnection>;

// Fires when the connection comes up and again when it goes down; check connected().
using ConnectionCallback = std::function<void(const TcpConnectionPtr&)>;
using CloseCallback = std::function<void(const TcpConnectionPtr&)>;
// Peer finished sending (read side hit EOF); the connection stays open for writing.
using PeerHalfCloseCallback = std::function<void(const TcpConnectionPtr&)>;
using MessageCallback = std::function<void(const TcpConnectionPtr&, Buffer*)>;
// `congested` is true once the unsent output reaches the limit, false once it has drained.
using OutputPressureCallback = std::function<void(const TcpConnectionPtr&, bool congested)>;

} // namespace network
} // namespace traceproxy
