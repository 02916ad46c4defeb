#pragma once

#include "traceproxy/ProxyConfig.h"
#include "traceproxy/common/noncopyable.h"
#include "traceproxy/network/InetAddress.h"
#include "traceproxy/network/TcpClient.h"
#include "traceproxy/network/TcpConnection.h"
#include "traceproxy/trace/TraceEntry.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace traceproxy {

namespace network {
class EventLoop;
}

struct SessionTarget {
    int index{0};
    TargetAddress config;
    network::InetAddress addr;
    bool resolved{false};
};

// Everything a session needs from its proxy, fixed when the proxy starts.
struct SessionContext {
    static constexpr size_t kDefaultHighWaterMark = 4 * 1024 * 1024;

    network::EventLoop* loop{nullptr};
    std::vector<SessionTarget> targets;
    EchoPolicy echo;
    size_t highWaterMark{kDefaultHighWaterMark};

    // Applied once per chunk. nullopt drops the chunk.
    std::function<std::optional<std::string>(const std::string&)> transform;
    std::function<void(const trace::TraceEntry&)> record;
    // Called once, after the client and every target leg have closed.
    std::function<void(const std::string& sessionId)> finished;
};

// One accepted client and its connections to every target.
//
// Client reads stay paused until each target has either connected or failed. Client chunks
// go to every connected target; target chunks go back to the client only when the echo
// policy selects that target. Each transfer produces one trace entry.
class ProxySession : public std::enable_shared_from_this<ProxySession>,
                     traceproxy::common::noncopyable {
public:
    ProxySession(std::shared_ptr<const SessionContext> ctx, const network::TcpConnectionPtr& client);
    ~ProxySession();

    void Start();

    const std::string& id() const { return info_.id; }
    const trace::SessionInfo& info() const { return info_; }
    bool finished() const { return finished_; }
    size_t connectedTargets() const;

    void OnClientMessage(network::Buffer* buf);
    void OnClientHalfClose();
    void OnClientClosed();

private:
    enum class LegState {
        kConnecting,
        kConnected,
        kFailed,
        kClosed,
    };

    struct TargetLeg {
        int index{0};
        trace::SocketAddress address;
        std::unique_ptr<network::TcpClient> client;
        network::TcpConnectionPtr conn;
        LegState state{LegState::kConnecting};
        bool settled{false};
        bool writeBlocked{false};
        std::string error;
    };

    void OnTargetConnection(int index, const network::TcpConnectionPtr& conn);
    void OnTargetConnectFailed(int index, int err);
    void OnTargetMessage(int index, network::Buffer* buf);
    void OnTargetHalfClose(int index, const network::TcpConnectionPtr& conn);

    void OnClientHighWater();
    void OnClientDrained();
    void OnTargetHighWater(int index);
    void OnTargetDrained(int index);

    void Settle(TargetLeg& leg);
    void UpdateClientRead();
    void MaybeFinish();

    trace::TraceEntry MakeEntry(trace::Direction direction,
                                const trace::SocketAddress& source, int sourceIndex,
                                const trace::SocketAddress& target, int targetIndex) const;
    std::optional<std::string> Transform(const std::string& chunk) const;

    std::shared_ptr<const SessionContext> ctx_;
    network::TcpConnectionPtr client_;
    trace::SocketAddress clientAddr_;
    trace::SessionInfo info_;
    std::vector<TargetLeg> legs_;

    int pendingTargets_;
    int blockedTargets_;
    bool clientBlocked_;
    bool clientClosed_;
    bool finished_;
};

using ProxySessionPtr = std::shared_ptr<ProxySession>;

} // namespace traceproxy
