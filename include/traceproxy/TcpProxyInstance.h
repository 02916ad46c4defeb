#pragma once

#include "traceproxy/ProxyConfig.h"
#include "traceproxy/ProxySession.h"
#include "traceproxy/common/noncopyable.h"
#include "traceproxy/hooks/Hooks.h"
#include "traceproxy/monitor/ProxyStats.h"
#include "traceproxy/network/TcpServer.h"
#include "traceproxy/trace/TraceRecorder.h"

#include <functional>
#include <map>
#include <memory>
#include <string>

namespace traceproxy {

namespace hooks {
class HookFactory;
}

namespace network {
class EventLoop;
}

struct ProxyHooks {
    hooks::ChunkHook chunk;
    hooks::ObserverHook observer;
    hooks::WriterHook writer;
};

// One configured proxy: a listener on the source port, its sessions, a trace recorder
// and statistics. All methods must be called in the loop thread.
class TcpProxyInstance : traceproxy::common::noncopyable {
public:
    enum class StartResult {
        kStarted,
        kAlreadyRunning,
        kBindFailed,
    };

    using TraceEntryCallback = std::function<void(const trace::TraceEntry& entry, const trace::TracePtr& traceSoFar)>;

    TcpProxyInstance(network::EventLoop* loop, ProxyConfig config, ProxyHooks hooks = ProxyHooks());
    ~TcpProxyInstance();

    // Resolves the three hook identifiers of `config`. Returns false (and fills `err`)
    // when any configured identifier cannot be resolved.
    static bool ResolveHooks(const ProxyConfig& config, hooks::HookFactory& factory,
                             ProxyHooks* out, std::string* err = nullptr);

    StartResult Start();
    // Closes the listener; running sessions drain on their own. False when not running.
    bool Stop();
    // Starts a trace, or ends the active one and hands it to the trace writer.
    // Returns the new or the finished trace.
    trace::TracePtr ToggleTrace();

    bool running() const { return running_; }
    bool tracing() const { return recorder_.active(); }
    const std::string& LastError() const { return lastError_; }

    const ProxyConfig& config() const { return config_; }
    const std::string& displayName() const { return config_.displayName; }
    uint16_t port() const { return config_.sourcePort; }
    size_t sessionCount() const { return sessions_.size(); }

    monitor::ProxyStats& stats() { return stats_; }
    const monitor::ProxyStats& stats() const { return stats_; }

    // Every recorded entry, traced or not.
    void SetTraceEntryCallback(TraceEntryCallback cb) { entryCallback_ = std::move(cb); }

    const hooks::HookState& chunkHandlerState() const { return hooks_.chunk.state.state(); }
    const hooks::HookState& traceHandlerState() const { return hooks_.observer.state.state(); }
    const hooks::HookState& traceWriterState() const { return hooks_.writer.state.state(); }

private:
    void OnConnection(const network::TcpConnectionPtr& conn);
    void OnMessage(const network::TcpConnectionPtr& conn, network::Buffer* buf);
    void OnClientHalfClose(const network::TcpConnectionPtr& conn);
    void OnEntry(const trace::TraceEntry& entry, const trace::TracePtr& traceSoFar);
    void OnSessionFinished(const std::string& sessionId);

    std::shared_ptr<SessionContext> MakeSessionContext();
    std::optional<std::string> ApplyChunkHook(const std::string& chunk);
    static ProxySessionPtr SessionOf(const network::TcpConnectionPtr& conn);

    network::EventLoop* loop_;
    ProxyConfig config_;
    ProxyHooks hooks_;

    bool running_;
    std::string lastError_;

    trace::TraceRecorder recorder_;
    monitor::ProxyStats stats_;
    TraceEntryCallback entryCallback_;

    // Expires in the destructor. Session callbacks and queued work hold a weak reference
    // and do nothing once it is gone.
    std::shared_ptr<char> guard_;
    std::shared_ptr<const SessionContext> context_;
    std::map<std::string, ProxySessionPtr> sessions_;
    // Declared after sessions_ so accepted connections are torn down first.
    std::unique_ptr<network::TcpServer> server_;
};

} // namespace traceproxy
