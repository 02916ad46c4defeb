#pragma once

#include "traceproxy/ProxyConfig.h"
#include "traceproxy/TcpProxyInstance.h"
#include "traceproxy/common/PluginManager.h"
#include "traceproxy/common/noncopyable.h"
#include "traceproxy/hooks/HookFactory.h"

#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace traceproxy {

namespace common {
class Config;
}

namespace network {
class EventLoop;
}

// The set of configured proxies and the start/stop/trace commands over them.
// Port lists select proxies by source port; an empty list selects all of them.
class ProxyController : traceproxy::common::noncopyable {
public:
    using TraceResult = std::pair<TcpProxyInstance*, trace::TracePtr>;

    explicit ProxyController(network::EventLoop* loop);
    ~ProxyController();

    // Creates one instance per valid [proxy:<port>] section. Entries whose hooks cannot be
    // resolved are skipped. Returns the number of instances created.
    size_t Configure(const common::Config& conf, std::vector<std::string>* errors = nullptr);
    TcpProxyInstance* Add(ProxyConfig config, std::string* err = nullptr);

    void SetGlobalOptions(const GlobalOptions& global) { global_ = global; }
    const GlobalOptions& globalOptions() const { return global_; }
    // Finished traces go here when open_after_trace is set. Defaults to stdout.
    void SetTraceOutput(std::ostream* out) { traceOut_ = out; }

    std::vector<TcpProxyInstance*> instances() const;
    TcpProxyInstance* Find(uint16_t port) const;

    size_t Start(const std::vector<uint16_t>& ports = {});
    // Starts the auto_start proxies, or every proxy when none is marked.
    size_t StartConfigured();
    size_t Stop(const std::vector<uint16_t>& ports = {});
    std::vector<TraceResult> ToggleTrace(const std::vector<uint16_t>& ports = {});

    std::string StatsReport() const;

private:
    std::vector<TcpProxyInstance*> Select(const std::vector<uint16_t>& ports) const;
    void PublishTrace(const TcpProxyInstance& instance, const trace::TracePtr& trace);

    network::EventLoop* loop_;
    GlobalOptions global_;
    std::ostream* traceOut_;
    common::PluginManager plugins_;
    hooks::HookFactory factory_;
    std::vector<std::unique_ptr<TcpProxyInstance>> instances_;
};

} // namespace traceproxy
