#include "traceproxy/ProxyController.h"
#include "traceproxy/common/Config.h"
#include "traceproxy/common/Logger.h"
#include "traceproxy/trace/TraceRenderer.h"

#include <fstream>
#include <iostream>
#include <sstream>

namespace traceproxy {

namespace {

const char* FileExtension(trace::OutputFormat format) {
    switch (format) {
        case trace::OutputFormat::kJson: return "json";
        case trace::OutputFormat::kHttp: return "http";
        case trace::OutputFormat::kAscii:
        case trace::OutputFormat::kText: return "txt";
    }
    return "txt";
}

} // namespace

ProxyController::ProxyController(network::EventLoop* loop)
    : loop_(loop),
      traceOut_(&std::cout),
      factory_(&plugins_) {}

ProxyController::~ProxyController() {
    // Instances hold hooks that may live in plugins; drop them before unloading.
    instances_.clear();
    plugins_.UnloadAll();
}

size_t ProxyController::Configure(const common::Config& conf, std::vector<std::string>* errors) {
    global_ = ParseGlobalOptions(conf);
    size_t created = 0;
    for (auto& pc : ParseProxyConfigs(conf, errors)) {
        const std::string name = pc.displayName;
        std::string err;
        if (Add(std::move(pc), &err)) {
            ++created;
        } else if (errors) {
            errors->push_back(name + " skipped: " + err);
        }
    }
    return created;
}

TcpProxyInstance* ProxyController::Add(ProxyConfig config, std::string* err) {
    if (Find(config.sourcePort)) {
        const std::string msg = "port " + std::to_string(config.sourcePort) + " already configured";
        LOG_WARN << msg;
        if (err) *err = msg;
        return nullptr;
    }

    ProxyHooks hooks;
    std::string hookErr;
    if (!TcpProxyInstance::ResolveHooks(config, factory_, &hooks, &hookErr)) {
        LOG_ERROR << config.displayName << " skipped: " << hookErr;
        if (err) *err = hookErr;
        return nullptr;
    }
    instances_.emplace_back(new TcpProxyInstance(loop_, std::move(config), std::move(hooks)));
    return instances_.back().get();
}

std::vector<TcpProxyInstance*> ProxyController::instances() const {
    std::vector<TcpProxyInstance*> out;
    out.reserve(instances_.size());
    for (const auto& p : instances_) out.push_back(p.get());
    return out;
}

TcpProxyInstance* ProxyController::Find(uint16_t port) const {
    for (const auto& p : instances_) {
        if (p->port() == port) return p.get();
    }
    return nullptr;
}

std::vector<TcpProxyInstance*> ProxyController::Select(const std::vector<uint16_t>& ports) const {
    if (ports.empty()) return instances();
    std::vector<TcpProxyInstance*> out;
    for (uint16_t port : ports) {
        if (TcpProxyInstance* p = Find(port)) {
            out.push_back(p);
        } else {
            LOG_WARN << "no proxy configured on port " << port;
        }
    }
    return out;
}

size_t ProxyController::Start(const std::vector<uint16_t>& ports) {
    size_t started = 0;
    for (TcpProxyInstance* p : Select(ports)) {
        if (p->Start() == TcpProxyInstance::StartResult::kStarted) ++started;
    }
    return started;
}

size_t ProxyController::StartConfigured() {
    std::vector<uint16_t> ports;
    for (const auto& p : instances_) {
        if (p->config().autoStart) ports.push_back(p->port());
    }
    if (ports.empty()) return Start();
    return Start(ports);
}

size_t ProxyController::Stop(const std::vector<uint16_t>& ports) {
    size_t stopped = 0;
    for (TcpProxyInstance* p : Select(ports)) {
        if (p->Stop()) ++stopped;
    }
    return stopped;
}

std::vector<ProxyController::TraceResult> ProxyController::ToggleTrace(const std::vector<uint16_t>& ports) {
    std::vector<TraceResult> out;
    for (TcpProxyInstance* p : Select(ports)) {
        trace::TracePtr t = p->ToggleTrace();
        if (!p->tracing()) {
            PublishTrace(*p, t);
        }
        out.emplace_back(p, t);
    }
    return out;
}

void ProxyController::PublishTrace(const TcpProxyInstance& instance, const trace::TracePtr& trace) {
    if (!trace || trace->empty()) {
        LOG_INFO << instance.displayName() << ": trace is empty, nothing to show";
        return;
    }
    const ProxyConfig& cfg = instance.config();
    const std::string rendered =
        trace::TraceRenderer::Render(trace->Entries(), cfg.outputFormat, cfg.displayName, cfg.hexWidth);

    if (cfg.openAfterTrace && traceOut_) {
        *traceOut_ << rendered << std::endl;
    }
    if (!global_.traceDir.empty()) {
        std::ostringstream path;
        path << global_.traceDir << "/trace-" << cfg.sourcePort << "-" << trace::ToUnixMs(trace->startedAt())
             << "." << FileExtension(cfg.outputFormat);
        std::ofstream out(path.str(), std::ios::binary | std::ios::trunc);
        if (!out || !(out << rendered)) {
            LOG_ERROR << instance.displayName() << ": cannot write trace to " << path.str();
            return;
        }
        LOG_INFO << instance.displayName() << ": trace written to " << path.str();
    }
}

std::string ProxyController::StatsReport() const {
    std::ostringstream os;
    for (const auto& p : instances_) {
        os << p->displayName() << " [" << (p->running() ? "running" : "stopped")
           << (p->tracing() ? ", tracing" : "") << ", sessions=" << p->sessionCount() << "] "
           << p->stats().ToJson() << "\n";
    }
    return os.str();
}

} // namespace traceproxy
