#include "traceproxy/TcpProxyInstance.h"
#include "traceproxy/common/Logger.h"
#include "traceproxy/hooks/HookFactory.h"
#include "traceproxy/network/EventLoop.h"
#include "traceproxy/network/InetAddress.h"
#include "traceproxy/trace/TraceRenderer.h"

#include <any>
#include <sstream>

namespace traceproxy {

using network::TcpConnectionPtr;

namespace {

template <typename Interface, typename CreateFn>
bool ResolveHook(const HookSpec& spec, CreateFn create, hooks::Hook<Interface>* out, std::string* err) {
    if (spec.empty()) return true;
    out->impl = create(spec.module, err);
    if (!out->impl) return false;
    out->options = spec.options;
    out->state = hooks::HookStateCell(spec.initialState);
    return true;
}

std::string TargetsToString(const std::vector<TargetAddress>& targets) {
    std::ostringstream os;
    for (size_t i = 0; i < targets.size(); ++i) {
        if (i) os << ", ";
        os << "[" << i << "] " << targets[i].ToString();
    }
    return os.str();
}

} // namespace

TcpProxyInstance::TcpProxyInstance(network::EventLoop* loop, ProxyConfig config, ProxyHooks hooks)
    : loop_(loop),
      config_(std::move(config)),
      hooks_(std::move(hooks)),
      running_(false),
      guard_(std::make_shared<char>(0)),
      server_(new network::TcpServer(loop, network::InetAddress(config_.sourcePort),
                                     "proxy-" + std::to_string(config_.sourcePort))) {
    if (config_.displayName.empty()) {
        config_.displayName = config_.name.empty() ? "Proxy (" + std::to_string(config_.sourcePort) + ")"
                                                   : config_.name;
    }
    hooks_.writer.options.emplace("name", config_.displayName);
    hooks_.writer.options.emplace("hex_width", std::to_string(config_.hexWidth));

    server_->SetConnectionCallback([this](const TcpConnectionPtr& conn) { OnConnection(conn); });
    server_->SetMessageCallback([this](const TcpConnectionPtr& conn, network::Buffer* buf) { OnMessage(conn, buf); });
    server_->SetPeerHalfCloseCallback([this](const TcpConnectionPtr& conn) { OnClientHalfClose(conn); });

    recorder_.AddListener([this](const trace::TraceEntry& entry, const trace::TracePtr& traceSoFar) {
        OnEntry(entry, traceSoFar);
    });
}

TcpProxyInstance::~TcpProxyInstance() {
    guard_.reset();
    LOG_DEBUG << "TcpProxyInstance " << config_.displayName << " destroyed, " << sessions_.size()
              << " sessions left";
}

bool TcpProxyInstance::ResolveHooks(const ProxyConfig& config, hooks::HookFactory& factory,
                                    ProxyHooks* out, std::string* err) {
    ProxyHooks h;
    if (!ResolveHook(config.chunkHandler,
                     [&factory](const std::string& id, std::string* e) { return factory.CreateChunkTransform(id, e); },
                     &h.chunk, err) ||
        !ResolveHook(config.traceHandler,
                     [&factory](const std::string& id, std::string* e) { return factory.CreateTraceObserver(id, e); },
                     &h.observer, err) ||
        !ResolveHook(config.traceWriter,
                     [&factory](const std::string& id, std::string* e) { return factory.CreateTraceWriter(id, e); },
                     &h.writer, err)) {
        return false;
    }
    *out = std::move(h);
    return true;
}

TcpProxyInstance::StartResult TcpProxyInstance::Start() {
    if (running_) {
        LOG_WARN << config_.displayName << " is already running";
        return StartResult::kAlreadyRunning;
    }

    std::shared_ptr<SessionContext> ctx = MakeSessionContext();

    std::string err;
    if (!server_->Start(&err)) {
        lastError_ = err;
        LOG_ERROR << config_.displayName << " failed to start: " << err;
        return StartResult::kBindFailed;
    }
    lastError_.clear();

    context_ = ctx;
    stats_.Reset();
    hooks_.chunk.state.Reset();
    hooks_.observer.state.Reset();
    hooks_.writer.state.Reset();
    running_ = true;

    LOG_INFO << config_.displayName << " listening on " << server_->hostport() << " -> "
             << TargetsToString(config_.targets) << " (echo " << config_.echo.ToString() << ")";
    return StartResult::kStarted;
}

bool TcpProxyInstance::Stop() {
    if (!running_) {
        return false;
    }
    server_->Stop();
    running_ = false;
    hooks_.chunk.state.Clear();
    hooks_.observer.state.Clear();
    hooks_.writer.state.Clear();
    LOG_INFO << config_.displayName << " stopped, " << sessions_.size() << " sessions draining";
    return true;
}

trace::TracePtr TcpProxyInstance::ToggleTrace() {
    if (!recorder_.active()) {
        trace::TracePtr t = recorder_.Begin();
        LOG_INFO << config_.displayName << ": trace started";
        return t;
    }

    trace::TracePtr t = recorder_.End();
    LOG_INFO << config_.displayName << ": trace stopped with " << t->size() << " entries";
    if (hooks_.writer) {
        try {
            if (!hooks_.writer.impl->WriteTrace(t->Entries(), hooks_.writer.options, hooks_.writer.state.state())) {
                LOG_ERROR << config_.displayName << ": trace writer failed";
            }
        } catch (const std::exception& e) {
            LOG_ERROR << config_.displayName << ": trace writer threw: " << e.what();
        }
    }
    return t;
}

std::shared_ptr<SessionContext> TcpProxyInstance::MakeSessionContext() {
    auto ctx = std::make_shared<SessionContext>();
    ctx->loop = loop_;
    ctx->echo = config_.echo;
    for (size_t i = 0; i < config_.targets.size(); ++i) {
        SessionTarget t;
        t.index = static_cast<int>(i);
        t.config = config_.targets[i];
        t.resolved = network::InetAddress::Resolve(t.config.host, t.config.port, &t.addr);
        if (!t.resolved) {
            LOG_WARN << config_.displayName << ": cannot resolve target " << t.config.ToString();
        }
        ctx->targets.push_back(t);
    }
    std::weak_ptr<char> guard(guard_);
    if (hooks_.chunk) {
        ctx->transform = [this, guard](const std::string& chunk) -> std::optional<std::string> {
            if (!guard.lock()) return chunk;
            return ApplyChunkHook(chunk);
        };
    }
    ctx->record = [this, guard](const trace::TraceEntry& entry) {
        if (!guard.lock()) return;
        stats_.Record(entry);
        recorder_.Record(entry);
    };
    ctx->finished = [this, guard](const std::string& id) {
        if (guard.lock()) OnSessionFinished(id);
    };
    return ctx;
}

std::optional<std::string> TcpProxyInstance::ApplyChunkHook(const std::string& chunk) {
    try {
        return hooks_.chunk.impl->HandleChunk(chunk, hooks_.chunk.state.state(), hooks_.chunk.options);
    } catch (const std::exception& e) {
        LOG_ERROR << config_.displayName << ": chunk handler threw, dropping chunk: " << e.what();
        return std::nullopt;
    }
}

ProxySessionPtr TcpProxyInstance::SessionOf(const TcpConnectionPtr& conn) {
    const auto* weak = std::any_cast<std::weak_ptr<ProxySession>>(&conn->GetContext());
    return weak ? weak->lock() : nullptr;
}

void TcpProxyInstance::OnConnection(const TcpConnectionPtr& conn) {
    if (!conn->connected()) {
        if (auto session = SessionOf(conn)) {
            session->OnClientClosed();
        }
        return;
    }

    if (!context_) {
        conn->ForceClose();
        return;
    }

    ProxySessionPtr session;
    try {
        session = std::make_shared<ProxySession>(context_, conn);
    } catch (const std::exception& e) {
        LOG_ERROR << config_.displayName << ": cannot create session for " << conn->peerAddress().toIpPort()
                  << ": " << e.what();
        conn->ForceClose();
        return;
    }

    conn->SetContext(std::weak_ptr<ProxySession>(session));
    sessions_[session->id()] = session;
    stats_.IncActiveSessions();
    LOG_INFO << config_.displayName << ": session " << session->id() << " from "
             << conn->peerAddress().toIpPort();
    session->Start();
}

void TcpProxyInstance::OnMessage(const TcpConnectionPtr& conn, network::Buffer* buf) {
    if (auto session = SessionOf(conn)) {
        session->OnClientMessage(buf);
    } else {
        buf->RetrieveAll();
    }
}

void TcpProxyInstance::OnClientHalfClose(const TcpConnectionPtr& conn) {
    if (auto session = SessionOf(conn)) {
        session->OnClientHalfClose();
    } else {
        conn->Shutdown();
    }
}

void TcpProxyInstance::OnEntry(const trace::TraceEntry& entry, const trace::TracePtr& traceSoFar) {
    if (hooks_.observer) {
        try {
            hooks_.observer.impl->HandleTrace(entry, traceSoFar, hooks_.observer.options,
                                              hooks_.observer.state.state());
        } catch (const std::exception& e) {
            LOG_ERROR << config_.displayName << ": trace handler threw: " << e.what();
        }
    }
    if (config_.writeToOutput && traceSoFar) {
        LOG_INFO << "\n" << trace::TraceRenderer::EntryToText(entry, config_.displayName, config_.hexWidth);
    }
    if (entryCallback_) {
        entryCallback_(entry, traceSoFar);
    }
}

void TcpProxyInstance::OnSessionFinished(const std::string& sessionId) {
    stats_.DecActiveSessions();
    LOG_INFO << config_.displayName << ": session " << sessionId << " closed";
    // The session is still on the call stack. The instance may be gone by the time this runs.
    std::weak_ptr<char> guard(guard_);
    loop_->QueueInLoop([this, guard, sessionId]() {
        if (guard.lock()) sessions_.erase(sessionId);
    });
}

} // namespace traceproxy
