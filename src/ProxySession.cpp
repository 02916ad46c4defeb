#include "traceproxy/ProxySession.h"
#include "traceproxy/common/Logger.h"
#include "traceproxy/common/Uuid.h"
#include "traceproxy/network/EventLoop.h"

#include <cstring>

namespace traceproxy {

using network::Buffer;
using network::TcpConnectionPtr;

namespace {

std::string WriteError(const TcpConnectionPtr& conn) {
    if (!conn->lastError().empty()) return conn->lastError();
    return conn->connected() ? "write failed" : "connection not writable";
}

} // namespace

ProxySession::ProxySession(std::shared_ptr<const SessionContext> ctx, const TcpConnectionPtr& client)
    : ctx_(std::move(ctx)),
      client_(client),
      clientAddr_{client->peerAddress().toIp(), client->peerAddress().toPort()},
      info_{common::GenerateUuidV4(), trace::NowMs()},
      pendingTargets_(0),
      blockedTargets_(0),
      clientBlocked_(false),
      clientClosed_(false),
      finished_(false) {}

ProxySession::~ProxySession() {
    LOG_DEBUG << "ProxySession " << info_.id << " destroyed";
}

void ProxySession::Start() {
    std::weak_ptr<ProxySession> weakSelf(shared_from_this());

    client_->SetOutputPressureCallback(
        [weakSelf](const TcpConnectionPtr&, bool congested) {
            auto s = weakSelf.lock();
            if (!s) return;
            if (congested) {
                s->OnClientHighWater();
            } else {
                s->OnClientDrained();
            }
        },
        ctx_->highWaterMark);

    legs_.resize(ctx_->targets.size());
    for (size_t i = 0; i < ctx_->targets.size(); ++i) {
        const SessionTarget& t = ctx_->targets[i];
        TargetLeg& leg = legs_[i];
        leg.index = t.index;
        leg.address = trace::SocketAddress{t.config.host, t.config.port};

        if (!t.resolved) {
            leg.state = LegState::kFailed;
            leg.settled = true;
            leg.error = "cannot resolve " + t.config.host;
            LOG_ERROR << "session " << info_.id << ": target [" << t.index << "] " << leg.error;
            continue;
        }

        const int index = static_cast<int>(i);
        leg.client.reset(new network::TcpClient(ctx_->loop, t.addr, "target-" + std::to_string(t.index)));
        leg.client->SetConnectionCallback([weakSelf, index](const TcpConnectionPtr& conn) {
            if (auto s = weakSelf.lock()) s->OnTargetConnection(index, conn);
        });
        leg.client->SetMessageCallback(
            [weakSelf, index](const TcpConnectionPtr&, Buffer* buf) {
                if (auto s = weakSelf.lock()) s->OnTargetMessage(index, buf);
            });
        leg.client->SetPeerHalfCloseCallback([weakSelf, index](const TcpConnectionPtr& conn) {
            if (auto s = weakSelf.lock()) s->OnTargetHalfClose(index, conn);
        });
        leg.client->SetConnectFailedCallback([weakSelf, index](int err) {
            if (auto s = weakSelf.lock()) s->OnTargetConnectFailed(index, err);
        });
        ++pendingTargets_;
    }

    UpdateClientRead();
    for (auto& leg : legs_) {
        if (leg.client) leg.client->Connect();
    }
}

size_t ProxySession::connectedTargets() const {
    size_t n = 0;
    for (const auto& leg : legs_) {
        if (leg.state == LegState::kConnected) ++n;
    }
    return n;
}

void ProxySession::OnClientMessage(Buffer* buf) {
    const std::string chunk = buf->RetrieveAllAsString();
    const std::optional<std::string> out = Transform(chunk);

    for (auto& leg : legs_) {
        trace::TraceEntry entry = MakeEntry(trace::Direction::kClientToTarget, clientAddr_, 0, leg.address, leg.index);
        if (out) {
            entry.chunk = out;
            if (leg.state == LegState::kConnected && leg.conn) {
                entry.chunkSend = leg.conn->Send(*out);
                if (!entry.chunkSend) entry.error = WriteError(leg.conn);
            } else {
                entry.error = "target not connected";
            }
        }
        ctx_->record(entry);
    }
}

void ProxySession::OnClientHalfClose() {
    LOG_DEBUG << "session " << info_.id << ": client finished sending";
    client_->Shutdown();
}

void ProxySession::OnClientClosed() {
    if (clientClosed_) return;
    clientClosed_ = true;
    LOG_DEBUG << "session " << info_.id << ": client closed";
    for (auto& leg : legs_) {
        if (leg.state == LegState::kConnected && leg.conn) {
            leg.conn->Shutdown();
        }
    }
    MaybeFinish();
}

void ProxySession::OnTargetConnection(int index, const TcpConnectionPtr& conn) {
    TargetLeg& leg = legs_[index];
    if (conn->connected()) {
        LOG_DEBUG << "session " << info_.id << ": target [" << leg.index << "] connected to "
                  << conn->peerAddress().toIpPort();
        leg.conn = conn;
        leg.state = LegState::kConnected;

        std::weak_ptr<ProxySession> weakSelf(shared_from_this());
        conn->SetOutputPressureCallback(
            [weakSelf, index](const TcpConnectionPtr&, bool congested) {
                auto s = weakSelf.lock();
                if (!s) return;
                if (congested) {
                    s->OnTargetHighWater(index);
                } else {
                    s->OnTargetDrained(index);
                }
            },
            ctx_->highWaterMark);

        if (clientBlocked_) conn->StopRead();
        if (clientClosed_) conn->Shutdown();
        Settle(leg);
    } else {
        LOG_DEBUG << "session " << info_.id << ": target [" << leg.index << "] closed";
        leg.conn.reset();
        leg.state = LegState::kClosed;
        if (leg.writeBlocked) {
            leg.writeBlocked = false;
            --blockedTargets_;
        }
        Settle(leg);
        UpdateClientRead();
        MaybeFinish();
    }
}

void ProxySession::OnTargetConnectFailed(int index, int err) {
    TargetLeg& leg = legs_[index];
    leg.state = LegState::kFailed;
    leg.error = std::strerror(err);
    LOG_ERROR << "session " << info_.id << ": target [" << leg.index << "] " << leg.address.ToString()
              << " connect failed: " << leg.error;
    Settle(leg);
    MaybeFinish();
}

void ProxySession::OnTargetMessage(int index, Buffer* buf) {
    const TargetLeg& leg = legs_[index];
    const std::string chunk = buf->RetrieveAllAsString();
    const std::optional<std::string> out = Transform(chunk);

    trace::TraceEntry entry = MakeEntry(trace::Direction::kTargetToClient, leg.address, leg.index, clientAddr_, 0);
    entry.chunk = out;
    if (out && ctx_->echo.Includes(leg.index)) {
        entry.chunkSend = client_->Send(*out);
        if (!entry.chunkSend) entry.error = WriteError(client_);
    }
    ctx_->record(entry);
}

// End-of-stream from one target closes that target only.
void ProxySession::OnTargetHalfClose(int index, const TcpConnectionPtr& conn) {
    LOG_DEBUG << "session " << info_.id << ": target [" << legs_[index].index << "] finished sending";
    conn->Shutdown();
}

void ProxySession::OnClientHighWater() {
    if (clientBlocked_) return;
    clientBlocked_ = true;
    for (auto& leg : legs_) {
        if (leg.conn) leg.conn->StopRead();
    }
}

void ProxySession::OnClientDrained() {
    if (!clientBlocked_) return;
    clientBlocked_ = false;
    for (auto& leg : legs_) {
        if (leg.conn) leg.conn->StartRead();
    }
}

void ProxySession::OnTargetHighWater(int index) {
    TargetLeg& leg = legs_[index];
    if (leg.writeBlocked) return;
    leg.writeBlocked = true;
    ++blockedTargets_;
    UpdateClientRead();
}

void ProxySession::OnTargetDrained(int index) {
    TargetLeg& leg = legs_[index];
    if (!leg.writeBlocked) return;
    leg.writeBlocked = false;
    --blockedTargets_;
    UpdateClientRead();
}

void ProxySession::Settle(TargetLeg& leg) {
    if (leg.settled) return;
    leg.settled = true;
    --pendingTargets_;
    UpdateClientRead();
}

// Client reads run only once every target has settled and none is over its high-water mark.
void ProxySession::UpdateClientRead() {
    if (clientClosed_ || client_->peerClosed()) return;
    if (pendingTargets_ == 0 && blockedTargets_ == 0) {
        client_->StartRead();
    } else {
        client_->StopRead();
    }
}

void ProxySession::MaybeFinish() {
    if (finished_ || !clientClosed_) return;
    for (const auto& leg : legs_) {
        if (leg.state == LegState::kConnecting || leg.state == LegState::kConnected) return;
    }
    finished_ = true;
    LOG_DEBUG << "session " << info_.id << " finished";
    if (ctx_->finished) ctx_->finished(info_.id);
}

trace::TraceEntry ProxySession::MakeEntry(trace::Direction direction,
                                          const trace::SocketAddress& source, int sourceIndex,
                                          const trace::SocketAddress& target, int targetIndex) const {
    trace::TraceEntry entry;
    entry.direction = direction;
    entry.session = info_;
    entry.source = source;
    entry.sourceIndex = sourceIndex;
    entry.target = target;
    entry.targetIndex = targetIndex;
    entry.time = trace::NowMs();
    return entry;
}

std::optional<std::string> ProxySession::Transform(const std::string& chunk) const {
    if (!ctx_->transform) return chunk;
    return ctx_->transform(chunk);
}

} // namespace traceproxy
