#include "traceproxy/TcpProxyInstance.h"
#include "traceproxy/hooks/HookFactory.h"
#include "traceproxy/network/EventLoopThread.h"
#include "traceproxy/common/Logger.h"

#include "ProxyTestUtil.h"

#include <signal.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

using namespace traceproxy;
using namespace testutil;
using traceproxy::network::EventLoop;

static ProxyConfig makeConfig(uint16_t port, uint16_t targetPort) {
    ProxyConfig pc;
    pc.sourcePort = port;
    TargetAddress t;
    t.host = "127.0.0.1";
    t.port = targetPort;
    pc.targets.push_back(t);
    pc.echo = EchoPolicy::First();
    pc.displayName = "forward-test";
    return pc;
}

static bool looksLikeUuidV4(const std::string& id) {
    if (id.size() != 36) return false;
    for (size_t i : {8u, 13u, 18u, 23u}) {
        if (id[i] != '-') return false;
    }
    return id[14] == '4';
}

// PING goes to the single target, PONG comes back to the client, and both are traced.
static void testPingPong(EventLoop* loop) {
    Backend backend([](const std::string& data) {
        return data.find("PING") != std::string::npos ? std::string("PONG") : std::string();
    });
    assert(backend.port() != 0);
    const auto port = reserveFreeTcpPort();
    assert(port.has_value());

    std::unique_ptr<TcpProxyInstance> proxy;
    EntryLog log;
    const auto result = runInLoop(loop, [&]() {
        proxy.reset(new TcpProxyInstance(loop, makeConfig(*port, backend.port())));
        proxy->SetTraceEntryCallback([&log](const trace::TraceEntry& e, const trace::TracePtr&) { log.Add(e); });
        return proxy->Start();
    });
    assert(result == TcpProxyInstance::StartResult::kStarted);
    trace::TracePtr started = runInLoop(loop, [&]() { return proxy->ToggleTrace(); });
    assert(started && started->empty());

    int fd = connectTo(*port);
    assert(fd >= 0);
    sendAll(fd, "PING");
    assert(recvAtLeast(fd, 4, 3000) == "PONG");
    assert(waitUntil([&]() { return log.size() == 2; }));
    ::close(fd);

    // Client close shuts the target down; the backend closes and the session goes away.
    assert(waitUntil([&]() { return runInLoop(loop, [&]() { return proxy->sessionCount(); }) == 0; }));
    assert(backend.eofs() == 1);

    trace::TracePtr finished = runInLoop(loop, [&]() { return proxy->ToggleTrace(); });
    assert(finished == started);
    const auto entries = finished->Entries();
    assert(entries.size() == 2);

    const trace::TraceEntry& up = entries[0];
    assert(up.direction == trace::Direction::kClientToTarget);
    assert(up.chunk && *up.chunk == "PING");
    assert(up.chunkSend && !up.error);
    assert(up.sourceIndex == 0 && up.targetIndex == 0);
    assert(up.source.addr == "127.0.0.1");
    assert(up.target.port == backend.port());
    assert(looksLikeUuidV4(up.session.id));

    const trace::TraceEntry& down = entries[1];
    assert(down.direction == trace::Direction::kTargetToClient);
    assert(down.chunk && *down.chunk == "PONG");
    assert(down.chunkSend && !down.error);
    assert(down.session.id == up.session.id);
    assert(down.source.port == backend.port());
    assert(down.target.port == up.source.port);

    const auto stats = runInLoop(loop, [&]() { return proxy->stats().GetSnapshot(); });
    assert(stats.bytesSend == 4 && stats.chunksSend == 1);
    assert(stats.bytesReceived == 4 && stats.chunksReceived == 1);
    assert(stats.activeSessions == 0 && stats.totalSessions == 1);
    assert(stats.lastSent && *stats.lastSent->chunk == "PING");
    assert(stats.lastReceived && *stats.lastReceived->chunk == "PONG");

    runInLoop(loop, [&]() { proxy.reset(); });
}

// Chunks starting with 0x00 are dropped before any target sees them, but still traced.
static void testDropPrefix(EventLoop* loop) {
    Backend backend;
    assert(backend.port() != 0);
    const auto port = reserveFreeTcpPort();
    assert(port.has_value());

    ProxyConfig pc = makeConfig(*port, backend.port());
    pc.chunkHandler.module = "builtin:drop-prefix";
    pc.chunkHandler.options["byte"] = "0x00";
    hooks::HookFactory factory(nullptr);
    ProxyHooks hooks;
    std::string err;
    assert(TcpProxyInstance::ResolveHooks(pc, factory, &hooks, &err));

    std::unique_ptr<TcpProxyInstance> proxy;
    EntryLog log;
    const auto result = runInLoop(loop, [&]() {
        proxy.reset(new TcpProxyInstance(loop, pc, hooks));
        proxy->SetTraceEntryCallback([&log](const trace::TraceEntry& e, const trace::TracePtr&) { log.Add(e); });
        return proxy->Start();
    });
    assert(result == TcpProxyInstance::StartResult::kStarted);

    int fd = connectTo(*port);
    assert(fd >= 0);
    sendAll(fd, std::string("\x00keepalive", 10));
    assert(waitUntil([&]() { return log.size() == 1; }));
    sendAll(fd, "payload");
    assert(waitUntil([&]() { return backend.received() == "payload"; }));
    assert(waitUntil([&]() { return log.size() == 2; }));

    const auto entries = log.Snapshot();
    assert(!entries[0].chunk);
    assert(!entries[0].chunkSend);
    assert(!entries[0].error);
    assert(entries[1].chunk && *entries[1].chunk == "payload");
    assert(entries[1].chunkSend);

    const auto dropped = runInLoop(loop, [&]() { return proxy->chunkHandlerState(); });
    assert(dropped.at("dropped") == "1");
    const auto stats = runInLoop(loop, [&]() { return proxy->stats().GetSnapshot(); });
    assert(stats.chunksSend == 1 && stats.bytesSend == 7);

    ::close(fd);
    runInLoop(loop, [&]() { proxy.reset(); });
}

int main() {
    ::signal(SIGPIPE, SIG_IGN);
    common::Logger::Instance().SetLevel(common::LogLevel::ERROR);

    network::EventLoopThread elt("proxy");
    EventLoop* loop = elt.StartLoop();

    testPingPong(loop);
    testDropPrefix(loop);

    std::cout << "test_proxy_forward passed" << std::endl;
    return 0;
}
