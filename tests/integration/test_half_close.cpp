#include "traceproxy/TcpProxyInstance.h"
#include "traceproxy/network/EventLoopThread.h"
#include "traceproxy/common/Logger.h"

#include "ProxyTestUtil.h"

#include <signal.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

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
    pc.displayName = "half-close-test";
    return pc;
}

// Client sends and shuts down its write side: the target sees the data then EOF, the client
// sees EOF, and a reply that comes too late is traced as undeliverable.
static void testClientHalfClose(EventLoop* loop) {
    Backend backend([](const std::string& data) {
        // Answer after the proxy had time to close the client side.
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        return "late:" + data;
    });
    const auto port = reserveFreeTcpPort();
    assert(port.has_value());

    std::unique_ptr<TcpProxyInstance> proxy;
    EntryLog log;
    runInLoop(loop, [&]() {
        proxy.reset(new TcpProxyInstance(loop, makeConfig(*port, backend.port())));
        proxy->SetTraceEntryCallback([&log](const trace::TraceEntry& e, const trace::TracePtr&) { log.Add(e); });
        return proxy->Start();
    });

    int fd = connectTo(*port);
    assert(fd >= 0);
    sendAll(fd, "bye");
    assert(waitUntil([&]() { return backend.received() == "bye"; }));
    ::shutdown(fd, SHUT_WR);

    assert(waitEof(fd, 3000));
    assert(waitUntil([&]() { return backend.eofs() == 1; }));
    assert(waitUntil([&]() { return runInLoop(loop, [&]() { return proxy->sessionCount(); }) == 0; }));

    const auto entries = log.Snapshot();
    assert(!entries.empty());
    assert(entries[0].direction == trace::Direction::kClientToTarget);
    assert(entries[0].chunkSend);
    for (size_t i = 1; i < entries.size(); ++i) {
        const auto& e = entries[i];
        assert(e.direction == trace::Direction::kTargetToClient);
        assert(e.chunk && *e.chunk == "late:bye");
        assert(!e.chunkSend && e.error);
    }
    const auto stats = runInLoop(loop, [&]() { return proxy->stats().GetSnapshot(); });
    assert(stats.chunksReceived == 0);
    assert(stats.activeSessions == 0 && stats.totalSessions == 1);

    ::close(fd);
    runInLoop(loop, [&]() { proxy.reset(); });
}

// A target that finishes sending closes its own leg only; the client stays connected.
static void testTargetHalfClose(EventLoop* loop) {
    Backend backend(Backend::Reply(), [](int cfd) {
        sendAll(cfd, "HELLO");
        ::shutdown(cfd, SHUT_WR);
    });
    const auto port = reserveFreeTcpPort();
    assert(port.has_value());

    std::unique_ptr<TcpProxyInstance> proxy;
    EntryLog log;
    runInLoop(loop, [&]() {
        proxy.reset(new TcpProxyInstance(loop, makeConfig(*port, backend.port())));
        proxy->SetTraceEntryCallback([&log](const trace::TraceEntry& e, const trace::TracePtr&) { log.Add(e); });
        return proxy->Start();
    });

    int fd = connectTo(*port);
    assert(fd >= 0);
    assert(recvAtLeast(fd, 5, 3000) == "HELLO");
    assert(waitUntil([&]() { return backend.eofs() == 1; }));

    // The leg is gone once the backend closed its socket in response to our FIN.
    assert(waitUntil([&]() {
        sendAll(fd, "x");
        const auto entries = log.Snapshot();
        return !entries.empty() && entries.back().error && *entries.back().error == "target not connected";
    }));

    // The client connection is still open.
    assert(recvSome(fd, 200).empty());
    assert(runInLoop(loop, [&]() { return proxy->sessionCount(); }) == 1);

    ::close(fd);
    assert(waitUntil([&]() { return runInLoop(loop, [&]() { return proxy->sessionCount(); }) == 0; }));
    runInLoop(loop, [&]() { proxy.reset(); });
}

int main() {
    ::signal(SIGPIPE, SIG_IGN);
    common::Logger::Instance().SetLevel(common::LogLevel::FATAL);

    network::EventLoopThread elt("half-close");
    EventLoop* loop = elt.StartLoop();

    testClientHalfClose(loop);
    testTargetHalfClose(loop);

    std::cout << "test_half_close passed" << std::endl;
    return 0;
}
