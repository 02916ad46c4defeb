#include "traceproxy/TcpProxyInstance.h"
#include "traceproxy/network/EventLoopThread.h"
#include "traceproxy/common/Logger.h"

#include "ProxyTestUtil.h"

#include <signal.h>

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace traceproxy;
using namespace testutil;
using traceproxy::network::EventLoop;

static ProxyConfig makeConfig(uint16_t port, const std::vector<uint16_t>& targets, const EchoPolicy& echo) {
    ProxyConfig pc;
    pc.sourcePort = port;
    for (uint16_t p : targets) {
        TargetAddress t;
        t.host = "127.0.0.1";
        t.port = p;
        pc.targets.push_back(t);
    }
    pc.echo = echo;
    pc.displayName = "fanout-test";
    return pc;
}

static Backend::Reply tagged(const std::string& tag) {
    return [tag](const std::string& data) { return tag + data; };
}

struct Harness {
    EventLoop* loop;
    std::unique_ptr<TcpProxyInstance> proxy;
    EntryLog log;

    Harness(EventLoop* l, const ProxyConfig& pc) : loop(l) {
        const auto result = runInLoop(loop, [&]() {
            proxy.reset(new TcpProxyInstance(loop, pc));
            proxy->SetTraceEntryCallback([this](const trace::TraceEntry& e, const trace::TracePtr&) { log.Add(e); });
            return proxy->Start();
        });
        assert(result == TcpProxyInstance::StartResult::kStarted);
    }

    ~Harness() {
        runInLoop(loop, [this]() { proxy.reset(); });
    }

    std::vector<trace::TraceEntry> entries(trace::Direction dir) const {
        std::vector<trace::TraceEntry> out;
        for (const auto& e : log.Snapshot()) {
            if (e.direction == dir) out.push_back(e);
        }
        return out;
    }
};

// Every target gets the chunk; with echo disabled nothing comes back.
static void testEchoDisabled(EventLoop* loop) {
    Backend a(tagged("A:"));
    Backend b(tagged("B:"));
    const auto port = reserveFreeTcpPort();
    assert(port.has_value());
    Harness h(loop, makeConfig(*port, {a.port(), b.port()}, EchoPolicy::Disabled()));

    int fd = connectTo(*port);
    assert(fd >= 0);
    sendAll(fd, "hello");
    assert(waitUntil([&]() { return a.received() == "hello" && b.received() == "hello"; }));
    assert(waitUntil([&]() { return h.log.size() == 4; }));
    assert(recvSome(fd, 300).empty());

    const auto up = h.entries(trace::Direction::kClientToTarget);
    assert(up.size() == 2);
    assert(up[0].targetIndex == 0 && up[1].targetIndex == 1);
    assert(up[0].chunkSend && up[1].chunkSend);
    assert(up[0].session.id == up[1].session.id);

    const auto down = h.entries(trace::Direction::kTargetToClient);
    assert(down.size() == 2);
    for (const auto& e : down) {
        assert(e.chunk && !e.chunkSend && !e.error);
        assert(e.targetIndex == 0);
        assert(*e.chunk == (e.sourceIndex == 0 ? "A:hello" : "B:hello"));
    }

    const auto stats = runInLoop(loop, [&]() { return h.proxy->stats().GetSnapshot(); });
    assert(stats.chunksSend == 2 && stats.bytesSend == 10);
    assert(stats.chunksReceived == 0 && stats.bytesReceived == 0);
    ::close(fd);
}

// Only the selected target answers the client.
static void testEchoIndices(EventLoop* loop) {
    Backend a(tagged("A:"));
    Backend b(tagged("B:"));
    const auto port = reserveFreeTcpPort();
    assert(port.has_value());
    Harness h(loop, makeConfig(*port, {a.port(), b.port()}, EchoPolicy::Indices({1})));

    int fd = connectTo(*port);
    assert(fd >= 0);
    sendAll(fd, "hi");
    assert(recvAtLeast(fd, 4, 3000) == "B:hi");
    assert(waitUntil([&]() { return h.log.size() == 4; }));
    assert(recvSome(fd, 300).empty());

    for (const auto& e : h.entries(trace::Direction::kTargetToClient)) {
        assert(e.chunkSend == (e.sourceIndex == 1));
    }
    ::close(fd);
}

static void testEchoAll(EventLoop* loop) {
    Backend a(tagged("A:"));
    Backend b(tagged("B:"));
    const auto port = reserveFreeTcpPort();
    assert(port.has_value());
    Harness h(loop, makeConfig(*port, {a.port(), b.port()}, EchoPolicy::All()));

    int fd = connectTo(*port);
    assert(fd >= 0);
    sendAll(fd, "x");
    const std::string got = recvAtLeast(fd, 6, 3000);
    assert(got == "A:xB:x" || got == "B:xA:x");
    assert(waitUntil([&]() { return h.log.size() == 4; }));
    const auto stats = runInLoop(loop, [&]() { return h.proxy->stats().GetSnapshot(); });
    assert(stats.chunksReceived == 2 && stats.bytesReceived == 6);
    ::close(fd);
}

// A target that refuses the connection stays inert; the others keep working.
static void testUnreachableTarget(EventLoop* loop) {
    Backend a(tagged("A:"));
    const auto dead = reserveFreeTcpPort();
    const auto port = reserveFreeTcpPort();
    assert(dead.has_value() && port.has_value());
    Harness h(loop, makeConfig(*port, {a.port(), *dead}, EchoPolicy::First()));

    int fd = connectTo(*port);
    assert(fd >= 0);
    sendAll(fd, "data");
    assert(recvAtLeast(fd, 6, 3000) == "A:data");
    assert(waitUntil([&]() { return h.log.size() == 3; }));

    const auto up = h.entries(trace::Direction::kClientToTarget);
    assert(up.size() == 2);
    const auto& live = up[0].targetIndex == 0 ? up[0] : up[1];
    const auto& inert = up[0].targetIndex == 1 ? up[0] : up[1];
    assert(live.chunkSend && !live.error);
    assert(!inert.chunkSend);
    assert(inert.chunk && *inert.chunk == "data");
    assert(inert.error && *inert.error == "target not connected");
    assert(inert.target.port == *dead);

    ::close(fd);
    assert(waitUntil([&]() { return runInLoop(loop, [&]() { return h.proxy->sessionCount(); }) == 0; }));
}

// A refused target ahead of a live one: the live target still gets every chunk, and the
// session winds down once the client leaves.
static void testRefusedTargetFirst(EventLoop* loop) {
    const auto dead = reserveFreeTcpPort();
    Backend b(tagged("B:"));
    const auto port = reserveFreeTcpPort();
    assert(dead.has_value() && port.has_value());
    Harness h(loop, makeConfig(*port, {*dead, b.port()}, EchoPolicy::Indices({1})));

    int fd = connectTo(*port);
    assert(fd >= 0);
    sendAll(fd, "PING");
    assert(recvAtLeast(fd, 6, 3000) == "B:PING");
    assert(b.received() == "PING");

    const auto up = h.entries(trace::Direction::kClientToTarget);
    assert(up.size() == 2);
    for (const auto& e : up) {
        assert(e.chunkSend == (e.targetIndex == 1));
    }

    ::close(fd);
    assert(waitUntil([&]() { return runInLoop(loop, [&]() { return h.proxy->sessionCount(); }) == 0; }));
    assert(waitUntil([&]() { return b.eofs() == 1; }));
}

int main() {
    ::signal(SIGPIPE, SIG_IGN);
    common::Logger::Instance().SetLevel(common::LogLevel::FATAL);

    network::EventLoopThread elt("fanout");
    EventLoop* loop = elt.StartLoop();

    testEchoDisabled(loop);
    testEchoIndices(loop);
    testEchoAll(loop);
    testUnreachableTarget(loop);
    testRefusedTargetFirst(loop);

    std::cout << "test_proxy_fanout passed" << std::endl;
    return 0;
}
