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
    pc.displayName = "lifecycle-test";
    return pc;
}

static Backend::Reply echoBack() {
    return [](const std::string& data) { return data; };
}

static void testStartStopRestart(EventLoop* loop) {
    Backend backend(echoBack());
    const auto port = reserveFreeTcpPort();
    assert(port.has_value());

    std::unique_ptr<TcpProxyInstance> proxy;
    const auto first = runInLoop(loop, [&]() {
        proxy.reset(new TcpProxyInstance(loop, makeConfig(*port, backend.port())));
        return proxy->Start();
    });
    assert(first == TcpProxyInstance::StartResult::kStarted);
    assert(runInLoop(loop, [&]() { return proxy->Start(); }) == TcpProxyInstance::StartResult::kAlreadyRunning);
    assert(runInLoop(loop, [&]() { return proxy->running(); }));

    int fd = connectTo(*port);
    assert(fd >= 0);
    sendAll(fd, "one");
    assert(recvAtLeast(fd, 3, 3000) == "one");
    ::close(fd);
    assert(waitUntil([&]() { return runInLoop(loop, [&]() { return proxy->sessionCount(); }) == 0; }));

    assert(runInLoop(loop, [&]() { return proxy->Stop(); }));
    assert(!runInLoop(loop, [&]() { return proxy->Stop(); }));
    assert(!runInLoop(loop, [&]() { return proxy->running(); }));
    assert(connectTo(*port) < 0);

    // Restart on the same port; counters start over.
    assert(runInLoop(loop, [&]() { return proxy->Start(); }) == TcpProxyInstance::StartResult::kStarted);
    const auto fresh = runInLoop(loop, [&]() { return proxy->stats().GetSnapshot(); });
    assert(fresh.chunksSend == 0 && fresh.bytesSend == 0 && fresh.chunksReceived == 0);
    assert(!fresh.lastSent && !fresh.lastReceived);

    fd = connectTo(*port);
    assert(fd >= 0);
    sendAll(fd, "two");
    assert(recvAtLeast(fd, 3, 3000) == "two");
    ::close(fd);

    runInLoop(loop, [&]() { proxy.reset(); });
}

static void testBindFailure(EventLoop* loop) {
    int holder = -1;
    const auto port = bindEphemeralTcpPort(&holder);
    assert(port.has_value());

    std::unique_ptr<TcpProxyInstance> proxy;
    const auto result = runInLoop(loop, [&]() {
        proxy.reset(new TcpProxyInstance(loop, makeConfig(*port, 1)));
        return proxy->Start();
    });
    assert(result == TcpProxyInstance::StartResult::kBindFailed);
    const std::string err = runInLoop(loop, [&]() { return proxy->LastError(); });
    assert(err.find("bind") != std::string::npos);
    assert(!runInLoop(loop, [&]() { return proxy->running(); }));

    // Once the port is free the same instance can start.
    ::close(holder);
    assert(runInLoop(loop, [&]() { return proxy->Start(); }) == TcpProxyInstance::StartResult::kStarted);
    assert(runInLoop(loop, [&]() { return proxy->LastError(); }).empty());

    runInLoop(loop, [&]() { proxy.reset(); });
}

// Hook state starts from the configured initial state and is cleared on stop.
static void testHookStateLifecycle(EventLoop* loop) {
    Backend backend(echoBack());
    const auto port = reserveFreeTcpPort();
    assert(port.has_value());

    ProxyConfig pc = makeConfig(*port, backend.port());
    pc.chunkHandler.module = "builtin:drop-prefix";
    pc.chunkHandler.initialState["dropped"] = "5";

    hooks::HookFactory factory(nullptr);
    ProxyHooks hooks;
    std::string err;
    assert(TcpProxyInstance::ResolveHooks(pc, factory, &hooks, &err));

    std::unique_ptr<TcpProxyInstance> proxy;
    runInLoop(loop, [&]() {
        proxy.reset(new TcpProxyInstance(loop, pc, hooks));
        return proxy->Start();
    });
    auto state = runInLoop(loop, [&]() { return proxy->chunkHandlerState(); });
    assert(state.at("dropped") == "5");

    int fd = connectTo(*port);
    assert(fd >= 0);
    sendAll(fd, std::string("\0x", 2));
    assert(waitUntil([&]() {
        return runInLoop(loop, [&]() { return proxy->chunkHandlerState(); }).at("dropped") == "6";
    }));
    ::close(fd);

    assert(runInLoop(loop, [&]() { return proxy->Stop(); }));
    state = runInLoop(loop, [&]() { return proxy->chunkHandlerState(); });
    assert(state.empty());

    runInLoop(loop, [&]() { return proxy->Start(); });
    state = runInLoop(loop, [&]() { return proxy->chunkHandlerState(); });
    assert(state.at("dropped") == "5");

    runInLoop(loop, [&]() { proxy.reset(); });
}

// Stop closes the listener only; open sessions keep forwarding.
static void testSessionSurvivesStop(EventLoop* loop) {
    Backend backend(echoBack());
    const auto port = reserveFreeTcpPort();
    assert(port.has_value());

    std::unique_ptr<TcpProxyInstance> proxy;
    runInLoop(loop, [&]() {
        proxy.reset(new TcpProxyInstance(loop, makeConfig(*port, backend.port())));
        return proxy->Start();
    });

    int fd = connectTo(*port);
    assert(fd >= 0);
    sendAll(fd, "before");
    assert(recvAtLeast(fd, 6, 3000) == "before");

    assert(runInLoop(loop, [&]() { return proxy->Stop(); }));
    assert(connectTo(*port) < 0);
    assert(runInLoop(loop, [&]() { return proxy->sessionCount(); }) == 1);

    sendAll(fd, "after");
    assert(recvAtLeast(fd, 5, 3000) == "after");

    ::close(fd);
    assert(waitUntil([&]() { return runInLoop(loop, [&]() { return proxy->sessionCount(); }) == 0; }));
    assert(runInLoop(loop, [&]() { return proxy->stats().GetActiveSessions(); }) == 0);

    runInLoop(loop, [&]() { proxy.reset(); });
}

// The instance is destroyed in the loop turn that finishes its last session, after the
// session queued its own removal. The queued removal must not touch the dead instance.
static void testDestroyWhileSessionFinishing(EventLoop* loop) {
    const auto dead = reserveFreeTcpPort();
    const auto port = reserveFreeTcpPort();
    assert(dead.has_value() && port.has_value());

    EntryLog log;
    std::unique_ptr<TcpProxyInstance> proxy;
    runInLoop(loop, [&]() {
        proxy.reset(new TcpProxyInstance(loop, makeConfig(*port, *dead)));
        proxy->SetTraceEntryCallback([&log](const trace::TraceEntry& e, const trace::TracePtr&) { log.Add(e); });
        return proxy->Start();
    });

    int fd = connectTo(*port);
    assert(fd >= 0);
    // Client reads resume once the refused target settled, so this entry means the session
    // only waits for the client now.
    sendAll(fd, "x");
    assert(waitUntil([&]() { return log.size() == 1; }));
    assert(!log.Snapshot()[0].chunkSend);

    // Hold the loop while the client leaves and the teardown is queued. The close and the
    // teardown are then handled in the same turn, the teardown first.
    std::promise<void> holding;
    std::future<void> held = holding.get_future();
    loop->QueueInLoop([&holding]() {
        holding.set_value();
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    });
    held.wait();
    ::close(fd);
    std::promise<void> destroyed;
    std::future<void> done = destroyed.get_future();
    loop->QueueInLoop([&proxy, &destroyed]() {
        proxy.reset();
        destroyed.set_value();
    });
    done.wait();

    // The loop is still healthy and the port can be served again.
    assert(runInLoop(loop, [&]() {
        proxy.reset(new TcpProxyInstance(loop, makeConfig(*port, *dead)));
        return proxy->Start();
    }) == TcpProxyInstance::StartResult::kStarted);
    runInLoop(loop, [&]() { proxy.reset(); });
}

int main() {
    ::signal(SIGPIPE, SIG_IGN);
    common::Logger::Instance().SetLevel(common::LogLevel::FATAL);

    network::EventLoopThread elt("lifecycle");
    EventLoop* loop = elt.StartLoop();

    testStartStopRestart(loop);
    testBindFailure(loop);
    testHookStateLifecycle(loop);
    testSessionSurvivesStop(loop);
    testDestroyWhileSessionFinishing(loop);

    std::cout << "test_proxy_lifecycle passed" << std::endl;
    return 0;
}
