#include "traceproxy/TcpProxyInstance.h"
#include "traceproxy/network/EventLoopThread.h"
#include "traceproxy/common/Logger.h"

#include "ProxyTestUtil.h"

#include <signal.h>

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace traceproxy;
using namespace testutil;
using traceproxy::network::EventLoop;

namespace {

// Passes chunks through unchanged, except that it fails on anything starting with "boom".
class FailingTransform : public hooks::ChunkTransform {
public:
    std::optional<std::string> HandleChunk(const std::string& chunk, hooks::HookState&,
                                           const hooks::HookOptions&) override {
        calls.fetch_add(1);
        if (chunk.compare(0, 4, "boom") == 0) {
            throw std::runtime_error("cannot transform " + chunk);
        }
        return chunk;
    }

    std::atomic<int> calls{0};
};

class FailingObserver : public hooks::TraceObserver {
public:
    void HandleTrace(const trace::TraceEntry&, const std::shared_ptr<const trace::Trace>&,
                     const hooks::HookOptions&, hooks::HookState&) override {
        calls.fetch_add(1);
        throw std::runtime_error("observer failed");
    }

    std::atomic<int> calls{0};
};

class FailingWriter : public hooks::TraceWriter {
public:
    bool WriteTrace(const std::vector<trace::TraceEntry>& entries, const hooks::HookOptions&,
                    hooks::HookState&) override {
        calls.fetch_add(1);
        lastSize.store(entries.size());
        throw std::runtime_error("disk full");
    }

    std::atomic<int> calls{0};
    std::atomic<size_t> lastSize{0};
};

ProxyConfig makeConfig(uint16_t port, uint16_t targetPort) {
    ProxyConfig pc;
    pc.sourcePort = port;
    TargetAddress t;
    t.host = "127.0.0.1";
    t.port = targetPort;
    pc.targets.push_back(t);
    pc.echo = EchoPolicy::First();
    pc.displayName = "hook-failure-test";
    return pc;
}

} // namespace

// Every hook throws at some point. A failed transform drops that chunk only; a failed observer
// or writer is logged and the proxy keeps forwarding and tracing.
static void testThrowingHooks(EventLoop* loop) {
    Backend backend([](const std::string& data) { return data; });
    const auto port = reserveFreeTcpPort();
    assert(port.has_value());

    auto transform = std::make_shared<FailingTransform>();
    auto observer = std::make_shared<FailingObserver>();
    auto writer = std::make_shared<FailingWriter>();
    ProxyHooks hooks;
    hooks.chunk.impl = transform;
    hooks.observer.impl = observer;
    hooks.writer.impl = writer;

    EntryLog log;
    std::unique_ptr<TcpProxyInstance> proxy;
    const auto result = runInLoop(loop, [&]() {
        proxy.reset(new TcpProxyInstance(loop, makeConfig(*port, backend.port()), hooks));
        proxy->SetTraceEntryCallback([&log](const trace::TraceEntry& e, const trace::TracePtr&) { log.Add(e); });
        return proxy->Start();
    });
    assert(result == TcpProxyInstance::StartResult::kStarted);
    runInLoop(loop, [&]() { return proxy->ToggleTrace(); });

    int fd = connectTo(*port);
    assert(fd >= 0);
    sendAll(fd, "boom-1");
    assert(waitUntil([&]() { return log.size() == 1; }));

    const trace::TraceEntry dropped = log.Snapshot()[0];
    assert(dropped.direction == trace::Direction::kClientToTarget);
    assert(!dropped.chunk);
    assert(!dropped.chunkSend);
    assert(transform->calls.load() == 1);

    // The session is still usable after the failure.
    sendAll(fd, "ok");
    assert(recvAtLeast(fd, 2, 3000) == "ok");
    assert(backend.received() == "ok");
    assert(waitUntil([&]() { return log.size() == 3; }));
    assert(transform->calls.load() == 2);
    assert(observer->calls.load() == 3);

    const auto entries = log.Snapshot();
    assert(entries[1].direction == trace::Direction::kClientToTarget);
    assert(entries[1].chunk && *entries[1].chunk == "ok" && entries[1].chunkSend);
    assert(entries[2].direction == trace::Direction::kTargetToClient);
    assert(entries[2].chunk && *entries[2].chunk == "ok" && entries[2].chunkSend);

    // The writer fails but the finished trace is still handed back.
    const trace::TracePtr finished = runInLoop(loop, [&]() { return proxy->ToggleTrace(); });
    assert(finished && finished->size() == 3);
    assert(writer->calls.load() == 1);
    assert(writer->lastSize.load() == 3);
    assert(!runInLoop(loop, [&]() { return proxy->tracing(); }));
    assert(runInLoop(loop, [&]() { return proxy->running(); }));

    ::close(fd);
    assert(waitUntil([&]() { return runInLoop(loop, [&]() { return proxy->sessionCount(); }) == 0; }));
    runInLoop(loop, [&]() { proxy.reset(); });
}

int main() {
    ::signal(SIGPIPE, SIG_IGN);
    common::Logger::Instance().SetLevel(common::LogLevel::FATAL);

    network::EventLoopThread elt("hook-failures");
    EventLoop* loop = elt.StartLoop();

    testThrowingHooks(loop);

    std::cout << "test_hook_failures passed" << std::endl;
    return 0;
}
