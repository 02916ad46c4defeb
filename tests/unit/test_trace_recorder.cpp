#include "traceproxy/trace/TraceRecorder.h"
#include "traceproxy/common/Logger.h"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace traceproxy::trace;

static TraceEntry makeEntry(const std::string& chunk) {
    TraceEntry e;
    e.direction = Direction::kClientToTarget;
    e.session = SessionInfo{"s-1", Clock::now()};
    e.source = SocketAddress{"127.0.0.1", 50000};
    e.target = SocketAddress{"127.0.0.1", 7000};
    e.chunk = chunk;
    e.chunkSend = true;
    e.time = Clock::now();
    return e;
}

static void testBeginEnd() {
    TraceRecorder rec;
    assert(!rec.active());
    assert(rec.End() == nullptr);

    // Nothing is kept while idle.
    rec.Record(makeEntry("before"));

    TracePtr t = rec.Begin();
    assert(t && t->empty());
    assert(rec.active());
    assert(rec.Begin() == nullptr);
    assert(rec.current() == t);

    rec.Record(makeEntry("a"));
    rec.Record(makeEntry("b"));

    TracePtr done = rec.End();
    assert(done == t);
    assert(!rec.active());

    rec.Record(makeEntry("after"));
    const auto entries = done->Entries();
    assert(entries.size() == 2);
    assert(*entries[0].chunk == "a");
    assert(*entries[1].chunk == "b");
}

// Consecutive traces never share entries.
static void testDisjointTraces() {
    TraceRecorder rec;
    TracePtr first = rec.Begin();
    rec.Record(makeEntry("1"));
    rec.End();
    TracePtr second = rec.Begin();
    rec.Record(makeEntry("2"));
    rec.Record(makeEntry("3"));
    rec.End();
    assert(first->size() == 1);
    assert(second->size() == 2);
    assert(*second->Entries().front().chunk == "2");
}

static void testListeners() {
    TraceRecorder rec;
    int calls = 0;
    size_t lastTraceSize = 99;
    bool sawNull = false;
    rec.AddListener([](const TraceEntry&, const TracePtr&) { throw std::runtime_error("boom"); });
    rec.AddListener([&](const TraceEntry& e, const TracePtr& soFar) {
        ++calls;
        assert(e.chunk.has_value());
        if (soFar) {
            lastTraceSize = soFar->size();
        } else {
            sawNull = true;
        }
    });

    rec.Record(makeEntry("idle"));
    assert(calls == 1 && sawNull);

    rec.Begin();
    rec.Record(makeEntry("x"));
    rec.Record(makeEntry("y"));
    assert(calls == 3);
    // The entry is already part of the trace when listeners run.
    assert(lastTraceSize == 2);
}

static void testConcurrentRecord() {
    TraceRecorder rec;
    TracePtr t = rec.Begin();
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&rec]() {
            for (int j = 0; j < 250; ++j) rec.Record(makeEntry("c"));
        });
    }
    for (auto& th : threads) th.join();
    assert(rec.End()->size() == 1000);
}

int main() {
    traceproxy::common::Logger::Instance().SetLevel(traceproxy::common::LogLevel::FATAL);
    testBeginEnd();
    testDisjointTraces();
    testListeners();
    testConcurrentRecord();
    std::cout << "test_trace_recorder passed" << std::endl;
    return 0;
}
