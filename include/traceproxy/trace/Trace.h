#pragma once

#include "traceproxy/trace/TraceEntry.h"

#include <memory>
#include <mutex>
#include <vector>

namespace traceproxy {
namespace trace {

// Append-only, thread-safe list of entries recorded during one tracing window.
class Trace {
public:
    Trace() : startedAt_(NowMs()) {}

    void Append(TraceEntry entry);
    std::vector<TraceEntry> Entries() const;
    size_t size() const;
    bool empty() const { return size() == 0; }
    Clock::time_point startedAt() const { return startedAt_; }

private:
    const Clock::time_point startedAt_;
    mutable std::mutex mutex_;
    std::vector<TraceEntry> entries_;
};

using TracePtr = std::shared_ptr<Trace>;

} // namespace trace
} // namespace traceproxy
