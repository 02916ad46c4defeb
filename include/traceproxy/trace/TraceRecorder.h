#pragma once

#include "traceproxy/trace/Trace.h"

#include <functional>
#include <mutex>
#include <vector>

namespace traceproxy {
namespace trace {

// Owns the active Trace (if any) and fans recorded entries out to listeners.
class TraceRecorder {
public:
    // `traceSoFar` is the active trace, or null when not tracing.
    using Listener = std::function<void(const TraceEntry& entry, const TracePtr& traceSoFar)>;

    // Starts a new trace. Returns nullptr if one is already active.
    TracePtr Begin();
    // Detaches the active trace. Returns nullptr if none is active.
    TracePtr End();

    bool active() const;
    TracePtr current() const;

    void AddListener(Listener listener);

    // Appends to the active trace (if any), then notifies every listener.
    // Listener exceptions are logged and swallowed per listener.
    void Record(const TraceEntry& entry);

private:
    mutable std::mutex mutex_;
    TracePtr active_;
    std::vector<Listener> listeners_;
};

} // namespace trace
} // namespace traceproxy
