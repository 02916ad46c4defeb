#include "traceproxy/trace/TraceRecorder.h"
#include "traceproxy/common/Logger.h"

#include <exception>

namespace traceproxy {
namespace trace {

TracePtr TraceRecorder::Begin() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_) return nullptr;
    active_ = std::make_shared<Trace>();
    return active_;
}

TracePtr TraceRecorder::End() {
    std::lock_guard<std::mutex> lock(mutex_);
    TracePtr detached;
    detached.swap(active_);
    return detached;
}

bool TraceRecorder::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_ != nullptr;
}

TracePtr TraceRecorder::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

void TraceRecorder::AddListener(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

void TraceRecorder::Record(const TraceEntry& entry) {
    TracePtr trace;
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        trace = active_;
        if (trace) {
            trace->Append(entry);
        }
        listeners = listeners_;
    }

    for (const auto& listener : listeners) {
        try {
            listener(entry, trace);
        } catch (const std::exception& e) {
            LOG_ERROR << "trace listener failed: " << e.what();
        }
    }
}

} // namespace trace
} // namespace traceproxy
