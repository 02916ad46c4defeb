#include "traceproxy/trace/Trace.h"

namespace traceproxy {
namespace trace {

void Trace::Append(TraceEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(std::move(entry));
}

std::vector<TraceEntry> Trace::Entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

size_t Trace::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace trace
} // namespace traceproxy
