#pragma once

#include "traceproxy/trace/Trace.h"
#include "traceproxy/trace/TraceEntry.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace traceproxy {
namespace hooks {

using HookOptions = std::map<std::string, std::string>;
using HookState = std::map<std::string, std::string>;

// Rewrites or drops one chunk. Returning nullopt drops it.
class ChunkTransform {
public:
    virtual ~ChunkTransform() = default;
    virtual std::optional<std::string> HandleChunk(const std::string& chunk,
                                                   HookState& state,
                                                   const HookOptions& options) = 0;
};

// Sees every entry, traced or not. `traceSoFar` is null while not tracing.
class TraceObserver {
public:
    virtual ~TraceObserver() = default;
    virtual void HandleTrace(const trace::TraceEntry& entry,
                             const std::shared_ptr<const trace::Trace>& traceSoFar,
                             const HookOptions& options,
                             HookState& state) = 0;
};

// Persists a finished trace. Returns false on failure.
class TraceWriter {
public:
    virtual ~TraceWriter() = default;
    virtual bool WriteTrace(const std::vector<trace::TraceEntry>& entries,
                            const HookOptions& options,
                            HookState& state) = 0;
};

// Mutable state of one hook across calls. Reset from the initial state on every start,
// cleared on stop. Only touched from the owning loop thread.
class HookStateCell {
public:
    HookStateCell() = default;
    explicit HookStateCell(HookState initial) : initial_(std::move(initial)) {}

    void Reset() { state_ = initial_; }
    void Clear() { state_.clear(); }

    HookState& state() { return state_; }
    const HookState& state() const { return state_; }
    const HookState& initial() const { return initial_; }

private:
    HookState initial_;
    HookState state_;
};

// A resolved hook: implementation, its options and its state.
template <typename Interface>
struct Hook {
    std::shared_ptr<Interface> impl;
    HookOptions options;
    HookStateCell state;

    explicit operator bool() const { return impl != nullptr; }
};

using ChunkHook = Hook<ChunkTransform>;
using ObserverHook = Hook<TraceObserver>;
using WriterHook = Hook<TraceWriter>;

} // namespace hooks
} // namespace traceproxy
