#pragma once

#include "traceproxy/common/PluginManager.h"
#include "traceproxy/hooks/Hooks.h"

namespace traceproxy {
namespace hooks {

// Adapters from the C plugin ABI to the hook interfaces. Each keeps its plugin loaded.

class PluginChunkTransform : public ChunkTransform {
public:
    explicit PluginChunkTransform(common::LoadedPluginPtr plugin) : plugin_(std::move(plugin)) {}

    std::optional<std::string> HandleChunk(const std::string& chunk,
                                           HookState& state,
                                           const HookOptions& options) override;

private:
    common::LoadedPluginPtr plugin_;
};

class PluginTraceObserver : public TraceObserver {
public:
    explicit PluginTraceObserver(common::LoadedPluginPtr plugin) : plugin_(std::move(plugin)) {}

    void HandleTrace(const trace::TraceEntry& entry,
                     const std::shared_ptr<const trace::Trace>& traceSoFar,
                     const HookOptions& options,
                     HookState& state) override;

private:
    common::LoadedPluginPtr plugin_;
};

class PluginTraceWriter : public TraceWriter {
public:
    explicit PluginTraceWriter(common::LoadedPluginPtr plugin) : plugin_(std::move(plugin)) {}

    bool WriteTrace(const std::vector<trace::TraceEntry>& entries,
                    const HookOptions& options,
                    HookState& state) override;

private:
    common::LoadedPluginPtr plugin_;
};

// View of an entry for the C ABI. Pointers borrow from `entry`.
traceproxy_plugin_trace_entry_v1 ToPluginEntry(const trace::TraceEntry& entry);

} // namespace hooks
} // namespace traceproxy
