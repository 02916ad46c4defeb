#include "traceproxy/hooks/PluginHooks.h"
#include "traceproxy/common/Logger.h"

#include <stdexcept>

namespace traceproxy {
namespace hooks {

traceproxy_plugin_trace_entry_v1 ToPluginEntry(const trace::TraceEntry& entry) {
    traceproxy_plugin_trace_entry_v1 c{};
    c.direction = entry.direction == trace::Direction::kClientToTarget ? TRACEPROXY_CLIENT_TO_TARGET
                                                                      : TRACEPROXY_TARGET_TO_CLIENT;
    c.session_id = entry.session.id.c_str();
    c.session_time_ms = trace::ToUnixMs(entry.session.time);
    c.source_addr = entry.source.addr.c_str();
    c.source_port = entry.source.port;
    c.source_index = entry.sourceIndex;
    c.target_addr = entry.target.addr.c_str();
    c.target_port = entry.target.port;
    c.target_index = entry.targetIndex;
    c.chunk = entry.chunk ? entry.chunk->data() : nullptr;
    c.chunk_len = entry.chunk ? entry.chunk->size() : 0;
    c.chunk_send = entry.chunkSend ? 1 : 0;
    c.error = entry.error ? entry.error->c_str() : nullptr;
    c.time_ms = trace::ToUnixMs(entry.time);
    return c;
}

std::optional<std::string> PluginChunkTransform::HandleChunk(const std::string& chunk,
                                                             HookState& state,
                                                             const HookOptions& options) {
    const traceproxy_plugin_v1* api = plugin_->api();
    if (!api->handle_chunk) return chunk;

    traceproxy_plugin_chunk_v1 in{chunk.data(), chunk.size()};
    traceproxy_plugin_chunk_result_v1 result{nullptr, 0, nullptr};
    traceproxy_plugin_kv stateKv;
    stateKv.rw = &state;
    traceproxy_plugin_kv optionsKv;
    optionsKv.ro = &options;

    const int rc = api->handle_chunk(&in, &stateKv, &optionsKv, &result);
    switch (rc) {
        case TRACEPROXY_CHUNK_KEEP:
            return chunk;
        case TRACEPROXY_CHUNK_DROP:
            return std::nullopt;
        case TRACEPROXY_CHUNK_REPLACE: {
            std::string replaced;
            if (result.data && result.len > 0) {
                replaced.assign(result.data, result.len);
            }
            if (result.free_data && result.data) {
                result.free_data(result.data);
            }
            return replaced;
        }
        default:
            throw std::runtime_error(std::string("plugin ") + plugin_->name() +
                                     " handle_chunk returned " + std::to_string(rc));
    }
}

void PluginTraceObserver::HandleTrace(const trace::TraceEntry& entry,
                                      const std::shared_ptr<const trace::Trace>& traceSoFar,
                                      const HookOptions& options,
                                      HookState& state) {
    const traceproxy_plugin_v1* api = plugin_->api();
    if (!api->handle_trace) return;

    const traceproxy_plugin_trace_entry_v1 c = ToPluginEntry(entry);
    traceproxy_plugin_kv stateKv;
    stateKv.rw = &state;
    traceproxy_plugin_kv optionsKv;
    optionsKv.ro = &options;
    api->handle_trace(&c, traceSoFar ? traceSoFar->size() : 0, &optionsKv, &stateKv);
}

bool PluginTraceWriter::WriteTrace(const std::vector<trace::TraceEntry>& entries,
                                   const HookOptions& options,
                                   HookState& state) {
    const traceproxy_plugin_v1* api = plugin_->api();
    if (!api->write_trace) {
        LOG_WARN << "plugin " << plugin_->name() << " has no write_trace";
        return false;
    }

    std::vector<traceproxy_plugin_trace_entry_v1> c;
    c.reserve(entries.size());
    for (const auto& e : entries) {
        c.push_back(ToPluginEntry(e));
    }
    traceproxy_plugin_kv stateKv;
    stateKv.rw = &state;
    traceproxy_plugin_kv optionsKv;
    optionsKv.ro = &options;
    const int rc = api->write_trace(c.empty() ? nullptr : c.data(), c.size(), &optionsKv, &stateKv);
    if (rc != 0) {
        LOG_ERROR << "plugin " << plugin_->name() << " write_trace failed rc=" << rc;
        return false;
    }
    return true;
}

} // namespace hooks
} // namespace traceproxy
