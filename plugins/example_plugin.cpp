#include "traceproxy/common/PluginApi.h"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

static traceproxy_plugin_host_v1 g_host{};

static int ExampleInit(const traceproxy_plugin_host_v1* host) {
    if (!host || host->api_version != TRACEPROXY_PLUGIN_API_VERSION) return 1;
    g_host = *host;
    if (g_host.log) g_host.log(TRACEPROXY_PLUGIN_LOG_INFO, "example_plugin init ok");
    return 0;
}

static void ExampleShutdown() {
    if (g_host.log) g_host.log(TRACEPROXY_PLUGIN_LOG_INFO, "example_plugin shutdown");
}

static long GetCounter(const traceproxy_plugin_kv* kv, const char* key) {
    const char* v = g_host.kv_get ? g_host.kv_get(kv, key) : nullptr;
    return v ? std::strtol(v, nullptr, 10) : 0;
}

static void Bump(traceproxy_plugin_kv* kv, const char* key) {
    if (!g_host.kv_set) return;
    const std::string next = std::to_string(GetCounter(kv, key) + 1);
    g_host.kv_set(kv, key, next.c_str());
}

static void FreeChunk(const char* p) {
    std::free(const_cast<char*>(p));
}

// Upper-cases ASCII letters. Chunks starting with option "drop_prefix" are dropped.
static int UppercaseChunk(const traceproxy_plugin_chunk_v1* chunk,
                          traceproxy_plugin_kv* state,
                          const traceproxy_plugin_kv* options,
                          traceproxy_plugin_chunk_result_v1* result) {
    if (!chunk || !result) return TRACEPROXY_CHUNK_KEEP;

    const char* dropPrefix = g_host.kv_get ? g_host.kv_get(options, "drop_prefix") : nullptr;
    if (dropPrefix && *dropPrefix) {
        const size_t n = std::strlen(dropPrefix);
        if (chunk->len >= n && std::memcmp(chunk->data, dropPrefix, n) == 0) {
            Bump(state, "dropped");
            return TRACEPROXY_CHUNK_DROP;
        }
    }

    Bump(state, "chunks");
    if (chunk->len == 0) return TRACEPROXY_CHUNK_KEEP;

    char* out = static_cast<char*>(std::malloc(chunk->len));
    if (!out) return TRACEPROXY_CHUNK_KEEP;
    for (size_t i = 0; i < chunk->len; ++i) {
        out[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(chunk->data[i])));
    }
    result->data = out;
    result->len = chunk->len;
    result->free_data = &FreeChunk;
    return TRACEPROXY_CHUNK_REPLACE;
}

static void CountTrace(const traceproxy_plugin_trace_entry_v1* entry,
                       size_t trace_size,
                       const traceproxy_plugin_kv* options,
                       traceproxy_plugin_kv* state) {
    (void)options;
    if (!entry) return;
    Bump(state, "seen");
    if (trace_size > 0) Bump(state, "traced");
}

// One summary line per entry, appended to option "path".
static int WriteSummary(const traceproxy_plugin_trace_entry_v1* entries,
                        size_t count,
                        const traceproxy_plugin_kv* options,
                        traceproxy_plugin_kv* state) {
    const char* path = g_host.kv_get ? g_host.kv_get(options, "path") : nullptr;
    if (!path || !*path) return 1;

    FILE* f = std::fopen(path, "a");
    if (!f) return 2;
    for (size_t i = 0; i < count; ++i) {
        const traceproxy_plugin_trace_entry_v1& e = entries[i];
        std::fprintf(f, "%s [%d] %s:%d -> [%d] %s:%d %zu bytes%s\n",
                     e.direction == TRACEPROXY_CLIENT_TO_TARGET ? "c2t" : "t2c",
                     e.source_index, e.source_addr, e.source_port,
                     e.target_index, e.target_addr, e.target_port,
                     e.chunk_len, e.chunk ? "" : " (dropped)");
    }
    std::fclose(f);
    Bump(state, "written");
    return 0;
}

static const traceproxy_plugin_v1 kPlugin{
    TRACEPROXY_PLUGIN_API_VERSION,
    "example_plugin",
    &ExampleInit,
    &ExampleShutdown,
    &UppercaseChunk,
    &CountTrace,
    &WriteSummary,
};

extern "C" const traceproxy_plugin_v1* traceproxy_plugin_get_v1() {
    return &kPlugin;
}
