#pragma once

#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// Stable C ABI for hook plugins (chunk handler, trace handler, trace writer).
// A plugin exports `traceproxy_plugin_get_v1` and fills in whichever callbacks it supports.

#define TRACEPROXY_PLUGIN_API_VERSION 1

enum traceproxy_plugin_log_level {
    TRACEPROXY_PLUGIN_LOG_DEBUG = 0,
    TRACEPROXY_PLUGIN_LOG_INFO = 1,
    TRACEPROXY_PLUGIN_LOG_WARN = 2,
    TRACEPROXY_PLUGIN_LOG_ERROR = 3,
};

enum traceproxy_plugin_direction {
    TRACEPROXY_CLIENT_TO_TARGET = 0,
    TRACEPROXY_TARGET_TO_CLIENT = 1,
};

// Opaque key/value store owned by the host (hook options or mutable hook state).
typedef struct traceproxy_plugin_kv traceproxy_plugin_kv;

typedef struct traceproxy_plugin_host_v1 {
    int api_version;  // must be TRACEPROXY_PLUGIN_API_VERSION
    void (*log)(int level, const char* msg);
    // Returns NULL when the key is absent. The pointer is valid until the next set on the same key.
    const char* (*kv_get)(const traceproxy_plugin_kv* kv, const char* key);
    // No-op on read-only stores (options).
    void (*kv_set)(traceproxy_plugin_kv* kv, const char* key, const char* value);
} traceproxy_plugin_host_v1;

typedef struct traceproxy_plugin_chunk_v1 {
    const char* data;
    size_t len;
} traceproxy_plugin_chunk_v1;

// Output of handle_chunk. A plugin that wants to replace the chunk points `data`
// at memory it owns and sets `free_data` if the host should release it.
typedef struct traceproxy_plugin_chunk_result_v1 {
    const char* data;
    size_t len;
    void (*free_data)(const char* p);  // optional
} traceproxy_plugin_chunk_result_v1;

typedef struct traceproxy_plugin_trace_entry_v1 {
    int direction;  // traceproxy_plugin_direction
    const char* session_id;
    long long session_time_ms;
    const char* source_addr;
    int source_port;
    int source_index;
    const char* target_addr;
    int target_port;
    int target_index;
    const char* chunk;  // NULL when the chunk was dropped
    size_t chunk_len;
    int chunk_send;
    const char* error;  // NULL when no error
    long long time_ms;
} traceproxy_plugin_trace_entry_v1;

// Return values of handle_chunk.
#define TRACEPROXY_CHUNK_KEEP 0     // forward the input unchanged
#define TRACEPROXY_CHUNK_REPLACE 1  // forward `result`
#define TRACEPROXY_CHUNK_DROP 2     // forward nothing

typedef struct traceproxy_plugin_v1 {
    int api_version;  // must be TRACEPROXY_PLUGIN_API_VERSION
    const char* name;
    int (*init)(const traceproxy_plugin_host_v1* host);  // return 0 on success
    void (*shutdown)();

    int (*handle_chunk)(const traceproxy_plugin_chunk_v1* chunk,
                        traceproxy_plugin_kv* state,
                        const traceproxy_plugin_kv* options,
                        traceproxy_plugin_chunk_result_v1* result);

    // `trace_size` is the number of entries recorded so far (0 when not tracing).
    void (*handle_trace)(const traceproxy_plugin_trace_entry_v1* entry,
                         size_t trace_size,
                         const traceproxy_plugin_kv* options,
                         traceproxy_plugin_kv* state);

    // Return 0 on success.
    int (*write_trace)(const traceproxy_plugin_trace_entry_v1* entries,
                       size_t count,
                       const traceproxy_plugin_kv* options,
                       traceproxy_plugin_kv* state);
} traceproxy_plugin_v1;

typedef const traceproxy_plugin_v1* (*traceproxy_plugin_get_v1_fn)();

#ifdef __cplusplus
}
#endif
