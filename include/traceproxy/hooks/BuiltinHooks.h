#pragma once

#include "traceproxy/hooks/Hooks.h"

namespace traceproxy {
namespace hooks {

// builtin:passthrough
class PassthroughTransform : public ChunkTransform {
public:
    std::optional<std::string> HandleChunk(const std::string& chunk,
                                           HookState& state,
                                           const HookOptions& options) override;
};

// builtin:drop-prefix
// Drops chunks whose first byte equals option "byte" (decimal or 0x.., default 0x00).
// Counts drops in state "dropped".
class DropPrefixTransform : public ChunkTransform {
public:
    std::optional<std::string> HandleChunk(const std::string& chunk,
                                           HookState& state,
                                           const HookOptions& options) override;

    // Returns false for values outside 0..255 or garbage.
    static bool ParseByte(const std::string& text, unsigned char* out);
};

// builtin:log
// Logs a one-line summary of every entry at INFO and counts entries in state "seen".
// Option "name" labels the lines.
class LogTraceObserver : public TraceObserver {
public:
    void HandleTrace(const trace::TraceEntry& entry,
                     const std::shared_ptr<const trace::Trace>& traceSoFar,
                     const HookOptions& options,
                     HookState& state) override;
};

// builtin:file
// Renders the trace to option "path" in option "format" (default json). Gzip compressed when
// option "gzip" is 1 or the path ends in ".gz". Increments state "written".
class FileTraceWriter : public TraceWriter {
public:
    bool WriteTrace(const std::vector<trace::TraceEntry>& entries,
                    const HookOptions& options,
                    HookState& state) override;

    static bool GzipCompress(const std::string& data, std::string* out);
};

} // namespace hooks
} // namespace traceproxy
