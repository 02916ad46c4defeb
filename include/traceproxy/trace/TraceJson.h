#pragma once

#include "traceproxy/trace/TraceEntry.h"

#include <string>
#include <vector>

namespace traceproxy {
namespace trace {

// JSON dump of a trace. Chunks are base64 encoded; dropped chunks and absent errors are null.
// Times are Unix milliseconds.
class TraceJson {
public:
    static std::string Encode(const std::vector<TraceEntry>& entries);

    // Reads a document produced by Encode. Returns false and fills `err` on malformed input.
    static bool Parse(const std::string& json, std::vector<TraceEntry>* out, std::string* err = nullptr);

    static std::string Escape(const std::string& s);
    static std::string Base64Encode(const std::string& data);
    static bool Base64Decode(const std::string& text, std::string* out);
};

} // namespace trace
} // namespace traceproxy
