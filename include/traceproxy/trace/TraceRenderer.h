#pragma once

#include "traceproxy/trace/TraceEntry.h"

#include <string>
#include <vector>

namespace traceproxy {
namespace trace {

enum class OutputFormat {
    kAscii,
    kHttp,
    kJson,
    kText,
};

// Unknown names (and the empty string) map to kText.
OutputFormat ParseOutputFormat(const std::string& name);
const char* OutputFormatName(OutputFormat format);

class TraceRenderer {
public:
    static constexpr int kDefaultHexWidth = 16;

    static std::string Render(const std::vector<TraceEntry>& entries,
                              OutputFormat format,
                              const std::string& proxyName,
                              int hexWidth = kDefaultHexWidth);

    // "[i] 'addr:port' => [j] 'addr:port'", or "<=" with sides swapped for target-to-client.
    static std::string AddressPipe(const TraceEntry& entry);

    // "[TRACE] '<name>': <pipe>" followed by a hex dump of the chunk, newline terminated.
    static std::string EntryToText(const TraceEntry& entry, const std::string& proxyName, int hexWidth);

    // Offset, hex words and printable ASCII, `width` bytes per line.
    static std::string HexDump(const std::string& data, int width);

    // Key shared by entries whose chunks belong to the same stream.
    static std::string GroupKey(const TraceEntry& entry);
};

} // namespace trace
} // namespace traceproxy
