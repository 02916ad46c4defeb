#include "traceproxy/trace/TraceRenderer.h"
#include "traceproxy/trace/TraceJson.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <map>

namespace traceproxy {
namespace trace {

OutputFormat ParseOutputFormat(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (n == "ascii") return OutputFormat::kAscii;
    if (n == "http") return OutputFormat::kHttp;
    if (n == "json") return OutputFormat::kJson;
    return OutputFormat::kText;
}

const char* OutputFormatName(OutputFormat format) {
    switch (format) {
        case OutputFormat::kAscii: return "ascii";
        case OutputFormat::kHttp: return "http";
        case OutputFormat::kJson: return "json";
        case OutputFormat::kText: return "text";
    }
    return "text";
}

std::string TraceRenderer::AddressPipe(const TraceEntry& entry) {
    const std::string src = "[" + std::to_string(entry.sourceIndex) + "] '" + entry.source.ToString() + "'";
    const std::string dst = "[" + std::to_string(entry.targetIndex) + "] '" + entry.target.ToString() + "'";
    if (entry.direction == Direction::kClientToTarget) {
        return src + " => " + dst;
    }
    return dst + " <= " + src;
}

std::string TraceRenderer::HexDump(const std::string& data, int width) {
    if (width <= 0) width = kDefaultHexWidth;
    static const char kHex[] = "0123456789abcdef";

    std::string out;
    const size_t w = static_cast<size_t>(width);
    for (size_t off = 0; off < data.size(); off += w) {
        char head[16];
        std::snprintf(head, sizeof head, "%08zx: ", off);
        out += head;

        const size_t n = std::min(w, data.size() - off);
        for (size_t i = 0; i < w; ++i) {
            if (i < n) {
                const unsigned char c = static_cast<unsigned char>(data[off + i]);
                out.push_back(kHex[c >> 4]);
                out.push_back(kHex[c & 0x0F]);
            } else {
                out += "  ";
            }
            if (i % 2 == 1) out.push_back(' ');
        }
        if (w % 2 == 1) out.push_back(' ');
        out.push_back(' ');

        for (size_t i = 0; i < n; ++i) {
            const unsigned char c = static_cast<unsigned char>(data[off + i]);
            out.push_back((c >= 0x20 && c < 0x7F) ? static_cast<char>(c) : '.');
        }
        out.push_back('\n');
    }
    return out;
}

std::string TraceRenderer::EntryToText(const TraceEntry& entry, const std::string& proxyName, int hexWidth) {
    std::string out = "[TRACE] '" + proxyName + "': " + AddressPipe(entry) + "\n";
    if (entry.chunk && !entry.chunk->empty()) {
        out += HexDump(*entry.chunk, hexWidth);
    }
    return out;
}

std::string TraceRenderer::GroupKey(const TraceEntry& entry) {
    std::string key = DirectionName(entry.direction);
    key += "\n[" + std::to_string(entry.sourceIndex) + "] " + entry.source.ToString();
    key += "\n[" + std::to_string(entry.targetIndex) + "] " + entry.target.ToString();
    key += "\n" + entry.session.id + "\t" + std::to_string(ToUnixMs(entry.session.time));
    return key;
}

std::string TraceRenderer::Render(const std::vector<TraceEntry>& entries,
                                  OutputFormat format,
                                  const std::string& proxyName,
                                  int hexWidth) {
    std::string out;
    switch (format) {
        case OutputFormat::kAscii:
            for (size_t i = 0; i < entries.size(); ++i) {
                if (i > 0) out += "\n\n";
                if (entries[i].chunk) {
                    for (char c : *entries[i].chunk) {
                        out.push_back(static_cast<char>(c & 0x7F));
                    }
                }
            }
            break;

        case OutputFormat::kHttp: {
            // Groups in order of first appearance; chunks of a group concatenated.
            std::vector<std::string> order;
            std::map<std::string, std::string> groups;
            for (const auto& e : entries) {
                const std::string key = GroupKey(e);
                auto it = groups.find(key);
                if (it == groups.end()) {
                    order.push_back(key);
                    it = groups.emplace(key, std::string()).first;
                }
                if (e.chunk) it->second += *e.chunk;
            }
            for (const auto& key : order) {
                for (char c : groups[key]) {
                    out.push_back(static_cast<char>(c & 0x7F));
                }
            }
            break;
        }

        case OutputFormat::kJson:
            out = TraceJson::Encode(entries);
            break;

        case OutputFormat::kText:
            for (const auto& e : entries) {
                out += EntryToText(e, proxyName, hexWidth);
            }
            break;
    }
    return out;
}

} // namespace trace
} // namespace traceproxy
