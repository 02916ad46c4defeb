#include "traceproxy/hooks/BuiltinHooks.h"
#include "traceproxy/common/Config.h"
#include "traceproxy/common/Logger.h"
#include "traceproxy/trace/TraceRenderer.h"

#include <zlib.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>

namespace traceproxy {
namespace hooks {

namespace {

std::string GetOption(const HookOptions& options, const std::string& key, const std::string& def) {
    auto it = options.find(key);
    return it == options.end() ? def : it->second;
}

void Increment(HookState& state, const std::string& key) {
    long long v = 0;
    auto it = state.find(key);
    if (it != state.end()) {
        v = std::strtoll(it->second.c_str(), nullptr, 10);
    }
    state[key] = std::to_string(v + 1);
}

bool EndsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::optional<std::string> PassthroughTransform::HandleChunk(const std::string& chunk,
                                                             HookState&,
                                                             const HookOptions&) {
    return chunk;
}

bool DropPrefixTransform::ParseByte(const std::string& text, unsigned char* out) {
    const std::string t = common::Config::Trim(text);
    if (t.empty()) return false;
    char* end = nullptr;
    errno = 0;
    const long v = std::strtol(t.c_str(), &end, 0);
    if (errno != 0 || end == t.c_str() || *end != '\0' || v < 0 || v > 255) return false;
    *out = static_cast<unsigned char>(v);
    return true;
}

std::optional<std::string> DropPrefixTransform::HandleChunk(const std::string& chunk,
                                                            HookState& state,
                                                            const HookOptions& options) {
    unsigned char prefix = 0x00;
    auto it = options.find("byte");
    if (it != options.end() && !ParseByte(it->second, &prefix)) {
        LOG_WARN << "drop-prefix: ignoring invalid byte option '" << it->second << "'";
        prefix = 0x00;
    }
    if (!chunk.empty() && static_cast<unsigned char>(chunk[0]) == prefix) {
        Increment(state, "dropped");
        return std::nullopt;
    }
    return chunk;
}

void LogTraceObserver::HandleTrace(const trace::TraceEntry& entry,
                                   const std::shared_ptr<const trace::Trace>& traceSoFar,
                                   const HookOptions& options,
                                   HookState& state) {
    Increment(state, "seen");
    LOG_INFO << "[" << GetOption(options, "name", "traceproxy") << "] "
             << trace::TraceRenderer::AddressPipe(entry)
             << " bytes=" << (entry.chunk ? entry.chunk->size() : 0)
             << " sent=" << (entry.chunkSend ? "yes" : "no")
             << (entry.error ? " error=" + *entry.error : std::string())
             << (traceSoFar ? " traced=" + std::to_string(traceSoFar->size()) : std::string());
}

bool FileTraceWriter::GzipCompress(const std::string& data, std::string* out) {
    out->clear();
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());
    // 15 window bits + 16 selects the gzip wrapper.
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK) return false;

    char buf[16384];
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        zs.next_out = reinterpret_cast<Bytef*>(buf);
        zs.avail_out = sizeof(buf);
        ret = deflate(&zs, Z_FINISH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            deflateEnd(&zs);
            return false;
        }
        const size_t produced = sizeof(buf) - zs.avail_out;
        if (produced) out->append(buf, buf + produced);
    }
    deflateEnd(&zs);
    return true;
}

bool FileTraceWriter::WriteTrace(const std::vector<trace::TraceEntry>& entries,
                                 const HookOptions& options,
                                 HookState& state) {
    const std::string path = GetOption(options, "path", "");
    if (path.empty()) {
        LOG_ERROR << "file writer: option 'path' is required";
        return false;
    }
    const trace::OutputFormat format = trace::ParseOutputFormat(GetOption(options, "format", "json"));
    int hexWidth = trace::TraceRenderer::kDefaultHexWidth;
    const std::string hw = GetOption(options, "hex_width", "");
    if (!hw.empty()) {
        const int v = std::atoi(hw.c_str());
        if (v > 0) hexWidth = v;
    }

    std::string payload = trace::TraceRenderer::Render(entries, format, GetOption(options, "name", "traceproxy"), hexWidth);
    if (common::Config::ParseBool(GetOption(options, "gzip", "0")).value_or(false) || EndsWith(path, ".gz")) {
        std::string compressed;
        if (!GzipCompress(payload, &compressed)) {
            LOG_ERROR << "file writer: gzip compression failed for " << path;
            return false;
        }
        payload.swap(compressed);
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        LOG_ERROR << "file writer: cannot open " << path << ": " << std::strerror(errno);
        return false;
    }
    out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    if (!out) {
        LOG_ERROR << "file writer: write failed for " << path;
        return false;
    }
    Increment(state, "written");
    LOG_INFO << "file writer: " << entries.size() << " entries written to " << path;
    return true;
}

} // namespace hooks
} // namespace traceproxy
