#include "traceproxy/monitor/ProxyStats.h"
#include "traceproxy/trace/TraceJson.h"
#include "traceproxy/trace/TraceRenderer.h"

#include <sstream>

namespace traceproxy {
namespace monitor {

void ProxyStats::Reset() {
    bytesSend_.store(0, std::memory_order_relaxed);
    chunksSend_.store(0, std::memory_order_relaxed);
    bytesReceived_.store(0, std::memory_order_relaxed);
    chunksReceived_.store(0, std::memory_order_relaxed);
    totalSessions_.store(activeSessions_.load(std::memory_order_relaxed), std::memory_order_relaxed);

    std::lock_guard<std::mutex> lock(mutex_);
    lastSent_.reset();
    lastReceived_.reset();
    since_ = std::chrono::system_clock::now();
}

void ProxyStats::Record(const trace::TraceEntry& entry) {
    const long long len = entry.chunk ? static_cast<long long>(entry.chunk->size()) : 0;
    if (entry.direction == trace::Direction::kClientToTarget) {
        if (entry.chunkSend) {
            bytesSend_.fetch_add(len, std::memory_order_relaxed);
            chunksSend_.fetch_add(1, std::memory_order_relaxed);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        lastSent_ = entry;
    } else {
        if (entry.chunkSend) {
            bytesReceived_.fetch_add(len, std::memory_order_relaxed);
            chunksReceived_.fetch_add(1, std::memory_order_relaxed);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        lastReceived_ = entry;
    }
}

ProxyStats::Snapshot ProxyStats::GetSnapshot() const {
    Snapshot s;
    s.bytesSend = GetBytesSend();
    s.chunksSend = GetChunksSend();
    s.bytesReceived = GetBytesReceived();
    s.chunksReceived = GetChunksReceived();
    s.activeSessions = GetActiveSessions();
    s.totalSessions = totalSessions_.load(std::memory_order_relaxed);

    std::lock_guard<std::mutex> lock(mutex_);
    s.lastSent = lastSent_;
    s.lastReceived = lastReceived_;
    s.since = since_;
    return s;
}

std::string ProxyStats::ToJson() const {
    const Snapshot s = GetSnapshot();
    auto last = [](const std::optional<trace::TraceEntry>& e) -> std::string {
        if (!e) return "null";
        return "\"" + trace::TraceJson::Escape(trace::TraceRenderer::AddressPipe(*e)) + "\"";
    };

    std::ostringstream ss;
    ss << "{"
       << "\"bytes_send\":" << s.bytesSend << ","
       << "\"chunks_send\":" << s.chunksSend << ","
       << "\"bytes_received\":" << s.bytesReceived << ","
       << "\"chunks_received\":" << s.chunksReceived << ","
       << "\"active_sessions\":" << s.activeSessions << ","
       << "\"total_sessions\":" << s.totalSessions << ","
       << "\"since_ms\":" << trace::ToUnixMs(s.since) << ","
       << "\"last_sent\":" << last(s.lastSent) << ","
       << "\"last_received\":" << last(s.lastReceived)
       << "}";
    return ss.str();
}

} // namespace monitor
} // namespace traceproxy
