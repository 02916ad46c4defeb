#pragma once

#include "traceproxy/trace/TraceEntry.h"

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace traceproxy {
namespace monitor {

// Per-proxy traffic counters. Counters are lock-free; the last-entry slots are mutex guarded.
class ProxyStats {
public:
    struct Snapshot {
        long long bytesSend{0};
        long long chunksSend{0};
        long long bytesReceived{0};
        long long chunksReceived{0};
        long activeSessions{0};
        long long totalSessions{0};
        std::optional<trace::TraceEntry> lastSent;
        std::optional<trace::TraceEntry> lastReceived;
        std::chrono::system_clock::time_point since;
    };

    ProxyStats() : since_(std::chrono::system_clock::now()) {}

    void Reset();

    // Sent counters grow on successful client-to-target writes, received counters on
    // successful echoes to the client. The last-entry slots take every entry of their direction.
    void Record(const trace::TraceEntry& entry);

    void IncActiveSessions() {
        activeSessions_.fetch_add(1, std::memory_order_relaxed);
        totalSessions_.fetch_add(1, std::memory_order_relaxed);
    }
    void DecActiveSessions() { activeSessions_.fetch_sub(1, std::memory_order_relaxed); }

    long long GetBytesSend() const { return bytesSend_.load(std::memory_order_relaxed); }
    long long GetChunksSend() const { return chunksSend_.load(std::memory_order_relaxed); }
    long long GetBytesReceived() const { return bytesReceived_.load(std::memory_order_relaxed); }
    long long GetChunksReceived() const { return chunksReceived_.load(std::memory_order_relaxed); }
    long GetActiveSessions() const { return activeSessions_.load(std::memory_order_relaxed); }

    Snapshot GetSnapshot() const;
    std::string ToJson() const;

private:
    std::atomic<long long> bytesSend_{0};
    std::atomic<long long> chunksSend_{0};
    std::atomic<long long> bytesReceived_{0};
    std::atomic<long long> chunksReceived_{0};
    std::atomic<long> activeSessions_{0};
    std::atomic<long long> totalSessions_{0};

    mutable std::mutex mutex_;
    std::optional<trace::TraceEntry> lastSent_;
    std::optional<trace::TraceEntry> lastReceived_;
    std::chrono::system_clock::time_point since_;
};

} // namespace monitor
} // namespace traceproxy
