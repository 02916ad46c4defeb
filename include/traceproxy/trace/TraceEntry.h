#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace traceproxy {
namespace trace {

using Clock = std::chrono::system_clock;

enum class Direction {
    kClientToTarget,
    kTargetToClient,
};

const char* DirectionName(Direction d);
bool ParseDirection(const std::string& s, Direction* out);

struct SocketAddress {
    std::string addr;
    uint16_t port{0};

    std::string ToString() const { return addr + ":" + std::to_string(port); }
};

struct SessionInfo {
    std::string id;
    Clock::time_point time;
};

// One transferred (or dropped) chunk. Index 0 is the client side; targets use their declared index.
struct TraceEntry {
    Direction direction{Direction::kClientToTarget};
    SessionInfo session;
    SocketAddress source;
    SocketAddress target;
    int sourceIndex{0};
    int targetIndex{0};
    std::optional<std::string> chunk;  // nullopt when the transform dropped it
    bool chunkSend{false};
    std::optional<std::string> error;
    Clock::time_point time;
};

int64_t ToUnixMs(Clock::time_point tp);
Clock::time_point FromUnixMs(int64_t ms);
// Current time truncated to the millisecond resolution traces are stored with.
Clock::time_point NowMs();

} // namespace trace
} // namespace traceproxy
