#include "traceproxy/trace/TraceEntry.h"

namespace traceproxy {
namespace trace {

const char* DirectionName(Direction d) {
    switch (d) {
        case Direction::kClientToTarget: return "client-to-target";
        case Direction::kTargetToClient: return "target-to-client";
    }
    return "unknown";
}

bool ParseDirection(const std::string& s, Direction* out) {
    if (s == "client-to-target") {
        *out = Direction::kClientToTarget;
        return true;
    }
    if (s == "target-to-client") {
        *out = Direction::kTargetToClient;
        return true;
    }
    return false;
}

int64_t ToUnixMs(Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

Clock::time_point FromUnixMs(int64_t ms) {
    return Clock::time_point(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

Clock::time_point NowMs() {
    return FromUnixMs(ToUnixMs(Clock::now()));
}

} // namespace trace
} // namespace traceproxy
