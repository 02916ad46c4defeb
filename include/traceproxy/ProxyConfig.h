#pragma once

#include "traceproxy/hooks/Hooks.h"
#include "traceproxy/trace/TraceRenderer.h"

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace traceproxy {

namespace common {
class Config;
}

struct TargetAddress {
    std::string host{"127.0.0.1"};
    uint16_t port{8080};

    std::string ToString() const { return host + ":" + std::to_string(port); }
};

// "host:port", or a bare port meaning 127.0.0.1:<port>.
bool ParseTargetAddress(const std::string& text, TargetAddress* out, std::string* err = nullptr);
// Comma separated list of addresses. An empty list yields 127.0.0.1:8080.
bool ParseTargetList(const std::string& text, std::vector<TargetAddress>* out, std::string* err = nullptr);

// Which targets may write back to the client.
class EchoPolicy {
public:
    enum class Mode {
        kDisabled,
        kFirst,
        kAll,
        kIndices,
    };

    EchoPolicy() = default;

    static EchoPolicy Disabled() { return EchoPolicy(Mode::kDisabled, {}); }
    static EchoPolicy First() { return EchoPolicy(Mode::kFirst, {}); }
    static EchoPolicy All() { return EchoPolicy(Mode::kAll, {}); }
    static EchoPolicy Indices(std::set<int> indices) { return EchoPolicy(Mode::kIndices, std::move(indices)); }

    // "true" -> all, "false" -> none, empty -> first, otherwise a comma separated index list
    // where non-numeric or negative items are ignored and duplicates collapse.
    static EchoPolicy Parse(const std::string& text);

    bool Includes(int targetIndex) const;
    Mode mode() const { return mode_; }
    const std::set<int>& indices() const { return indices_; }
    std::string ToString() const;

    bool operator==(const EchoPolicy& other) const { return mode_ == other.mode_ && indices_ == other.indices_; }

private:
    EchoPolicy(Mode mode, std::set<int> indices) : mode_(mode), indices_(std::move(indices)) {}

    Mode mode_{Mode::kFirst};
    std::set<int> indices_;
};

// Module identifier plus options and initial state for one hook.
struct HookSpec {
    std::string module;
    hooks::HookOptions options;
    hooks::HookState initialState;

    bool empty() const { return module.empty(); }
};

struct ProxyConfig {
    uint16_t sourcePort{0};
    std::vector<TargetAddress> targets;
    EchoPolicy echo;

    HookSpec chunkHandler;
    HookSpec traceHandler;
    HookSpec traceWriter;

    std::string name;
    std::string description;
    // name, or "Proxy #<n> (<port>)"
    std::string displayName;

    trace::OutputFormat outputFormat{trace::OutputFormat::kText};
    bool writeToOutput{false};
    bool openAfterTrace{true};
    int hexWidth{trace::TraceRenderer::kDefaultHexWidth};
    bool autoStart{false};
};

// [global] section.
struct GlobalOptions {
    std::string logLevel{"INFO"};
    trace::OutputFormat outputFormat{trace::OutputFormat::kText};
    int hexWidth{trace::TraceRenderer::kDefaultHexWidth};
    bool writeToOutput{false};
    bool openAfterTrace{true};
    std::string traceDir;
};

GlobalOptions ParseGlobalOptions(const common::Config& conf);

// One ProxyConfig per valid [proxy:<port>] section, ordered by port. Invalid sections are
// skipped with a warning and described in `errors`.
std::vector<ProxyConfig> ParseProxyConfigs(const common::Config& conf, std::vector<std::string>* errors = nullptr);

} // namespace traceproxy
