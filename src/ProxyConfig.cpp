#include "traceproxy/ProxyConfig.h"
#include "traceproxy/common/Config.h"
#include "traceproxy/common/Logger.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>

namespace traceproxy {

namespace {

const char* const kSectionPrefix = "proxy:";
const char* const kHookKeys[] = {"chunk_handler", "trace_handler", "trace_writer"};

std::vector<std::string> SplitCsv(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == ',') {
            out.push_back(common::Config::Trim(cur));
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    out.push_back(common::Config::Trim(cur));
    return out;
}

// Strict decimal parse into [lo, hi].
bool ParseInt(const std::string& text, long lo, long hi, long* out) {
    const std::string t = common::Config::Trim(text);
    if (t.empty()) return false;
    for (char c : t) {
        if (c < '0' || c > '9') return false;
    }
    errno = 0;
    const long v = std::strtol(t.c_str(), nullptr, 10);
    if (errno != 0 || v < lo || v > hi) return false;
    *out = v;
    return true;
}

bool ParsePort(const std::string& text, uint16_t* out) {
    long v = 0;
    if (!ParseInt(text, 1, 65535, &v)) return false;
    *out = static_cast<uint16_t>(v);
    return true;
}

std::string Lookup(const common::Config::Section& s, const std::string& key, const std::string& def = "") {
    auto it = s.find(key);
    return it == s.end() ? def : it->second;
}

// Collects "<hook>_option.<k>" and "<hook>_state.<k>" keys.
HookSpec ReadHookSpec(const common::Config::Section& s, const std::string& hook) {
    HookSpec spec;
    spec.module = Lookup(s, hook);
    const std::string optPrefix = hook + "_option.";
    const std::string statePrefix = hook + "_state.";
    for (const auto& kv : s) {
        if (kv.first.compare(0, optPrefix.size(), optPrefix) == 0 && kv.first.size() > optPrefix.size()) {
            spec.options[kv.first.substr(optPrefix.size())] = kv.second;
        } else if (kv.first.compare(0, statePrefix.size(), statePrefix) == 0 && kv.first.size() > statePrefix.size()) {
            spec.initialState[kv.first.substr(statePrefix.size())] = kv.second;
        }
    }
    return spec;
}

bool ReadFlag(const common::Config::Section& s, const std::string& key, bool def) {
    const std::string v = Lookup(s, key);
    if (v.empty()) return def;
    return common::Config::ParseBool(v).value_or(def);
}

} // namespace

bool ParseTargetAddress(const std::string& text, TargetAddress* out, std::string* err) {
    const std::string t = common::Config::Trim(text);
    TargetAddress addr;
    const auto colon = t.rfind(':');
    std::string host = "127.0.0.1";
    std::string port = t;
    if (colon != std::string::npos) {
        host = common::Config::Trim(t.substr(0, colon));
        port = t.substr(colon + 1);
        if (host.empty()) host = "127.0.0.1";
    }
    if (!ParsePort(port, &addr.port)) {
        if (err) *err = "invalid target '" + t + "'";
        return false;
    }
    addr.host = host;
    *out = addr;
    return true;
}

bool ParseTargetList(const std::string& text, std::vector<TargetAddress>* out, std::string* err) {
    std::vector<TargetAddress> targets;
    if (!common::Config::Trim(text).empty()) {
        for (const auto& item : SplitCsv(text)) {
            if (item.empty()) continue;
            TargetAddress addr;
            if (!ParseTargetAddress(item, &addr, err)) return false;
            targets.push_back(addr);
        }
    }
    if (targets.empty()) {
        targets.push_back(TargetAddress());
    }
    *out = std::move(targets);
    return true;
}

EchoPolicy EchoPolicy::Parse(const std::string& text) {
    const std::string t = common::Config::Trim(text);
    if (t.empty()) return First();
    auto b = common::Config::ParseBool(t);
    // "1"/"0" are indices here, not booleans.
    if (b && t != "1" && t != "0") {
        return *b ? All() : Disabled();
    }

    std::set<int> indices;
    for (const auto& item : SplitCsv(t)) {
        long v = 0;
        if (ParseInt(item, 0, 65535, &v)) {
            indices.insert(static_cast<int>(v));
        }
    }
    return Indices(std::move(indices));
}

bool EchoPolicy::Includes(int targetIndex) const {
    switch (mode_) {
        case Mode::kDisabled: return false;
        case Mode::kFirst: return targetIndex == 0;
        case Mode::kAll: return true;
        case Mode::kIndices: return indices_.count(targetIndex) != 0;
    }
    return false;
}

std::string EchoPolicy::ToString() const {
    switch (mode_) {
        case Mode::kDisabled: return "none";
        case Mode::kFirst: return "first";
        case Mode::kAll: return "all";
        case Mode::kIndices: {
            std::string out;
            for (int i : indices_) {
                if (!out.empty()) out += ",";
                out += std::to_string(i);
            }
            return "[" + out + "]";
        }
    }
    return "first";
}

GlobalOptions ParseGlobalOptions(const common::Config& conf) {
    GlobalOptions g;
    g.logLevel = conf.GetString("global", "log_level", g.logLevel);
    g.outputFormat = trace::ParseOutputFormat(conf.GetString("global", "output_format", "text"));
    const int hw = conf.GetInt("global", "hex_width", g.hexWidth);
    if (hw > 0) g.hexWidth = hw;
    g.writeToOutput = conf.GetBool("global", "write_to_output", g.writeToOutput);
    g.openAfterTrace = conf.GetBool("global", "open_after_trace", g.openAfterTrace);
    g.traceDir = conf.GetString("global", "trace_dir", "");
    return g;
}

std::vector<ProxyConfig> ParseProxyConfigs(const common::Config& conf, std::vector<std::string>* errors) {
    const GlobalOptions global = ParseGlobalOptions(conf);
    auto reject = [errors](const std::string& msg) {
        LOG_WARN << msg;
        if (errors) errors->push_back(msg);
    };

    std::vector<ProxyConfig> out;
    const std::string prefix(kSectionPrefix);
    for (const auto& entry : conf.GetSectionsWithPrefix(prefix)) {
        const std::string& sectionName = entry.first;
        const common::Config::Section& s = entry.second;

        ProxyConfig pc;
        if (!ParsePort(sectionName.substr(prefix.size()), &pc.sourcePort)) {
            reject("[" + sectionName + "] skipped: invalid source port");
            continue;
        }
        std::string err;
        if (!ParseTargetList(Lookup(s, "to"), &pc.targets, &err)) {
            reject("[" + sectionName + "] skipped: " + err);
            continue;
        }

        auto echo = s.find("receive_chunks_from");
        pc.echo = (echo == s.end()) ? EchoPolicy::First() : EchoPolicy::Parse(echo->second);

        pc.chunkHandler = ReadHookSpec(s, kHookKeys[0]);
        pc.traceHandler = ReadHookSpec(s, kHookKeys[1]);
        pc.traceWriter = ReadHookSpec(s, kHookKeys[2]);

        pc.name = Lookup(s, "name");
        pc.description = Lookup(s, "description");

        const std::string format = Lookup(s, "output_format");
        pc.outputFormat = format.empty() ? global.outputFormat : trace::ParseOutputFormat(format);
        pc.writeToOutput = ReadFlag(s, "write_to_output", global.writeToOutput);
        pc.openAfterTrace = ReadFlag(s, "open_after_trace", global.openAfterTrace);
        pc.hexWidth = global.hexWidth;
        long hw = 0;
        const std::string hwText = Lookup(s, "hex_width");
        if (!hwText.empty()) {
            if (ParseInt(hwText, 1, 1024, &hw)) {
                pc.hexWidth = static_cast<int>(hw);
            } else {
                LOG_WARN << "[" << sectionName << "] ignoring invalid hex_width '" << hwText << "'";
            }
        }
        pc.autoStart = ReadFlag(s, "auto_start", false);

        auto dup = std::find_if(out.begin(), out.end(),
                                [&pc](const ProxyConfig& o) { return o.sourcePort == pc.sourcePort; });
        if (dup != out.end()) {
            reject("[" + sectionName + "] skipped: port " + std::to_string(pc.sourcePort) + " already configured");
            continue;
        }
        out.push_back(std::move(pc));
    }

    std::stable_sort(out.begin(), out.end(),
                     [](const ProxyConfig& a, const ProxyConfig& b) { return a.sourcePort < b.sourcePort; });
    for (size_t i = 0; i < out.size(); ++i) {
        ProxyConfig& pc = out[i];
        pc.displayName = !pc.name.empty()
                             ? pc.name
                             : "Proxy #" + std::to_string(i + 1) + " (" + std::to_string(pc.sourcePort) + ")";
    }
    return out;
}

} // namespace traceproxy
