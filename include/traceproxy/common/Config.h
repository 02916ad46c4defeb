#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "traceproxy/common/noncopyable.h"

namespace traceproxy {
namespace common {

// INI-style settings: "[section]" headers, "key = value" lines, '#'/';' comments.
// Keys before the first header land in [global].
class Config : noncopyable {
public:
    using Section = std::map<std::string, std::string>;

    static Config& Instance();

    bool Load(const std::string& filename);
    // Parse INI text into in-memory settings (does not change loaded filename).
    bool LoadFromString(const std::string& iniText);

    std::optional<std::string> LoadedFilename() const;

    std::string GetString(const std::string& section, const std::string& key, const std::string& defaultVal = "") const;
    int GetInt(const std::string& section, const std::string& key, int defaultVal = 0) const;
    // Accepts 1/0, true/false, yes/no, on/off (case-insensitive).
    bool GetBool(const std::string& section, const std::string& key, bool defaultVal = false) const;

    bool HasSection(const std::string& section) const;

    // Sections whose name starts with prefix, as (section_name, key->value) pairs, in name order.
    std::vector<std::pair<std::string, Section>> GetSectionsWithPrefix(const std::string& prefix) const;

    static std::string Trim(const std::string& s);
    static std::optional<bool> ParseBool(const std::string& s);

private:
    Config() = default;
    static std::map<std::string, Section> ParseIni(std::istream& in);

    mutable std::mutex mutex_;
    std::map<std::string, Section> settings_;
    std::string loadedFilename_;
};

} // namespace common
} // namespace traceproxy
