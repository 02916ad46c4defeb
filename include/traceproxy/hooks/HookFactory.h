#pragma once

#include "traceproxy/hooks/Hooks.h"

#include <memory>
#include <string>

namespace traceproxy {
namespace common {
class PluginManager;
}

namespace hooks {

// Resolves module identifiers: "builtin:<name>" selects a built-in, anything else is
// a path to a shared object implementing the plugin ABI.
// Create* return nullptr (and fill `err`) when the identifier cannot be resolved.
class HookFactory {
public:
    static constexpr const char* kBuiltinPrefix = "builtin:";

    explicit HookFactory(common::PluginManager* plugins) : plugins_(plugins) {}

    std::shared_ptr<ChunkTransform> CreateChunkTransform(const std::string& id, std::string* err = nullptr);
    std::shared_ptr<TraceObserver> CreateTraceObserver(const std::string& id, std::string* err = nullptr);
    std::shared_ptr<TraceWriter> CreateTraceWriter(const std::string& id, std::string* err = nullptr);

private:
    common::PluginManager* plugins_;
};

} // namespace hooks
} // namespace traceproxy
