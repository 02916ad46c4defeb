#include "traceproxy/hooks/HookFactory.h"
#include "traceproxy/common/Logger.h"
#include "traceproxy/common/PluginManager.h"
#include "traceproxy/hooks/BuiltinHooks.h"
#include "traceproxy/hooks/PluginHooks.h"

namespace traceproxy {
namespace hooks {

namespace {

bool IsBuiltin(const std::string& id, std::string* name) {
    const std::string prefix(HookFactory::kBuiltinPrefix);
    if (id.compare(0, prefix.size(), prefix) != 0) return false;
    *name = id.substr(prefix.size());
    return true;
}

template <typename T>
std::shared_ptr<T> Unresolved(const std::string& kind, const std::string& id, std::string* err) {
    const std::string msg = "unknown " + kind + " '" + id + "'";
    LOG_ERROR << msg;
    if (err) *err = msg;
    return nullptr;
}

common::LoadedPluginPtr LoadPlugin(common::PluginManager* plugins, const std::string& id, std::string* err) {
    if (!plugins) {
        if (err) *err = "plugin loading is not available for '" + id + "'";
        return nullptr;
    }
    return plugins->Load(id, err);
}

} // namespace

std::shared_ptr<ChunkTransform> HookFactory::CreateChunkTransform(const std::string& id, std::string* err) {
    std::string name;
    if (IsBuiltin(id, &name)) {
        if (name == "passthrough") return std::make_shared<PassthroughTransform>();
        if (name == "drop-prefix") return std::make_shared<DropPrefixTransform>();
        return Unresolved<ChunkTransform>("chunk handler", id, err);
    }
    auto plugin = LoadPlugin(plugins_, id, err);
    if (!plugin) return nullptr;
    if (!plugin->api()->handle_chunk) {
        if (err) *err = "plugin " + id + " does not implement handle_chunk";
        return nullptr;
    }
    return std::make_shared<PluginChunkTransform>(plugin);
}

std::shared_ptr<TraceObserver> HookFactory::CreateTraceObserver(const std::string& id, std::string* err) {
    std::string name;
    if (IsBuiltin(id, &name)) {
        if (name == "log") return std::make_shared<LogTraceObserver>();
        return Unresolved<TraceObserver>("trace handler", id, err);
    }
    auto plugin = LoadPlugin(plugins_, id, err);
    if (!plugin) return nullptr;
    if (!plugin->api()->handle_trace) {
        if (err) *err = "plugin " + id + " does not implement handle_trace";
        return nullptr;
    }
    return std::make_shared<PluginTraceObserver>(plugin);
}

std::shared_ptr<TraceWriter> HookFactory::CreateTraceWriter(const std::string& id, std::string* err) {
    std::string name;
    if (IsBuiltin(id, &name)) {
        if (name == "file") return std::make_shared<FileTraceWriter>();
        return Unresolved<TraceWriter>("trace writer", id, err);
    }
    auto plugin = LoadPlugin(plugins_, id, err);
    if (!plugin) return nullptr;
    if (!plugin->api()->write_trace) {
        if (err) *err = "plugin " + id + " does not implement write_trace";
        return nullptr;
    }
    return std::make_shared<PluginTraceWriter>(plugin);
}

} // namespace hooks
} // namespace traceproxy
