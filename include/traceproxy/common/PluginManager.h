#pragma once

#include "traceproxy/common/PluginApi.h"

#include <map>
#include <memory>
#include <string>

// Host-side definition of the opaque store handed to plugins.
struct traceproxy_plugin_kv {
    const std::map<std::string, std::string>* ro{nullptr};
    std::map<std::string, std::string>* rw{nullptr};
};

namespace traceproxy {
namespace common {

// One dlopen'ed plugin. Unloaded (shutdown + dlclose) when the last reference goes away.
class LoadedPlugin {
public:
    LoadedPlugin(std::string path, void* handle, const traceproxy_plugin_v1* api);
    ~LoadedPlugin();

    LoadedPlugin(const LoadedPlugin&) = delete;
    LoadedPlugin& operator=(const LoadedPlugin&) = delete;

    const std::string& path() const { return path_; }
    const char* name() const { return api_->name; }
    const traceproxy_plugin_v1* api() const { return api_; }

private:
    std::string path_;
    void* handle_;
    const traceproxy_plugin_v1* api_;
};

using LoadedPluginPtr = std::shared_ptr<LoadedPlugin>;

class PluginManager {
public:
    PluginManager();
    ~PluginManager();

    // Loads (or returns the already loaded) plugin at `path`. Returns nullptr and fills
    // `error` when the file cannot be opened, lacks the entry point, or its init fails.
    LoadedPluginPtr Load(const std::string& path, std::string* error = nullptr);

    // Drops the manager's references; plugins still referenced by hooks stay loaded.
    void UnloadAll();

    size_t LoadedCount() const;

    static const traceproxy_plugin_host_v1* Host();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace common
} // namespace traceproxy
