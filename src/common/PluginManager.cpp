#include "traceproxy/common/PluginManager.h"
#include "traceproxy/common/Logger.h"

#include <dlfcn.h>
#include <mutex>
#include <utility>

namespace traceproxy {
namespace common {

static void HostLog(int level, const char* msg) {
    if (!msg) return;
    switch (level) {
        case TRACEPROXY_PLUGIN_LOG_DEBUG:
            LOG_DEBUG << "[plugin] " << msg;
            break;
        case TRACEPROXY_PLUGIN_LOG_INFO:
            LOG_INFO << "[plugin] " << msg;
            break;
        case TRACEPROXY_PLUGIN_LOG_WARN:
            LOG_WARN << "[plugin] " << msg;
            break;
        case TRACEPROXY_PLUGIN_LOG_ERROR:
        default:
            LOG_ERROR << "[plugin] " << msg;
            break;
    }
}

static const char* HostKvGet(const traceproxy_plugin_kv* kv, const char* key) {
    if (!kv || !key) return nullptr;
    const std::map<std::string, std::string>* m = kv->rw ? kv->rw : kv->ro;
    if (!m) return nullptr;
    auto it = m->find(key);
    return it == m->end() ? nullptr : it->second.c_str();
}

static void HostKvSet(traceproxy_plugin_kv* kv, const char* key, const char* value) {
    if (!kv || !kv->rw || !key) return;
    if (!value) {
        kv->rw->erase(key);
        return;
    }
    (*kv->rw)[key] = value;
}

static const traceproxy_plugin_host_v1 kHost{
    TRACEPROXY_PLUGIN_API_VERSION,
    &HostLog,
    &HostKvGet,
    &HostKvSet,
};

LoadedPlugin::LoadedPlugin(std::string path, void* handle, const traceproxy_plugin_v1* api)
    : path_(std::move(path)), handle_(handle), api_(api) {}

LoadedPlugin::~LoadedPlugin() {
    if (api_ && api_->shutdown) {
        api_->shutdown();
    }
    if (handle_) {
        ::dlclose(handle_);
    }
    LOG_INFO << "Plugin unloaded: " << path_;
}

struct PluginManager::Impl {
    mutable std::mutex mutex;
    std::map<std::string, LoadedPluginPtr> plugins;
};

PluginManager::PluginManager() : impl_(std::make_unique<Impl>()) {}

PluginManager::~PluginManager() { UnloadAll(); }

const traceproxy_plugin_host_v1* PluginManager::Host() { return &kHost; }

LoadedPluginPtr PluginManager::Load(const std::string& path, std::string* error) {
    auto fail = [&](const std::string& msg) -> LoadedPluginPtr {
        LOG_ERROR << msg;
        if (error) *error = msg;
        return nullptr;
    };

    if (path.empty()) return fail("Plugin path is empty");

    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->plugins.find(path);
    if (it != impl_->plugins.end()) return it->second;

    void* h = ::dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!h) {
        const char* err = ::dlerror();
        return fail("Plugin dlopen failed: path=" + path + " err=" + (err ? err : ""));
    }
    void* sym = ::dlsym(h, "traceproxy_plugin_get_v1");
    if (!sym) {
        ::dlclose(h);
        return fail("Plugin missing symbol traceproxy_plugin_get_v1: path=" + path);
    }
    auto getApi = reinterpret_cast<traceproxy_plugin_get_v1_fn>(sym);
    const traceproxy_plugin_v1* api = getApi();
    if (!api || api->api_version != TRACEPROXY_PLUGIN_API_VERSION || !api->name) {
        ::dlclose(h);
        return fail("Plugin API mismatch: path=" + path);
    }
    if (api->init) {
        const int rc = api->init(&kHost);
        if (rc != 0) {
            ::dlclose(h);
            return fail("Plugin init failed: path=" + path + " name=" + api->name + " rc=" + std::to_string(rc));
        }
    }

    auto loaded = std::make_shared<LoadedPlugin>(path, h, api);
    impl_->plugins.emplace(path, loaded);
    LOG_INFO << "Plugin loaded: " << api->name << " from " << path;
    return loaded;
}

void PluginManager::UnloadAll() {
    if (!impl_) return;
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->plugins.clear();
}

size_t PluginManager::LoadedCount() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->plugins.size();
}

} // namespace common
} // namespace traceproxy
