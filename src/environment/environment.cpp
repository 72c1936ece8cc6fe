#include "environment/environment.h"
#include "crypto/crypto.h"
#include <chrono>

namespace testbox {
namespace environment {

using json = nlohmann::json;

EnvironmentInfo describe(const Environment& env) {
    EnvironmentInfo info;
    info.id = env.id;
    info.runtime = runtime::runtimeNameString(env.runtime.name);
    info.packageManager = runtime::packageManagerString(env.runtime.packageManager);
    info.root = env.sandbox.root;
    info.workDir = env.sandbox.workDir;
    info.createdAt = env.createdAt;
    info.source = env.source;
    info.branch = env.branch;
    for (const auto& layer : env.sandbox.restrictions.layers) {
        if (layer.applied) info.hardening.push_back(sandbox::layerName(layer.layer));
    }
    info.degraded = env.sandbox.restrictions.degraded();
    return info;
}

json toJson(const EnvironmentInfo& info) {
    json j;
    j["id"] = info.id;
    j["runtime"] = info.runtime;
    j["package_manager"] = info.packageManager;
    j["root"] = info.root;
    j["work_dir"] = info.workDir;
    j["created_at"] = info.createdAt;
    j["source"] = info.source;
    if (!info.branch.empty()) j["branch"] = info.branch;
    j["hardening"] = info.hardening;
    j["degraded"] = info.degraded;
    return j;
}

bool EnvironmentStore::insert(EnvironmentPtr env) {
    if (!env) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    return envs_.emplace(env->id, std::move(env)).second;
}

EnvironmentPtr EnvironmentStore::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = envs_.find(id);
    return it == envs_.end() ? nullptr : it->second;
}

EnvironmentPtr EnvironmentStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = envs_.find(id);
    if (it == envs_.end()) return nullptr;
    EnvironmentPtr env = it->second;
    envs_.erase(it);
    return env;
}

std::vector<std::string> EnvironmentStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, env] : envs_) ids.push_back(id);
    return ids;
}

size_t EnvironmentStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return envs_.size();
}

std::vector<EnvironmentPtr> EnvironmentStore::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<EnvironmentPtr> out;
    for (auto& [id, env] : envs_) out.push_back(env);
    envs_.clear();
    return out;
}

std::string newEnvironmentId() {
    return crypto::randomBase58Id(crypto::ENVIRONMENT_ID_LENGTH);
}

int64_t nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}
}
