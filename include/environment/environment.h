#pragma once

#include "runtime/runtime_config.h"
#include "sandbox/sandbox.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <cstdint>

namespace testbox {
namespace environment {

// Sandbox plus the runtime detected in it. Owns the sandbox; the service
// destroys both together.
struct Environment {
    std::string id;
    runtime::RuntimeConfig runtime;
    sandbox::Sandbox sandbox;
    int64_t createdAt = 0;   // unix ms
    std::string source;
    std::string branch;
    std::map<std::string, std::string> tools;

    // Serializes test runs in one sandbox.
    std::mutex runMutex;
};

using EnvironmentPtr = std::shared_ptr<Environment>;

// Copyable view handed to callers.
struct EnvironmentInfo {
    std::string id;
    std::string runtime;
    std::string packageManager;
    std::string root;
    std::string workDir;
    int64_t createdAt = 0;
    std::string source;
    std::string branch;
    std::vector<std::string> hardening;
    std::vector<std::string> degraded;
};

EnvironmentInfo describe(const Environment& env);
nlohmann::json toJson(const EnvironmentInfo& info);

// Registry of live environments, owned by the service.
class EnvironmentStore {
public:
    EnvironmentStore() = default;
    EnvironmentStore(const EnvironmentStore&) = delete;
    EnvironmentStore& operator=(const EnvironmentStore&) = delete;

    // False when the id is already taken.
    bool insert(EnvironmentPtr env);
    EnvironmentPtr get(const std::string& id) const;
    EnvironmentPtr remove(const std::string& id);
    std::vector<std::string> list() const;
    size_t size() const;
    std::vector<EnvironmentPtr> drain();

private:
    mutable std::mutex mutex_;
    std::map<std::string, EnvironmentPtr> envs_;
};

std::string newEnvironmentId();
int64_t nowMillis();

}
}
