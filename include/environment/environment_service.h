#pragma once

#include "environment/environment.h"
#include "infrastructure/error_handling.h"
#include "runners/test_runner.h"
#include "utils/config.h"
#include "web/curl_fetch.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <memory>

namespace testbox {
namespace environment {

struct ServiceOptions {
    utils::CacheConfig cache;
    utils::BinaryConfig binaries;
    utils::SandboxConfig sandbox;
    utils::TestConfig tests;
    utils::HttpConfig http;
    std::string hostPath;   // where host tools are looked up; empty = $PATH

    static ServiceOptions fromConfig(const utils::Config& config);
};

// The four entry points of the front end. Every failure comes back as an
// Error inside the Result; nothing escapes as an exception.
class EnvironmentService {
public:
    explicit EnvironmentService(const ServiceOptions& options,
                                std::shared_ptr<web::HttpClient> http = nullptr,
                                const runners::TestRunnerRegistry& runners = runners::TestRunnerRegistry::defaults());
    ~EnvironmentService();

    EnvironmentService(const EnvironmentService&) = delete;
    EnvironmentService& operator=(const EnvironmentService&) = delete;

    // source is a local directory or a repository reference.
    Result<EnvironmentInfo> createFromSource(const std::string& source, const std::string& branch = "");
    Result<runners::RunReport> runTests(const std::string& id);
    Result<EnvironmentInfo> getEnvironment(const std::string& id) const;
    Result<void> cleanupEnvironment(const std::string& id);

    std::vector<std::string> listEnvironments() const;
    size_t cleanupAll();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

nlohmann::json errorJson(const Error& error);
nlohmann::json envelope(const Result<EnvironmentInfo>& result);
nlohmann::json envelope(const Result<runners::RunReport>& result);
nlohmann::json envelope(const Result<void>& result);

}
}
