#include "environment/environment_service.h"
#include "environment/source.h"
#include "binaries/binary_acquirer.h"
#include "binaries/binary_cache.h"
#include "platform/platform.h"
#include "runtime/runtime_detector.h"
#include "runtime/runtime_setup.h"
#include "sandbox/sandbox.h"
#include "utils/logger.h"

namespace testbox {
namespace environment {

using json = nlohmann::json;

ServiceOptions ServiceOptions::fromConfig(const utils::Config& config) {
    ServiceOptions opts;
    opts.cache = config.getCacheConfig();
    opts.binaries = config.getBinaryConfig();
    opts.sandbox = config.getSandboxConfig();
    opts.tests = config.getTestConfig();
    opts.http = config.getHttpConfig();
    return opts;
}

namespace {

// Destroys the sandbox unless provisioning got all the way through.
class SandboxGuard {
public:
    SandboxGuard(const sandbox::SandboxManager& manager, const sandbox::Sandbox& sb)
        : manager_(manager), sb_(sb) {}
    ~SandboxGuard() {
        if (armed_ && !manager_.destroy(sb_)) {
            LOG_WARN("rollback left sandbox behind root=" + sb_.root);
        }
    }
    void release() { armed_ = false; }

private:
    const sandbox::SandboxManager& manager_;
    const sandbox::Sandbox& sb_;
    bool armed_ = true;
};

Error fromException(const std::exception& e) {
    if (auto* te = dynamic_cast<const Exception*>(&e)) return te->error();
    return makeError(ErrorCode::INTERNAL_ERROR, e.what());
}

}

struct EnvironmentService::Impl {
    ServiceOptions options;
    std::shared_ptr<web::HttpClient> http;
    const runners::TestRunnerRegistry& registry;

    sandbox::SandboxManager manager;
    std::unique_ptr<binaries::BinaryCache> cache;
    std::unique_ptr<binaries::BinaryAcquirer> acquirer;
    std::unique_ptr<runtime::RuntimeSetup> setup;
    std::unique_ptr<runners::TestExecutor> executor;
    GitSourceProvider git;
    LocalPathSourceProvider local;
    EnvironmentStore store;

    Impl(const ServiceOptions& opts, std::shared_ptr<web::HttpClient> client,
         const runners::TestRunnerRegistry& runners)
        : options(opts), http(std::move(client)), registry(runners), manager(opts.sandbox),
          git(manager, opts.hostPath) {}

    SourceProvider& providerFor(const std::string& source) {
        if (isLocalSource(source)) return local;
        return git;
    }
};

EnvironmentService::EnvironmentService(const ServiceOptions& options, std::shared_ptr<web::HttpClient> http,
                                       const runners::TestRunnerRegistry& runners)
    : impl_(std::make_unique<Impl>(options, std::move(http), runners)) {
    if (options.binaries.download) {
        if (platform::isPlatformSupported()) {
            if (!impl_->http) {
                web::HttpOptions ho;
                ho.timeoutSeconds = static_cast<uint32_t>(utils::boundedTimeoutSeconds(options.http.timeoutSeconds));
                ho.userAgent = options.http.userAgent;
                impl_->http = std::make_shared<web::CurlHttpClient>(ho);
            }
            impl_->cache = std::make_unique<binaries::BinaryCache>(options.cache.dir);
            binaries::AcquirerOptions ao;
            ao.requireChecksum = options.binaries.requireChecksum;
            ao.cacheMaxBytes = options.cache.maxBytes;
            impl_->acquirer = std::make_unique<binaries::BinaryAcquirer>(
                *impl_->cache, *impl_->http, platform::currentPlatform(), ao);
        } else {
            LOG_WARN("host platform has no published runtime binaries; using host tools");
        }
    }

    runtime::SetupOptions so = runtime::setupOptionsFromConfig(options.binaries, options.tests);
    so.hostPath = options.hostPath;
    impl_->setup = std::make_unique<runtime::RuntimeSetup>(impl_->manager, impl_->acquirer.get(), so);

    runners::RunOptions ro;
    ro.timeoutSeconds = static_cast<uint32_t>(utils::boundedTimeoutSeconds(options.tests.timeoutSeconds));
    ro.isolateNetwork = options.tests.isolateNetwork;
    ro.collectCoverage = options.tests.collectCoverage;
    impl_->executor = std::make_unique<runners::TestExecutor>(impl_->registry, impl_->manager, ro);
}

EnvironmentService::~EnvironmentService() {
    size_t n = cleanupAll();
    if (n > 0) LOG_INFO("environment service shut down, cleaned=" + std::to_string(n));
}

Result<EnvironmentInfo> EnvironmentService::createFromSource(const std::string& source, const std::string& branch) {
    LOG_INFO("creating environment source=" + source + (branch.empty() ? "" : " branch=" + branch));
    try {
        if (source.empty()) {
            TESTBOX_THROW(ErrorCode::INVALID_ARGUMENT, "source is empty", "");
        }
        auto env = std::make_shared<Environment>();
        env->sandbox = impl_->manager.create();
        SandboxGuard guard(impl_->manager, env->sandbox);
        impl_->manager.applyRestrictions(env->sandbox);

        SourceProvider& provider = impl_->providerFor(source);
        provider.materialize(source, branch, env->sandbox.workDir);

        env->runtime = runtime::detectRuntime(env->sandbox.workDir);
        env->tools = impl_->setup->provisionTools(env->sandbox, env->runtime);
        impl_->setup->configureEnvironment(env->sandbox, env->runtime);
        impl_->setup->installDependencies(env->sandbox, env->runtime);

        env->source = source;
        env->branch = branch;
        env->createdAt = nowMillis();
        env->id = newEnvironmentId();
        while (!impl_->store.insert(env)) env->id = newEnvironmentId();
        guard.release();

        LOG_INFO("environment ready id=" + env->id + " runtime=" +
                 runtime::runtimeNameString(env->runtime.name) + " root=" + env->sandbox.root);
        return describe(*env);
    } catch (const std::exception& e) {
        Error err = fromException(e);
        if (err.context.empty()) err.context = "source=" + source;
        ErrorHandler::instance().handle(err);
        LOG_ERROR("environment creation failed source=" + source + " error=" + describeError(err));
        return err;
    }
}

Result<runners::RunReport> EnvironmentService::runTests(const std::string& id) {
    EnvironmentPtr env = impl_->store.get(id);
    if (!env) return makeError(ErrorCode::NOT_FOUND, "unknown environment", "env_id=" + id);
    try {
        std::lock_guard<std::mutex> lock(env->runMutex);
        return impl_->executor->executeAll(*env);
    } catch (const std::exception& e) {
        Error err = fromException(e);
        ErrorHandler::instance().handle(err);
        LOG_ERROR("test run failed env=" + id + " error=" + describeError(err));
        return err;
    }
}

Result<EnvironmentInfo> EnvironmentService::getEnvironment(const std::string& id) const {
    EnvironmentPtr env = impl_->store.get(id);
    if (!env) return makeError(ErrorCode::NOT_FOUND, "unknown environment", "env_id=" + id);
    return describe(*env);
}

Result<void> EnvironmentService::cleanupEnvironment(const std::string& id) {
    EnvironmentPtr env = impl_->store.remove(id);
    if (!env) return makeError(ErrorCode::NOT_FOUND, "unknown environment", "env_id=" + id);
    std::lock_guard<std::mutex> lock(env->runMutex);
    if (!impl_->manager.destroy(env->sandbox)) {
        LOG_WARN("environment sandbox not fully removed id=" + id + " root=" + env->sandbox.root);
    }
    LOG_INFO("environment cleaned id=" + id);
    return Result<void>();
}

std::vector<std::string> EnvironmentService::listEnvironments() const {
    return impl_->store.list();
}

size_t EnvironmentService::cleanupAll() {
    std::vector<EnvironmentPtr> envs = impl_->store.drain();
    for (const auto& env : envs) {
        std::lock_guard<std::mutex> lock(env->runMutex);
        impl_->manager.destroy(env->sandbox);
    }
    return envs.size();
}

json errorJson(const Error& error) {
    json j;
    j["code"] = errorCodeName(error.code);
    j["message"] = error.message;
    if (!error.context.empty()) j["context"] = error.context;
    return j;
}

json envelope(const Result<EnvironmentInfo>& result) {
    if (result.failed()) return json{{"success", false}, {"error", errorJson(result.error())}};
    return json{{"success", true}, {"data", toJson(result.value())}};
}

json envelope(const Result<runners::RunReport>& result) {
    if (result.failed()) return json{{"success", false}, {"error", errorJson(result.error())}};
    return json{{"success", true}, {"data", runners::toJson(result.value())}};
}

json envelope(const Result<void>& result) {
    if (result.failed()) return json{{"success", false}, {"error", errorJson(result.error())}};
    return json{{"success", true}, {"data", nullptr}};
}

}
}
