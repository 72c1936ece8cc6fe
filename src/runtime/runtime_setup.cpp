#include "runtime/runtime_setup.h"
#include "infrastructure/error_handling.h"
#include "utils/logger.h"
#include <filesystem>
#include <cstdlib>

namespace testbox {
namespace runtime {

namespace fs = std::filesystem;

static const size_t kOutputTail = 4096;

SetupOptions setupOptionsFromConfig(const utils::BinaryConfig& binaries, const utils::TestConfig& tests) {
    SetupOptions opts;
    opts.download = binaries.download;
    opts.installTimeoutSeconds = utils::boundedTimeoutSeconds(tests.installTimeoutSeconds);
    for (const char* name : {"node", "bun", "uv"}) {
        std::string pin = binaries.pinnedVersion(name);
        if (!pin.empty()) opts.pinnedVersions[name] = pin;
    }
    return opts;
}

RuntimeSetup::RuntimeSetup(const sandbox::SandboxManager& manager, binaries::BinaryAcquirer* acquirer,
                           const SetupOptions& options)
    : manager_(manager), acquirer_(acquirer), options_(options) {}

std::string RuntimeSetup::locateTool(const ToolSpec& tool) {
    if (tool.downloadable && options_.download && acquirer_) {
        auto pin = options_.pinnedVersions.find(tool.name);
        return acquirer_->ensure(tool.name, pin == options_.pinnedVersions.end() ? "" : pin->second);
    }

    std::string hostPath = options_.hostPath;
    if (hostPath.empty()) {
        const char* env = std::getenv("PATH");
        hostPath = env ? env : "";
    }
    auto found = sandbox::findExecutable(tool.name, hostPath);
    if (!found) {
        TESTBOX_THROW(ErrorCode::COMMAND_NOT_FOUND, "required tool not found on host: " + tool.name,
                      "tool=" + tool.name + " path=" + hostPath);
    }
    return *found;
}

std::map<std::string, std::string> RuntimeSetup::provisionTools(sandbox::Sandbox& sb, const RuntimeConfig& config) {
    std::map<std::string, std::string> linked;
    for (const auto& tool : config.tools) {
        std::string target = locateTool(tool);
        fs::path link = fs::path(sb.binDir) / tool.name;
        std::error_code ec;
        if (fs::is_symlink(link, ec) || fs::exists(link, ec)) fs::remove(link, ec);
        fs::create_symlink(target, link, ec);
        if (ec) {
            TESTBOX_THROW(ErrorCode::SANDBOX_CREATION, "cannot link tool into sandbox",
                          "tool=" + tool.name + " target=" + target + " error=" + ec.message());
        }
        LOG_DEBUG("tool linked name=" + tool.name + " target=" + target);
        linked[tool.name] = target;
    }
    return linked;
}

void RuntimeSetup::configureEnvironment(sandbox::Sandbox& sb, const RuntimeConfig& config) const {
    for (const auto& kv : config.envOverrides) sb.setEnv(kv.first, kv.second);
    if (!config.packageBinDir.empty()) {
        sb.prependPath((fs::path(sb.workDir) / config.packageBinDir).string());
    }
    if (config.packageManager == PackageManager::UV) {
        sb.setEnv("UV_CACHE_DIR", (fs::path(sb.cacheDir) / "uv").string());
        sb.setEnv("VIRTUAL_ENV", (fs::path(sb.workDir) / ".venv").string());
    } else {
        sb.setEnv("npm_config_cache", (fs::path(sb.cacheDir) / "npm").string());
        sb.setEnv("BUN_INSTALL_CACHE_DIR", (fs::path(sb.cacheDir) / "bun").string());
    }
}

InstallOutcome RuntimeSetup::installDependencies(const sandbox::Sandbox& sb, const RuntimeConfig& config) const {
    std::string runtimeName = runtimeNameString(config.name);
    LOG_INFO("installing dependencies runtime=" + runtimeName + " cmd=" + config.installCommand);

    sandbox::CommandOptions opts;
    opts.timeoutMs = static_cast<uint32_t>(utils::boundedTimeoutSeconds(options_.installTimeoutSeconds)) * 1000;
    sandbox::CommandResult r = manager_.runCommand(sb, config.installCommand, opts);

    InstallOutcome out;
    out.exitCode = r.exitCode;
    out.durationMs = r.durationMs;
    out.stdoutTail = sandbox::tail(r.stdoutText, kOutputTail);
    out.stderrTail = sandbox::tail(r.stderrText, kOutputTail);

    if (r.timedOut) {
        TESTBOX_THROW(ErrorCode::INSTALL_FAILURE, "dependency install timed out",
                      "runtime=" + runtimeName + " timeout_s=" + std::to_string(options_.installTimeoutSeconds));
    }
    if (r.exitCode != 0) {
        LOG_ERROR("dependency install failed runtime=" + runtimeName + " exit=" + std::to_string(r.exitCode));
        TESTBOX_THROW(ErrorCode::INSTALL_FAILURE, "dependency install failed",
                      "runtime=" + runtimeName + " cmd=" + config.installCommand + " exit=" +
                      std::to_string(r.exitCode) + " stderr=" + out.stderrTail + " stdout=" + out.stdoutTail);
    }
    LOG_INFO("dependencies installed runtime=" + runtimeName + " ms=" + std::to_string(r.durationMs));
    return out;
}

InstallOutcome RuntimeSetup::setup(sandbox::Sandbox& sb, const RuntimeConfig& config) {
    provisionTools(sb, config);
    configureEnvironment(sb, config);
    return installDependencies(sb, config);
}

}
}
