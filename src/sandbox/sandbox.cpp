#include "sandbox/sandbox.h"
#include "infrastructure/error_handling.h"
#include "utils/logger.h"
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <vector>
#include <sys/stat.h>

namespace testbox {
namespace sandbox {

namespace fs = std::filesystem;

namespace {

const char* kSystemPath = "/usr/local/bin:/usr/bin:/bin:/usr/local/sbin:/usr/sbin:/sbin";

const char* kStrippedVariables[] = {
    "PYTHONPATH", "PYTHONSTARTUP", "PYTHONHOME", "NODE_PATH", "NODE_OPTIONS", "BASH_ENV", "ENV",
};

// Forwarded from the host so dependency installs work behind a proxy.
const char* kPassThrough[] = {
    "http_proxy", "https_proxy", "no_proxy", "HTTP_PROXY", "HTTPS_PROXY", "NO_PROXY",
    "SSL_CERT_FILE", "SSL_CERT_DIR",
};

const char* kBuiltins[] = {
    "cd", "exec", "export", "set", "unset", "test", "[", "true", "false", ":", ".", "source",
    "echo", "printf", "exit", "eval", "trap", "wait", "umask", "ulimit", "command", "type",
};

void setOrReplace(EnvList& env, const std::string& key, const std::string& value) {
    for (auto& kv : env) {
        if (kv.first == key) {
            kv.second = value;
            return;
        }
    }
    env.emplace_back(key, value);
}

bool isAssignment(const std::string& word) {
    auto eq = word.find('=');
    if (eq == std::string::npos || eq == 0) return false;
    for (size_t i = 0; i < eq; ++i) {
        char c = word[i];
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) return false;
    }
    return true;
}

}

bool isLoaderHookVariable(const std::string& key) {
    if (key.rfind("LD_", 0) == 0 || key.rfind("DYLD_", 0) == 0) return true;
    for (const char* v : kStrippedVariables) {
        if (key == v) return true;
    }
    return false;
}

std::string systemPath() {
    return kSystemPath;
}

std::string Sandbox::getEnv(const std::string& key) const {
    for (const auto& kv : env) {
        if (kv.first == key) return kv.second;
    }
    return "";
}

bool Sandbox::hasEnv(const std::string& key) const {
    return std::any_of(env.begin(), env.end(), [&](const auto& kv) { return kv.first == key; });
}

bool Sandbox::setEnv(const std::string& key, const std::string& value) {
    if (isLoaderHookVariable(key)) {
        LOG_WARN("refusing loader hook variable in sandbox env key=" + key);
        return false;
    }
    setOrReplace(env, key, value);
    return true;
}

void Sandbox::prependPath(const std::string& dir) {
    std::string current = getEnv("PATH");
    setOrReplace(env, "PATH", current.empty() ? dir : dir + ":" + current);
}

std::string commandProgram(const std::string& command) {
    std::istringstream iss(command);
    std::string word;
    while (iss >> word) {
        if (isAssignment(word)) continue;
        if (word.find_first_of("()|&;<>$`{}\"'") != std::string::npos) return "";
        for (const char* b : kBuiltins) {
            if (word == b) return "";
        }
        return word;
    }
    return "";
}

SandboxManager::SandboxManager(const utils::SandboxConfig& config) : config_(config) {}

Sandbox SandboxManager::create(const std::string& prefix) const {
    std::error_code ec;
    std::string base = config_.baseDir.empty() ? fs::temp_directory_path(ec).string() : config_.baseDir;
    if (ec || base.empty()) base = "/tmp";
    fs::create_directories(base, ec);

    std::string tmpl = (fs::path(base) / ((prefix.empty() ? config_.prefix : prefix) + "XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (!mkdtemp(buf.data())) {
        TESTBOX_THROW(ErrorCode::SANDBOX_CREATION, "cannot allocate sandbox root",
                      "base=" + base + " errno=" + std::to_string(errno));
    }

    Sandbox sb;
    sb.root = buf.data();
    sb.binDir = (fs::path(sb.root) / "bin").string();
    sb.tmpDir = (fs::path(sb.root) / "tmp").string();
    sb.workDir = (fs::path(sb.root) / "work").string();
    sb.cacheDir = (fs::path(sb.root) / "cache").string();

    for (const auto& dir : {sb.binDir, sb.tmpDir, sb.workDir, sb.cacheDir}) {
        if (!fs::create_directory(dir, ec) || ec) {
            std::string reason = ec ? ec.message() : "already exists";
            std::error_code rmEc;
            fs::remove_all(sb.root, rmEc);
            if (rmEc) LOG_WARN("sandbox rollback failed root=" + sb.root + " error=" + rmEc.message());
            TESTBOX_THROW(ErrorCode::SANDBOX_CREATION, "cannot create sandbox directory",
                          "path=" + dir + " error=" + reason);
        }
    }

    sb.env = {
        {"PATH", sb.binDir + ":" + kSystemPath},
        {"HOME", sb.workDir},
        {"TMPDIR", sb.tmpDir},
        {"TMP", sb.tmpDir},
        {"TEMP", sb.tmpDir},
        {"XDG_CACHE_HOME", sb.cacheDir},
        {"XDG_RUNTIME_DIR", sb.tmpDir},
        {"LANG", "C.UTF-8"},
    };
    for (const char* key : kPassThrough) {
        const char* value = std::getenv(key);
        if (value && *value) sb.env.emplace_back(key, value);
    }

    LOG_INFO("sandbox created root=" + sb.root);
    return sb;
}

RestrictionReport SandboxManager::applyRestrictions(Sandbox& sandbox) const {
    RestrictionReport report;

    LayerStatus perms{RestrictionLayer::PERMISSIONS, false, ""};
    if (chmod(sandbox.root.c_str(), S_IRWXU) == 0) {
        perms.applied = true;
        perms.detail = "mode 0700";
    } else {
        perms.detail = std::string("chmod failed: ") + std::strerror(errno);
    }
    report.layers.push_back(perms);

    sandbox.childRestrictions.applyLimits = true;
    sandbox.childRestrictions.limits = config_.limits;
    report.layers.push_back({RestrictionLayer::RESOURCE_LIMITS, true,
                             "cpu=" + std::to_string(config_.limits.cpuSeconds) + "s memory=" +
                             std::to_string(config_.limits.memoryBytes) + " nofile=" +
                             std::to_string(config_.limits.openFiles) + " nproc=" +
                             std::to_string(config_.limits.processes)});

    LayerStatus ns{RestrictionLayer::NAMESPACES, false, ""};
    std::string reason;
    if (!config_.namespaces) {
        ns.detail = "disabled by configuration";
    } else if (namespacesSupported(&reason)) {
        sandbox.childRestrictions.userNamespace = true;
        ns.applied = true;
        ns.detail = "user namespace; network namespace for isolated phases";
    } else {
        ns.detail = reason;
    }
    report.layers.push_back(ns);

    LayerStatus sc{RestrictionLayer::SECCOMP, false, ""};
    reason.clear();
    if (!config_.seccomp) {
        sc.detail = "disabled by configuration";
    } else if (seccompSupported(&reason)) {
        sandbox.childRestrictions.seccompFilter = true;
        sc.applied = true;
        sc.detail = "syscall deny-list";
    } else {
        sc.detail = reason;
    }
    report.layers.push_back(sc);

    for (const auto& d : report.degraded()) {
        LOG_WARN("sandbox hardening unavailable root=" + sandbox.root + " layer=" + d);
    }
    sandbox.restrictions = report;
    return report;
}

bool SandboxManager::destroy(const Sandbox& sandbox) const {
    if (sandbox.root.empty()) return true;
    std::error_code ec;
    if (!fs::exists(sandbox.root, ec)) return true;
    // Package managers can leave read-only directories behind.
    for (auto it = fs::recursive_directory_iterator(sandbox.root, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_directory(ec) && !it->is_symlink(ec)) {
            fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, ec);
        }
    }
    ec.clear();
    fs::remove_all(sandbox.root, ec);
    if (ec) {
        LOG_WARN("sandbox removal failed root=" + sandbox.root + " error=" + ec.message());
        return false;
    }
    LOG_INFO("sandbox destroyed root=" + sandbox.root);
    return true;
}

CommandResult SandboxManager::runCommand(const Sandbox& sandbox, const std::string& command,
                                         const CommandOptions& options) const {
    EnvList env = sandbox.env;
    for (const auto& kv : options.extraEnv) {
        if (isLoaderHookVariable(kv.first)) {
            LOG_WARN("dropping loader hook variable key=" + kv.first);
            continue;
        }
        setOrReplace(env, kv.first, kv.second);
    }

    std::string cwd = sandbox.workDir;
    if (!options.cwd.empty()) {
        cwd = fs::path(options.cwd).is_absolute() ? options.cwd : (fs::path(sandbox.workDir) / options.cwd).string();
    }

    std::string program = commandProgram(command);
    if (!program.empty()) {
        std::string pathValue;
        for (const auto& kv : env) {
            if (kv.first == "PATH") pathValue = kv.second;
        }
        if (!findExecutable(program, pathValue, cwd)) {
            TESTBOX_THROW(ErrorCode::COMMAND_NOT_FOUND, "command not found: " + program,
                          "command=" + command + " path=" + pathValue);
        }
    }

    ProcessOptions popts;
    popts.command = command;
    popts.cwd = cwd;
    popts.env = env;
    popts.timeoutMs = options.timeoutMs;
    popts.maxOutputBytes = options.maxOutputBytes;
    popts.restrictions = sandbox.childRestrictions;
    popts.restrictions.networkNamespace = options.isolateNetwork && sandbox.childRestrictions.userNamespace;

    LOG_DEBUG("sandbox command root=" + sandbox.root + " cmd=" + command);
    ProcessResult pr = runProcess(popts);
    if (!pr.started) {
        TESTBOX_THROW(ErrorCode::EXECUTION_ERROR, "cannot spawn command: " + pr.error, "command=" + command);
    }

    CommandResult result;
    result.exitCode = pr.exitCode;
    result.termSignal = pr.termSignal;
    result.stdoutText = std::move(pr.stdoutText);
    result.stderrText = std::move(pr.stderrText);
    result.timedOut = pr.timedOut;
    result.outputLimitExceeded = pr.outputLimitExceeded;
    result.durationMs = pr.durationMs;
    LOG_DEBUG("sandbox command done exit=" + std::to_string(result.exitCode) +
              " ms=" + std::to_string(result.durationMs) + (result.timedOut ? " timed_out" : ""));
    return result;
}

}
}
