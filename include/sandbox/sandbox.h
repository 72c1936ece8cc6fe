#pragma once

#include "sandbox/process.h"
#include "sandbox/restrictions.h"
#include "utils/config.h"
#include <string>
#include <cstdint>

namespace testbox {
namespace sandbox {

// Directory tree plus the exact environment its commands see. All four
// directories live under root.
struct Sandbox {
    std::string root;
    std::string workDir;
    std::string binDir;
    std::string tmpDir;
    std::string cacheDir;
    EnvList env;
    RestrictionReport restrictions;
    ChildRestrictions childRestrictions;

    std::string getEnv(const std::string& key) const;
    bool hasEnv(const std::string& key) const;
    // Loader hook variables are refused.
    bool setEnv(const std::string& key, const std::string& value);
    void prependPath(const std::string& dir);
};

struct CommandOptions {
    EnvList extraEnv;
    std::string cwd;            // relative to workDir when not absolute
    uint32_t timeoutMs = 0;
    bool isolateNetwork = false;
    size_t maxOutputBytes = 16 * 1024 * 1024;
};

struct CommandResult {
    int exitCode = -1;
    int termSignal = 0;
    std::string stdoutText;
    std::string stderrText;
    bool timedOut = false;
    bool outputLimitExceeded = false;
    uint64_t durationMs = 0;
};

class SandboxManager {
public:
    explicit SandboxManager(const utils::SandboxConfig& config = utils::SandboxConfig());

    // Throws Exception(SANDBOX_CREATION); nothing is left on disk then.
    Sandbox create(const std::string& prefix = "") const;

    // Best effort. The report says which layers took effect.
    RestrictionReport applyRestrictions(Sandbox& sandbox) const;

    // Idempotent; returns false only when an existing root could not be removed.
    bool destroy(const Sandbox& sandbox) const;

    // Throws Exception(COMMAND_NOT_FOUND) before spawning when the program is
    // not on the sandbox PATH, Exception(EXECUTION_ERROR) when spawning fails.
    CommandResult runCommand(const Sandbox& sandbox, const std::string& command,
                             const CommandOptions& options = CommandOptions()) const;

    const utils::SandboxConfig& config() const { return config_; }

private:
    utils::SandboxConfig config_;
};

bool isLoaderHookVariable(const std::string& key);
std::string systemPath();

// First word of a shell command that names a program, skipping VAR=value
// assignments. Empty when the command starts with shell syntax or a builtin.
std::string commandProgram(const std::string& command);

}
}
