#pragma once

#include "sandbox/restrictions.h"
#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <cstdint>

namespace testbox {
namespace sandbox {

using EnvList = std::vector<std::pair<std::string, std::string>>;

struct ProcessOptions {
    std::string command;
    std::string cwd;
    EnvList env;
    uint32_t timeoutMs = 0;
    size_t maxOutputBytes = 16 * 1024 * 1024;
    ChildRestrictions restrictions;
};

struct ProcessResult {
    bool started = false;
    std::string error;
    int exitCode = -1;
    int termSignal = 0;
    std::string stdoutText;
    std::string stderrText;
    bool timedOut = false;
    bool outputLimitExceeded = false;
    uint64_t durationMs = 0;
};

// Runs `/bin/sh -c command` in its own process group with exactly `env`.
// On timeout the whole group is killed.
ProcessResult runProcess(const ProcessOptions& options);

std::optional<std::string> findExecutable(const std::string& name, const std::string& pathValue,
                                          const std::string& cwd = "");

// Minimal environment for host tools (tar, unzip, git) run outside a sandbox.
EnvList hostToolEnv();

std::string shellQuote(const std::string& s);
std::string tail(const std::string& text, size_t maxBytes);

}
}
