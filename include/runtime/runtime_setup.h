#pragma once

#include "runtime/runtime_config.h"
#include "sandbox/sandbox.h"
#include "binaries/binary_acquirer.h"
#include "utils/config.h"
#include <string>
#include <map>

namespace testbox {
namespace runtime {

struct SetupOptions {
    bool download = true;
    int installTimeoutSeconds = 900;
    std::map<std::string, std::string> pinnedVersions;  // tool name -> version
    std::string hostPath;                               // empty = $PATH of this process
};

SetupOptions setupOptionsFromConfig(const utils::BinaryConfig& binaries, const utils::TestConfig& tests);

struct InstallOutcome {
    int exitCode = 0;
    uint64_t durationMs = 0;
    std::string stdoutTail;
    std::string stderrTail;
};

// Puts a runtime's tools into a sandbox and installs the project's
// dependencies. The acquirer may be null when downloading is off.
class RuntimeSetup {
public:
    RuntimeSetup(const sandbox::SandboxManager& manager, binaries::BinaryAcquirer* acquirer,
                 const SetupOptions& options = SetupOptions());

    // Symlinks every tool into the sandbox bin dir; returns name -> target.
    // Throws Exception(COMMAND_NOT_FOUND) for tools that cannot be found.
    std::map<std::string, std::string> provisionTools(sandbox::Sandbox& sb, const RuntimeConfig& config);

    void configureEnvironment(sandbox::Sandbox& sb, const RuntimeConfig& config) const;

    // Throws Exception(INSTALL_FAILURE) on nonzero exit or timeout.
    InstallOutcome installDependencies(const sandbox::Sandbox& sb, const RuntimeConfig& config) const;

    // provisionTools + configureEnvironment + installDependencies.
    InstallOutcome setup(sandbox::Sandbox& sb, const RuntimeConfig& config);

private:
    std::string locateTool(const ToolSpec& tool);

    const sandbox::SandboxManager& manager_;
    binaries::BinaryAcquirer* acquirer_;
    SetupOptions options_;
};

}
}
