#pragma once

#include "sandbox/process.h"
#include <string>
#include <vector>
#include <optional>

namespace testbox {
namespace runtime {

enum class RuntimeName {
    PYTHON,
    NODE,
    BUN
};

enum class PackageManager {
    UV,
    NPM,
    BUN
};

enum class MatchMode {
    ALL,
    ANY
};

// Marker files, matched as path suffixes of project files.
struct Signature {
    std::vector<std::string> files;
    MatchMode mode = MatchMode::ANY;
};

struct ToolSpec {
    std::string name;
    bool downloadable = false;
};

struct RuntimeConfig {
    RuntimeName name;
    std::vector<Signature> signatures;  // any one signature suffices
    PackageManager packageManager;
    sandbox::EnvList envOverrides;
    std::string binaryName;
    std::string downloadBinary;         // key into the binary spec table
    std::vector<ToolSpec> tools;
    std::string installCommand;
    std::string packageBinDir;          // relative to the work dir

    std::string urlTemplate() const;
    std::string checksumTemplate() const;
};

// Detection priority order: Bun, Node, Python.
const std::vector<RuntimeConfig>& runtimeRegistry();
const RuntimeConfig& runtimeConfig(RuntimeName name);

const char* runtimeNameString(RuntimeName name);
const char* packageManagerString(PackageManager pm);
std::optional<RuntimeName> parseRuntimeName(const std::string& s);

}
}
