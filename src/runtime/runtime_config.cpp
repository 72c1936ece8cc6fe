#include "runtime/runtime_config.h"
#include "binaries/binary_spec.h"
#include "infrastructure/error_handling.h"
#include <algorithm>
#include <cctype>

namespace testbox {
namespace runtime {

static std::vector<RuntimeConfig> buildRegistry() {
    std::vector<RuntimeConfig> r;

    RuntimeConfig bun;
    bun.name = RuntimeName::BUN;
    bun.signatures = {
        {{"package.json", "bun.lockb"}, MatchMode::ALL},
        {{"package.json", "bun.lock"}, MatchMode::ALL},
    };
    bun.packageManager = PackageManager::BUN;
    bun.envOverrides = {{"NO_INSTALL_HINTS", "1"}};
    bun.binaryName = "bun";
    bun.downloadBinary = "bun";
    bun.tools = {{"bun", true}};
    bun.installCommand = "bun install";
    bun.packageBinDir = "node_modules/.bin";
    r.push_back(bun);

    RuntimeConfig node;
    node.name = RuntimeName::NODE;
    node.signatures = {{{"package.json"}, MatchMode::ANY}};
    node.packageManager = PackageManager::NPM;
    node.envOverrides = {{"NODE_NO_WARNINGS", "1"}};
    node.binaryName = "node";
    node.downloadBinary = "node";
    node.tools = {{"node", true}, {"npm", false}, {"npx", false}};
    node.installCommand = "npm install";
    node.packageBinDir = "node_modules/.bin";
    r.push_back(node);

    RuntimeConfig python;
    python.name = RuntimeName::PYTHON;
    python.signatures = {{{"pyproject.toml", "setup.py", "requirements.txt"}, MatchMode::ANY}};
    python.packageManager = PackageManager::UV;
    python.envOverrides = {{"PYTHONUNBUFFERED", "1"}, {"PYTHONDONTWRITEBYTECODE", "1"}};
    python.binaryName = "python";
    python.downloadBinary = "uv";
    python.tools = {{"uv", true}};
    python.installCommand = "uv sync --all-extras";
    python.packageBinDir = ".venv/bin";
    r.push_back(python);

    return r;
}

const std::vector<RuntimeConfig>& runtimeRegistry() {
    static const std::vector<RuntimeConfig> registry = buildRegistry();
    return registry;
}

const RuntimeConfig& runtimeConfig(RuntimeName name) {
    for (const auto& c : runtimeRegistry()) {
        if (c.name == name) return c;
    }
    TESTBOX_THROW(ErrorCode::INTERNAL_ERROR, "runtime missing from registry", runtimeNameString(name));
}

std::string RuntimeConfig::urlTemplate() const {
    const binaries::BinarySpec* spec = binaries::findBinarySpec(downloadBinary);
    return spec ? spec->urlTemplate : "";
}

std::string RuntimeConfig::checksumTemplate() const {
    const binaries::BinarySpec* spec = binaries::findBinarySpec(downloadBinary);
    return spec ? spec->checksumTemplate : "";
}

const char* runtimeNameString(RuntimeName name) {
    switch (name) {
        case RuntimeName::PYTHON: return "python";
        case RuntimeName::NODE: return "node";
        case RuntimeName::BUN: return "bun";
        default: return "unknown";
    }
}

const char* packageManagerString(PackageManager pm) {
    switch (pm) {
        case PackageManager::UV: return "uv";
        case PackageManager::NPM: return "npm";
        case PackageManager::BUN: return "bun";
        default: return "unknown";
    }
}

std::optional<RuntimeName> parseRuntimeName(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "python") return RuntimeName::PYTHON;
    if (lower == "node") return RuntimeName::NODE;
    if (lower == "bun") return RuntimeName::BUN;
    return std::nullopt;
}

}
}
