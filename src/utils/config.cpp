#include "utils/config.h"
#include <unordered_map>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <stdexcept>

extern char** environ;

namespace testbox {
namespace utils {

struct Config::Impl {
    std::unordered_map<std::string, std::string> data;
    std::string configPath;
    std::function<void(const std::string&)> changeCallback;
    mutable std::mutex mtx;

    void notifyChange(const std::string& key) {
        if (changeCallback) changeCallback(key);
    }
};

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

std::string BinaryConfig::pinnedVersion(const std::string& binaryName) const {
    if (binaryName == "node") return nodeVersion;
    if (binaryName == "bun") return bunVersion;
    if (binaryName == "uv") return uvVersion;
    return "";
}

Config::Config() : impl_(std::make_unique<Impl>()) {
    loadDefaults();
}

Config& Config::instance() {
    static Config inst;
    return inst;
}

std::string Config::defaultCacheDir() {
    const char* xdg = std::getenv("XDG_CACHE_HOME");
    if (xdg && *xdg) {
        return std::string(xdg) + "/testbox/binaries";
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return std::string(home) + "/.cache/testbox/binaries";
    }
    return (std::filesystem::temp_directory_path() / "testbox-cache" / "binaries").string();
}

bool Config::loadDefaults() {
    set("cache.dir", defaultCacheDir());
    set("cache.max_bytes", static_cast<int64_t>(1073741824LL));

    set("binaries.download", true);
    set("binaries.require_checksum", false);
    set("binaries.node.version", "");
    set("binaries.bun.version", "");
    set("binaries.uv.version", "");

    set("sandbox.prefix", "testbox-");
    set("sandbox.base_dir", std::filesystem::temp_directory_path().string());
    set("sandbox.limits.cpu_seconds", static_cast<int64_t>(900));
    set("sandbox.limits.memory_bytes", static_cast<int64_t>(4294967296LL));
    set("sandbox.limits.open_files", static_cast<int64_t>(1024));
    set("sandbox.limits.processes", static_cast<int64_t>(4096));
    set("sandbox.limits.file_size_bytes", static_cast<int64_t>(1073741824LL));
    set("sandbox.namespaces", true);
    set("sandbox.seccomp", true);

    set("tests.timeout_seconds", 300);
    set("tests.isolate_network", true);
    set("tests.collect_coverage", false);
    set("install.timeout_seconds", 900);

    set("http.timeout_seconds", 300);
    set("http.user_agent", "testbox/0.1");

    set("log.level", "info");
    set("log.file", "");
    return true;
}

void Config::reset() {
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->data.clear();
        impl_->configPath.clear();
    }
    loadDefaults();
}

bool Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return false;

    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->configPath = path;
    std::string line;

    while (std::getline(file, line)) {
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') continue;

        auto pos = t.find('=');
        if (pos != std::string::npos) {
            std::string key = trim(t.substr(0, pos));
            std::string value = trim(t.substr(pos + 1));
            if (!key.empty()) impl_->data[key] = value;
        }
    }
    return true;
}

bool Config::save(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::string savePath = path.empty() ? impl_->configPath : path;
    if (savePath.empty()) return false;

    std::ofstream file(savePath);
    if (!file.is_open()) return false;

    file << "# testbox configuration\n\n";

    std::vector<std::string> sortedKeys;
    for (const auto& [key, value] : impl_->data) {
        sortedKeys.push_back(key);
    }
    std::sort(sortedKeys.begin(), sortedKeys.end());

    std::string lastPrefix;
    for (const auto& key : sortedKeys) {
        auto pos = key.find('.');
        std::string prefix = pos != std::string::npos ? key.substr(0, pos) : "";
        if (prefix != lastPrefix && !lastPrefix.empty()) {
            file << "\n";
        }
        lastPrefix = prefix;
        file << key << "=" << impl_->data[key] << "\n";
    }
    return true;
}

void Config::applyEnvironmentOverrides() {
    std::vector<std::string> known = keys();
    for (char** env = environ; env && *env; ++env) {
        std::string entry(*env);
        if (entry.compare(0, 8, "TESTBOX_") != 0) continue;
        auto eq = entry.find('=');
        if (eq == std::string::npos) continue;
        std::string name = entry.substr(8, eq - 8);
        std::string value = entry.substr(eq + 1);
        for (const auto& key : known) {
            std::string mangled = key;
            std::replace(mangled.begin(), mangled.end(), '.', '_');
            std::transform(mangled.begin(), mangled.end(), mangled.begin(), ::toupper);
            if (mangled == name) {
                set(key, value);
                break;
            }
        }
    }
}

std::string Config::getString(const std::string& key, const std::string& def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    return it != impl_->data.end() ? it->second : def;
}

int Config::getInt(const std::string& key, int def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    try { return std::stoi(it->second); }
    catch (const std::exception&) { return def; }
}

int64_t Config::getInt64(const std::string& key, int64_t def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    try { return std::stoll(it->second); }
    catch (const std::exception&) { return def; }
}

bool Config::getBool(const std::string& key, bool def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    std::string val = it->second;
    std::transform(val.begin(), val.end(), val.begin(), ::tolower);
    if (val == "true" || val == "1" || val == "yes" || val == "on") return true;
    if (val == "false" || val == "0" || val == "no" || val == "off") return false;
    return def;
}

std::vector<std::string> Config::getList(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<std::string> result;
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return result;

    std::istringstream iss(it->second);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = trim(item);
        if (!item.empty()) result.push_back(item);
    }
    return result;
}

void Config::set(const std::string& key, const std::string& value) {
    std::function<void(const std::string&)> cb;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->data[key] = value;
        cb = impl_->changeCallback;
    }
    if (cb) cb(key);
}

void Config::set(const std::string& key, const char* value) {
    set(key, std::string(value ? value : ""));
}

void Config::set(const std::string& key, int value) {
    set(key, std::to_string(value));
}

void Config::set(const std::string& key, int64_t value) {
    set(key, std::to_string(value));
}

void Config::set(const std::string& key, bool value) {
    set(key, std::string(value ? "true" : "false"));
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->data.find(key) != impl_->data.end();
}

void Config::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->data.erase(key);
    impl_->notifyChange(key);
}

std::vector<std::string> Config::keys(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<std::string> result;
    for (const auto& [key, value] : impl_->data) {
        if (prefix.empty() || key.compare(0, prefix.size(), prefix) == 0) {
            result.push_back(key);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

static uint64_t nonNegative(int64_t v, uint64_t def) {
    return v < 0 ? def : static_cast<uint64_t>(v);
}

CacheConfig Config::getCacheConfig() const {
    CacheConfig cfg;
    cfg.dir = getString("cache.dir", defaultCacheDir());
    cfg.maxBytes = nonNegative(getInt64("cache.max_bytes", 1073741824LL), cfg.maxBytes);
    return cfg;
}

BinaryConfig Config::getBinaryConfig() const {
    BinaryConfig cfg;
    cfg.download = getBool("binaries.download", true);
    cfg.requireChecksum = getBool("binaries.require_checksum", false);
    cfg.nodeVersion = getString("binaries.node.version");
    cfg.bunVersion = getString("binaries.bun.version");
    cfg.uvVersion = getString("binaries.uv.version");
    return cfg;
}

SandboxConfig Config::getSandboxConfig() const {
    SandboxConfig cfg;
    cfg.prefix = getString("sandbox.prefix", "testbox-");
    cfg.baseDir = getString("sandbox.base_dir", std::filesystem::temp_directory_path().string());
    cfg.limits.cpuSeconds = nonNegative(getInt64("sandbox.limits.cpu_seconds", 900), cfg.limits.cpuSeconds);
    cfg.limits.memoryBytes = nonNegative(getInt64("sandbox.limits.memory_bytes", 4294967296LL), cfg.limits.memoryBytes);
    cfg.limits.openFiles = nonNegative(getInt64("sandbox.limits.open_files", 1024), cfg.limits.openFiles);
    cfg.limits.processes = nonNegative(getInt64("sandbox.limits.processes", 4096), cfg.limits.processes);
    cfg.limits.fileSizeBytes = nonNegative(getInt64("sandbox.limits.file_size_bytes", 1073741824LL), cfg.limits.fileSizeBytes);
    cfg.namespaces = getBool("sandbox.namespaces", true);
    cfg.seccomp = getBool("sandbox.seccomp", true);
    return cfg;
}

int boundedTimeoutSeconds(int64_t seconds) {
    return static_cast<int>(std::clamp<int64_t>(seconds, 1, kMaxTimeoutSeconds));
}

TestConfig Config::getTestConfig() const {
    TestConfig cfg;
    cfg.timeoutSeconds = boundedTimeoutSeconds(getInt64("tests.timeout_seconds", 300));
    cfg.installTimeoutSeconds = boundedTimeoutSeconds(getInt64("install.timeout_seconds", 900));
    cfg.isolateNetwork = getBool("tests.isolate_network", true);
    cfg.collectCoverage = getBool("tests.collect_coverage", false);
    return cfg;
}

HttpConfig Config::getHttpConfig() const {
    HttpConfig cfg;
    cfg.timeoutSeconds = boundedTimeoutSeconds(getInt64("http.timeout_seconds", 300));
    cfg.userAgent = getString("http.user_agent", "testbox/0.1");
    return cfg;
}

void Config::onChange(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->changeCallback = callback;
}

std::string Config::getConfigPath() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->configPath;
}

size_t Config::size() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->data.size();
}

}
}
