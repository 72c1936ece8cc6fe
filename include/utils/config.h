#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>

namespace testbox {
namespace utils {

struct CacheConfig {
    std::string dir;
    uint64_t maxBytes = 1ULL * 1024 * 1024 * 1024;
};

struct BinaryConfig {
    bool download = true;
    bool requireChecksum = false;
    std::string nodeVersion;
    std::string bunVersion;
    std::string uvVersion;

    std::string pinnedVersion(const std::string& binaryName) const;
};

struct ResourceLimits {
    uint64_t cpuSeconds = 900;
    uint64_t memoryBytes = 4ULL * 1024 * 1024 * 1024;
    uint64_t openFiles = 1024;
    uint64_t processes = 4096;
    uint64_t fileSizeBytes = 1ULL * 1024 * 1024 * 1024;
};

struct SandboxConfig {
    std::string prefix = "testbox-";
    std::string baseDir;
    ResourceLimits limits;
    bool namespaces = true;
    bool seccomp = true;
};

struct TestConfig {
    int timeoutSeconds = 300;
    int installTimeoutSeconds = 900;
    bool isolateNetwork = true;
    bool collectCoverage = false;
};

// Every phase keeps a bound: at least one second, at most a day.
constexpr int kMaxTimeoutSeconds = 24 * 60 * 60;
int boundedTimeoutSeconds(int64_t seconds);

struct HttpConfig {
    int timeoutSeconds = 300;
    std::string userAgent = "testbox/0.1";
};

class Config {
public:
    static Config& instance();

    bool load(const std::string& path);
    bool save(const std::string& path);
    bool loadDefaults();
    void reset();
    // TESTBOX_<KEY> with dots as underscores, e.g. TESTBOX_CACHE_MAX_BYTES.
    void applyEnvironmentOverrides();

    std::string getString(const std::string& key, const std::string& def = "") const;
    int getInt(const std::string& key, int def = 0) const;
    int64_t getInt64(const std::string& key, int64_t def = 0) const;
    bool getBool(const std::string& key, bool def = false) const;
    std::vector<std::string> getList(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, const char* value);
    void set(const std::string& key, int value);
    void set(const std::string& key, int64_t value);
    void set(const std::string& key, bool value);

    bool has(const std::string& key) const;
    void remove(const std::string& key);
    std::vector<std::string> keys(const std::string& prefix = "") const;

    CacheConfig getCacheConfig() const;
    BinaryConfig getBinaryConfig() const;
    SandboxConfig getSandboxConfig() const;
    TestConfig getTestConfig() const;
    HttpConfig getHttpConfig() const;

    void onChange(std::function<void(const std::string&)> callback);

    std::string getConfigPath() const;
    size_t size() const;

    static std::string defaultCacheDir();

private:
    Config();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
