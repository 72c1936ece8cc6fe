#include "platform/platform.h"
#include "infrastructure/error_handling.h"
#include "utils/logger.h"
#include <algorithm>
#include <cctype>
#include <sys/utsname.h>

namespace testbox {
namespace platform {

namespace {

struct ArchNames {
    const char* machine;
    const char* node;
    const char* bun;
    const char* uv;
};

struct OsNames {
    const char* system;
    const char* node;
    const char* bun;
    const char* uvSuffix;
    const char* format;
};

const ArchNames kArches[] = {
    {"x86_64", "x64", "x64", "x86_64"},
    {"aarch64", "arm64", "aarch64", "aarch64"},
};

const OsNames kSystems[] = {
    {"Linux", "linux", "linux", "unknown-linux-gnu", "tar.gz"},
    {"Darwin", "darwin", "darwin", "apple-darwin", "tar.gz"},
    {"Windows", "win", "windows", "pc-windows-msvc", "zip"},
};

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

}

const RuntimePlatform& PlatformInfo::forRuntime(const std::string& name) const {
    auto it = runtimes.find(name);
    if (it == runtimes.end()) {
        TESTBOX_THROW(ErrorCode::UNSUPPORTED_PLATFORM, "no platform mapping for runtime", "runtime=" + name);
    }
    return it->second;
}

PlatformInfo resolvePlatform(const std::string& osName, const std::string& machine) {
    std::string m = lower(machine);
    if (m == "amd64") m = "x86_64";
    if (m == "arm64") m = "aarch64";

    const OsNames* os = nullptr;
    for (const auto& s : kSystems) {
        if (osName == s.system) { os = &s; break; }
    }
    if (!os) {
        TESTBOX_THROW(ErrorCode::UNSUPPORTED_PLATFORM, "unsupported operating system", "os=" + osName);
    }

    const ArchNames* arch = nullptr;
    for (const auto& a : kArches) {
        if (m == a.machine) { arch = &a; break; }
    }
    if (!arch) {
        TESTBOX_THROW(ErrorCode::UNSUPPORTED_PLATFORM, "unsupported architecture", "arch=" + machine);
    }

    PlatformInfo info;
    info.os = lower(osName);
    info.arch = arch->machine;
    info.format = os->format;
    info.runtimes["node"] = {os->node, arch->node, os->format};
    // Bun ships zip archives on every platform.
    info.runtimes["bun"] = {os->bun, arch->bun, "zip"};
    info.runtimes["uv"] = {std::string(arch->uv) + "-" + os->uvSuffix, arch->uv, os->format};
    return info;
}

const PlatformInfo& currentPlatform() {
    static const PlatformInfo info = [] {
        struct utsname u;
        if (uname(&u) != 0) {
            TESTBOX_THROW(ErrorCode::UNSUPPORTED_PLATFORM, "uname failed", "");
        }
        PlatformInfo resolved = resolvePlatform(u.sysname, u.machine);
        LOG_DEBUG("platform resolved os=" + resolved.os + " arch=" + resolved.arch);
        return resolved;
    }();
    return info;
}

bool isPlatformSupported() {
    try {
        currentPlatform();
        return true;
    } catch (const Exception& e) {
        LOG_WARN(std::string("platform unsupported: ") + e.what());
        return false;
    }
}

}
}
