#pragma once

#include <string>
#include <map>

namespace testbox {
namespace platform {

// How one runtime's release artifacts name the host.
struct RuntimePlatform {
    std::string platform;
    std::string arch;
    std::string format;
};

struct PlatformInfo {
    std::string os;
    std::string arch;
    std::string format;
    std::map<std::string, RuntimePlatform> runtimes;

    // Throws Exception(UNSUPPORTED_PLATFORM) for names outside the table.
    const RuntimePlatform& forRuntime(const std::string& name) const;
};

// Pure mapping from uname-style facts ("Linux", "x86_64").
PlatformInfo resolvePlatform(const std::string& osName, const std::string& machine);

// Host facts, resolved once per process.
const PlatformInfo& currentPlatform();

bool isPlatformSupported();

}
}
