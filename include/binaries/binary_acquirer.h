#pragma once

#include "binaries/binary_cache.h"
#include "binaries/release_strategy.h"
#include "platform/platform.h"
#include "web/curl_fetch.h"
#include <string>
#include <cstdint>

namespace testbox {
namespace binaries {

struct AcquirerOptions {
    bool requireChecksum = false;
    uint64_t cacheMaxBytes = 1ULL * 1024 * 1024 * 1024;
    std::string scratchDir;  // empty = system temp dir
};

// Resolves, downloads, verifies and caches runtime tools. Safe to share
// between environments; the cache serializes nothing but relies on atomic
// renames.
class BinaryAcquirer {
public:
    BinaryAcquirer(BinaryCache& cache, web::HttpClient& http, const platform::PlatformInfo& platform,
                   const AcquirerOptions& options = AcquirerOptions(),
                   const ReleaseStrategyRegistry& strategies = ReleaseStrategyRegistry::defaults());

    // Returns the cached path of `name`. An empty version means latest.
    // Failures are rethrown with the runtime name and version in the context.
    std::string ensure(const std::string& name, const std::string& version = "");

    std::string resolveVersion(const std::string& name) const;

private:
    std::string acquire(const std::string& name, const std::string& version);
    std::string expectedChecksum(const std::string& name, const std::string& version,
                                 const std::string& url) const;

    BinaryCache& cache_;
    web::HttpClient& http_;
    const platform::PlatformInfo& platform_;
    AcquirerOptions options_;
    const ReleaseStrategyRegistry& strategies_;
};

}
}
