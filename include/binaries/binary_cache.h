#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace testbox {
namespace binaries {

struct CachedBinary {
    std::string name;
    std::string version;
    std::string path;
    std::string digest;
    int64_t lastAccess = 0;  // binary mtime, milliseconds
    uint64_t sizeBytes = 0;
};

struct EvictionReport {
    uint64_t bytesBefore = 0;
    uint64_t bytesAfter = 0;
    std::vector<std::string> removed;
};

// Layout: <root>/<name>/<version>/binary and binary.sha256. Entries are built
// under <root>/<name>/.tmp-* and renamed into place, so readers and eviction
// never see a half-written entry.
class BinaryCache {
public:
    explicit BinaryCache(const std::string& root);

    const std::string& root() const { return root_; }

    // A hit requires the recomputed digest to equal the stored one. Hits
    // refresh the entry's mtime.
    std::optional<CachedBinary> lookup(const std::string& name, const std::string& version) const;

    // Throws Exception(CHECKSUM_MISMATCH) when expectedChecksum is given and
    // differs; nothing is left behind in that case.
    std::string store(const std::string& name, const std::string& version,
                      const std::string& sourcePath, const std::string& expectedChecksum = "");

    // Removes least recently used entries until the total fits maxBytes.
    // The keep entry, if named, is never removed.
    EvictionReport evictIfOverBudget(uint64_t maxBytes, const std::string& keepName = "",
                                     const std::string& keepVersion = "");

    std::vector<CachedBinary> entries() const;
    uint64_t totalSize() const;
    bool remove(const std::string& name, const std::string& version);

    static const char* BINARY_FILE;
    static const char* DIGEST_FILE;

private:
    std::string entryDir(const std::string& name, const std::string& version) const;

    std::string root_;
};

std::string readDigestFile(const std::string& path);

}
}
