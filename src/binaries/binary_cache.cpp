#include "binaries/binary_cache.h"
#include "crypto/crypto.h"
#include "infrastructure/error_handling.h"
#include "utils/logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace testbox {
namespace binaries {

namespace fs = std::filesystem;

const char* BinaryCache::BINARY_FILE = "binary";
const char* BinaryCache::DIGEST_FILE = "binary.sha256";

namespace {

bool isTempName(const std::string& name) {
    return name.rfind(".tmp-", 0) == 0;
}

std::string tempSuffix() {
    return crypto::toHex(crypto::randomBytes(6).data(), 6);
}

std::string lowerHex(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

uint64_t directorySize(const fs::path& dir) {
    uint64_t total = 0;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code sec;
        if (it->is_regular_file(sec)) {
            auto sz = it->file_size(sec);
            if (!sec) total += sz;
        }
    }
    return total;
}

int64_t mtimeMillis(const fs::path& p) {
    std::error_code ec;
    auto t = fs::last_write_time(p, ec);
    if (ec) return 0;
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

}

std::string readDigestFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) return "";
    std::string digest;
    in >> digest;
    return lowerHex(digest);
}

BinaryCache::BinaryCache(const std::string& root) : root_(root) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        LOG_WARN("cannot create binary cache root " + root_ + ": " + ec.message());
    }
}

std::string BinaryCache::entryDir(const std::string& name, const std::string& version) const {
    return (fs::path(root_) / name / version).string();
}

std::optional<CachedBinary> BinaryCache::lookup(const std::string& name, const std::string& version) const {
    fs::path dir = entryDir(name, version);
    fs::path binary = dir / BINARY_FILE;
    fs::path digestPath = dir / DIGEST_FILE;

    std::error_code ec;
    if (!fs::is_regular_file(binary, ec) || !fs::is_regular_file(digestPath, ec)) {
        LOG_DEBUG("cache miss name=" + name + " version=" + version);
        return std::nullopt;
    }

    std::string stored = readDigestFile(digestPath.string());
    std::string actual;
    uint64_t size = 0;
    if (!crypto::sha256File(binary.string(), actual, &size)) {
        LOG_WARN("cache_validation_failed name=" + name + " version=" + version + " reason=unreadable");
        return std::nullopt;
    }
    if (stored.empty() || stored != actual) {
        LOG_WARN("cache_validation_failed name=" + name + " version=" + version +
                 " expected=" + stored + " actual=" + actual);
        return std::nullopt;
    }

    fs::last_write_time(binary, fs::file_time_type::clock::now(), ec);

    CachedBinary entry;
    entry.name = name;
    entry.version = version;
    entry.path = binary.string();
    entry.digest = actual;
    entry.lastAccess = mtimeMillis(binary);
    entry.sizeBytes = size;
    LOG_DEBUG("cache hit name=" + name + " version=" + version + " path=" + entry.path);
    return entry;
}

std::string BinaryCache::store(const std::string& name, const std::string& version,
                               const std::string& sourcePath, const std::string& expectedChecksum) {
    std::string context = "name=" + name + " version=" + version;
    if (name.empty() || version.empty() || name.find('/') != std::string::npos ||
        version.find('/') != std::string::npos || isTempName(name) || isTempName(version)) {
        TESTBOX_THROW(ErrorCode::INVALID_ARGUMENT, "invalid cache key", context);
    }

    fs::path nameDir = fs::path(root_) / name;
    fs::path finalDir = nameDir / version;
    fs::path tmpDir = nameDir / (".tmp-" + version + "-" + tempSuffix());

    std::error_code ec;
    fs::create_directories(tmpDir, ec);
    if (ec) {
        TESTBOX_THROW(ErrorCode::INTERNAL_ERROR, "cannot create cache staging dir: " + ec.message(), context);
    }

    auto discard = [&]() {
        std::error_code rmEc;
        fs::remove_all(tmpDir, rmEc);
    };

    fs::path tmpBinary = tmpDir / BINARY_FILE;
    fs::copy_file(sourcePath, tmpBinary, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        discard();
        TESTBOX_THROW(ErrorCode::INTERNAL_ERROR, "cannot copy binary into cache: " + ec.message(),
                      context + " source=" + sourcePath);
    }

    std::string digest;
    uint64_t size = 0;
    if (!crypto::sha256File(tmpBinary.string(), digest, &size)) {
        discard();
        TESTBOX_THROW(ErrorCode::INTERNAL_ERROR, "cannot hash cached binary", context);
    }

    if (!expectedChecksum.empty() && lowerHex(expectedChecksum) != digest) {
        discard();
        TESTBOX_THROW(ErrorCode::CHECKSUM_MISMATCH, "checksum mismatch",
                      context + " expected=" + lowerHex(expectedChecksum) + " actual=" + digest);
    }

    {
        std::ofstream out(tmpDir / DIGEST_FILE, std::ios::trunc);
        out << digest << "\n";
        if (!out) {
            discard();
            TESTBOX_THROW(ErrorCode::INTERNAL_ERROR, "cannot write digest file", context);
        }
    }

    fs::permissions(tmpBinary,
                    fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                    fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace, ec);

    // A concurrent store of the same key may win the rename; identical
    // content means we can adopt its entry.
    for (int attempt = 0; attempt < 3; attempt++) {
        fs::rename(tmpDir, finalDir, ec);
        if (!ec) {
            LOG_INFO("cached binary name=" + name + " version=" + version +
                     " bytes=" + std::to_string(size) + " sha256=" + digest);
            return (finalDir / BINARY_FILE).string();
        }

        std::string existing = readDigestFile((finalDir / DIGEST_FILE).string());
        if (existing == digest) {
            std::string actual;
            if (crypto::sha256File((finalDir / BINARY_FILE).string(), actual) && actual == digest) {
                discard();
                return (finalDir / BINARY_FILE).string();
            }
        }

        fs::path stale = nameDir / (".tmp-stale-" + version + "-" + tempSuffix());
        std::error_code mvEc;
        fs::rename(finalDir, stale, mvEc);
        if (!mvEc) {
            std::error_code rmEc;
            fs::remove_all(stale, rmEc);
        }
    }

    discard();
    TESTBOX_THROW(ErrorCode::INTERNAL_ERROR, "cannot move cache entry into place: " + ec.message(), context);
}

std::vector<CachedBinary> BinaryCache::entries() const {
    std::vector<CachedBinary> out;
    std::error_code ec;
    for (fs::directory_iterator n(root_, ec), end; !ec && n != end; n.increment(ec)) {
        std::error_code sec;
        if (!n->is_directory(sec)) continue;
        std::string name = n->path().filename().string();
        if (isTempName(name)) continue;

        std::error_code vec;
        for (fs::directory_iterator v(n->path(), vec), vend; !vec && v != vend; v.increment(vec)) {
            if (!v->is_directory(sec)) continue;
            std::string version = v->path().filename().string();
            if (isTempName(version)) continue;

            CachedBinary entry;
            entry.name = name;
            entry.version = version;
            fs::path binary = v->path() / BINARY_FILE;
            entry.path = binary.string();
            entry.digest = readDigestFile((v->path() / DIGEST_FILE).string());
            entry.lastAccess = fs::exists(binary, sec) ? mtimeMillis(binary) : mtimeMillis(v->path());
            entry.sizeBytes = directorySize(v->path());
            out.push_back(entry);
        }
    }
    return out;
}

uint64_t BinaryCache::totalSize() const {
    uint64_t total = 0;
    for (const auto& e : entries()) total += e.sizeBytes;
    return total;
}

bool BinaryCache::remove(const std::string& name, const std::string& version) {
    fs::path dir = entryDir(name, version);
    std::error_code ec;
    if (!fs::exists(dir, ec)) return false;
    fs::remove_all(dir, ec);
    if (ec) {
        LOG_WARN("cannot remove cache entry name=" + name + " version=" + version + ": " + ec.message());
        return false;
    }
    fs::path nameDir = fs::path(root_) / name;
    if (fs::is_empty(nameDir, ec)) {
        fs::remove(nameDir, ec);
    }
    return true;
}

EvictionReport BinaryCache::evictIfOverBudget(uint64_t maxBytes, const std::string& keepName,
                                              const std::string& keepVersion) {
    EvictionReport report;
    std::vector<CachedBinary> all = entries();
    for (const auto& e : all) report.bytesBefore += e.sizeBytes;
    report.bytesAfter = report.bytesBefore;
    if (report.bytesBefore <= maxBytes) return report;

    // Oldest first; name/version break ties so the order is stable.
    std::sort(all.begin(), all.end(), [](const CachedBinary& a, const CachedBinary& b) {
        if (a.lastAccess != b.lastAccess) return a.lastAccess < b.lastAccess;
        if (a.name != b.name) return a.name < b.name;
        return a.version < b.version;
    });

    for (const auto& e : all) {
        if (report.bytesAfter <= maxBytes) break;
        if (e.name == keepName && e.version == keepVersion) continue;
        if (remove(e.name, e.version)) {
            report.bytesAfter -= std::min(report.bytesAfter, e.sizeBytes);
            report.removed.push_back(e.name + "/" + e.version);
            LOG_INFO("evicted cache entry name=" + e.name + " version=" + e.version +
                     " bytes=" + std::to_string(e.sizeBytes));
        }
    }

    LOG_INFO("cache eviction budget=" + std::to_string(maxBytes) + " before=" +
             std::to_string(report.bytesBefore) + " after=" + std::to_string(report.bytesAfter));
    return report;
}

}
}
