#include "binaries/binary_acquirer.h"
#include "binaries/archive.h"
#include "binaries/binary_spec.h"
#include "crypto/crypto.h"
#include "infrastructure/error_handling.h"
#include "utils/logger.h"
#include <filesystem>
#include <cstdlib>
#include <vector>

namespace testbox {
namespace binaries {

namespace fs = std::filesystem;

namespace {

// Owns a mkdtemp directory for the lifetime of one acquisition.
class ScratchDir {
public:
    explicit ScratchDir(const std::string& parent) {
        std::string base = parent.empty() ? fs::temp_directory_path().string() : parent;
        std::string tmpl = (fs::path(base) / "testbox-dl-XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (!mkdtemp(buf.data())) {
            TESTBOX_THROW(ErrorCode::DOWNLOAD_ERROR, "cannot create scratch directory", "parent=" + base);
        }
        path_ = buf.data();
    }

    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) LOG_WARN("scratch cleanup failed path=" + path_ + " error=" + ec.message());
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

}

BinaryAcquirer::BinaryAcquirer(BinaryCache& cache, web::HttpClient& http,
                               const platform::PlatformInfo& platform, const AcquirerOptions& options,
                               const ReleaseStrategyRegistry& strategies)
    : cache_(cache), http_(http), platform_(platform), options_(options), strategies_(strategies) {}

std::string BinaryAcquirer::resolveVersion(const std::string& name) const {
    const ReleaseStrategy* strategy = strategies_.find(name);
    if (!strategy) {
        TESTBOX_THROW(ErrorCode::DOWNLOAD_ERROR, "no release strategy for binary", "runtime=" + name);
    }
    LOG_INFO("resolving latest version name=" + name + " source=" + strategy->source());
    return strategy->latestVersion(http_);
}

std::string BinaryAcquirer::ensure(const std::string& name, const std::string& version) {
    std::string resolved = version;
    try {
        if (resolved.empty()) resolved = resolveVersion(name);
        return acquire(name, resolved);
    } catch (const Exception& e) {
        Error err = e.error();
        std::string where = "runtime=" + name + " version=" + (resolved.empty() ? "latest" : resolved);
        err.context = err.context.empty() ? where : err.context + " " + where;
        LOG_ERROR("binary acquisition failed " + where + " error=" + err.message);
        throw Exception(err);
    }
}

std::string BinaryAcquirer::acquire(const std::string& name, const std::string& version) {
    if (auto hit = cache_.lookup(name, version)) {
        LOG_DEBUG("binary cache hit name=" + name + " version=" + version + " path=" + hit->path);
        return hit->path;
    }

    const BinarySpec* spec = findBinarySpec(name);
    if (!spec) {
        TESTBOX_THROW(ErrorCode::DOWNLOAD_ERROR, "binary is not downloadable", "");
    }

    const platform::RuntimePlatform& plat = platform_.forRuntime(name);
    std::string url = assetUrl(*spec, version, plat);
    ScratchDir scratch(options_.scratchDir);
    std::string archivePath = (fs::path(scratch.path()) / assetFileName(url)).string();

    LOG_INFO("downloading name=" + name + " version=" + version + " url=" + url);
    web::HttpResponse resp = http_.download(url, archivePath);
    if (!resp.ok()) {
        TESTBOX_THROW(ErrorCode::DOWNLOAD_ERROR, "download failed: " +
                      (resp.error.empty() ? "HTTP " + std::to_string(resp.status) : resp.error),
                      "url=" + url + " status=" + std::to_string(resp.status));
    }
    std::error_code ec;
    uint64_t size = fs::exists(archivePath, ec) ? fs::file_size(archivePath, ec) : 0;
    if (ec || size == 0) {
        TESTBOX_THROW(ErrorCode::DOWNLOAD_ERROR, "downloaded file is empty", "url=" + url);
    }
    LOG_INFO("downloaded name=" + name + " version=" + version + " bytes=" + std::to_string(size));

    std::string expected = expectedChecksum(name, version, url);
    if (!expected.empty()) {
        std::string actual;
        if (!crypto::sha256File(archivePath, actual)) {
            TESTBOX_THROW(ErrorCode::DOWNLOAD_ERROR, "cannot read downloaded archive", "path=" + archivePath);
        }
        if (actual != expected) {
            TESTBOX_THROW(ErrorCode::CHECKSUM_MISMATCH, "archive checksum mismatch",
                          "url=" + url + " expected=" + expected + " actual=" + actual);
        }
        LOG_DEBUG("archive checksum verified name=" + name + " sha256=" + actual);
    }

    std::string extracted = extractBinary(archivePath, spec->archiveEntry,
                                          (fs::path(scratch.path()) / "extract").string());
    std::string path = cache_.store(name, version, extracted);
    cache_.evictIfOverBudget(options_.cacheMaxBytes, name, version);
    return path;
}

std::string BinaryAcquirer::expectedChecksum(const std::string& name, const std::string& version,
                                             const std::string& url) const {
    const BinarySpec* spec = findBinarySpec(name);
    std::string sumsUrl = checksumUrl(*spec, version, url);
    web::HttpResponse resp = http_.fetch(sumsUrl);
    std::optional<std::string> digest;
    if (resp.ok()) digest = findChecksum(resp.body, assetFileName(url));

    if (digest) return *digest;

    std::string why = resp.ok() ? "no entry for " + assetFileName(url)
                                : "HTTP " + std::to_string(resp.status) + " " + resp.error;
    if (options_.requireChecksum) {
        TESTBOX_THROW(ErrorCode::DOWNLOAD_ERROR, "published checksum unavailable", "url=" + sumsUrl + " " + why);
    }
    LOG_WARN("published checksum unavailable, continuing unverified url=" + sumsUrl + " reason=" + why);
    return "";
}

}
}
