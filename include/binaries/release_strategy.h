#pragma once

#include "web/curl_fetch.h"
#include <string>
#include <map>
#include <memory>
#include <vector>

namespace testbox {
namespace binaries {

// Resolves the newest published version of one tool. Throws
// Exception(DOWNLOAD_ERROR) with the queried url on failure.
class ReleaseStrategy {
public:
    virtual ~ReleaseStrategy() = default;
    virtual std::string latestVersion(web::HttpClient& http) const = 0;
    virtual std::string source() const = 0;
};

// GitHub "latest release" API, version from `tag_name`.
class GithubReleaseStrategy : public ReleaseStrategy {
public:
    explicit GithubReleaseStrategy(const std::string& apiUrl);
    std::string latestVersion(web::HttpClient& http) const override;
    std::string source() const override { return apiUrl_; }

private:
    std::string apiUrl_;
};

// nodejs.org dist index: newest entry flagged as LTS.
class NodeIndexStrategy : public ReleaseStrategy {
public:
    explicit NodeIndexStrategy(const std::string& indexUrl);
    std::string latestVersion(web::HttpClient& http) const override;
    std::string source() const override { return indexUrl_; }

private:
    std::string indexUrl_;
};

// Follows a "latest" redirect and reads the version out of the final URL,
// e.g. .../releases/tag/bun-v1.1.30.
class RedirectTagStrategy : public ReleaseStrategy {
public:
    RedirectTagStrategy(const std::string& url, const std::string& tagPrefix);
    std::string latestVersion(web::HttpClient& http) const override;
    std::string source() const override { return url_; }

private:
    std::string url_;
    std::string tagPrefix_;
};

class ReleaseStrategyRegistry {
public:
    ReleaseStrategyRegistry() = default;
    ReleaseStrategyRegistry(const ReleaseStrategyRegistry&) = delete;
    ReleaseStrategyRegistry& operator=(const ReleaseStrategyRegistry&) = delete;
    ReleaseStrategyRegistry(ReleaseStrategyRegistry&&) = default;
    ReleaseStrategyRegistry& operator=(ReleaseStrategyRegistry&&) = default;

    static const ReleaseStrategyRegistry& defaults();

    void add(const std::string& name, std::unique_ptr<ReleaseStrategy> strategy);
    const ReleaseStrategy* find(const std::string& name) const;
    std::vector<std::string> names() const;

private:
    std::map<std::string, std::unique_ptr<ReleaseStrategy>> strategies_;
};

std::string stripVersionPrefix(const std::string& tag);

}
}
