#include "binaries/release_strategy.h"
#include "infrastructure/error_handling.h"
#include "utils/logger.h"
#include <nlohmann/json.hpp>
#include <regex>

namespace testbox {
namespace binaries {

using json = nlohmann::json;

namespace {

web::HttpResponse fetchOrThrow(web::HttpClient& http, const std::string& url) {
    web::HttpResponse resp = http.fetch(url);
    if (!resp.ok()) {
        TESTBOX_THROW(ErrorCode::DOWNLOAD_ERROR, "release lookup failed: " + resp.error,
                      "url=" + url + " status=" + std::to_string(resp.status));
    }
    return resp;
}

json parseOrThrow(const std::string& body, const std::string& url) {
    json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        TESTBOX_THROW(ErrorCode::DOWNLOAD_ERROR, "release metadata is not valid JSON", "url=" + url);
    }
    return parsed;
}

}

std::string stripVersionPrefix(const std::string& tag) {
    if (!tag.empty() && (tag[0] == 'v' || tag[0] == 'V')) return tag.substr(1);
    return tag;
}

GithubReleaseStrategy::GithubReleaseStrategy(const std::string& apiUrl) : apiUrl_(apiUrl) {}

std::string GithubReleaseStrategy::latestVersion(web::HttpClient& http) const {
    web::HttpResponse resp = fetchOrThrow(http, apiUrl_);
    json parsed = parseOrThrow(resp.body, apiUrl_);
    if (!parsed.is_object() || !parsed.contains("tag_name") || !parsed["tag_name"].is_string()) {
        TESTBOX_THROW(ErrorCode::DOWNLOAD_ERROR, "release metadata has no tag_name", "url=" + apiUrl_);
    }
    std::string version = stripVersionPrefix(parsed["tag_name"].get<std::string>());
    LOG_DEBUG("latest release url=" + apiUrl_ + " version=" + version);
    return version;
}

NodeIndexStrategy::NodeIndexStrategy(const std::string& indexUrl) : indexUrl_(indexUrl) {}

std::string NodeIndexStrategy::latestVersion(web::HttpClient& http) const {
    web::HttpResponse resp = fetchOrThrow(http, indexUrl_);
    json parsed = parseOrThrow(resp.body, indexUrl_);
    if (!parsed.is_array()) {
        TESTBOX_THROW(ErrorCode::DOWNLOAD_ERROR, "node index is not an array", "url=" + indexUrl_);
    }
    // Entries are newest first; `lts` is false or a codename string.
    for (const auto& entry : parsed) {
        if (!entry.is_object() || !entry.contains("version") || !entry["version"].is_string()) continue;
        auto lts = entry.find("lts");
        if (lts == entry.end() || lts->is_null()) continue;
        if (lts->is_boolean() && !lts->get<bool>()) continue;
        std::string version = stripVersionPrefix(entry["version"].get<std::string>());
        LOG_DEBUG("latest node lts url=" + indexUrl_ + " version=" + version);
        return version;
    }
    TESTBOX_THROW(ErrorCode::DOWNLOAD_ERROR, "node index lists no LTS release", "url=" + indexUrl_);
}

RedirectTagStrategy::RedirectTagStrategy(const std::string& url, const std::string& tagPrefix)
    : url_(url), tagPrefix_(tagPrefix) {}

std::string RedirectTagStrategy::latestVersion(web::HttpClient& http) const {
    web::HttpResponse resp = fetchOrThrow(http, url_);
    std::regex re("/tag/" + tagPrefix_ + R"((\d+\.\d+\.\d+[0-9A-Za-z.\-]*))");
    std::smatch m;
    if (!std::regex_search(resp.effectiveUrl, m, re)) {
        TESTBOX_THROW(ErrorCode::DOWNLOAD_ERROR, "redirect target carries no version tag",
                      "url=" + url_ + " effective_url=" + resp.effectiveUrl);
    }
    std::string version = m[1].str();
    LOG_DEBUG("latest release url=" + url_ + " version=" + version);
    return version;
}

static ReleaseStrategyRegistry buildDefaultStrategies() {
    ReleaseStrategyRegistry r;
    r.add("uv", std::make_unique<GithubReleaseStrategy>(
        "https://api.github.com/repos/astral-sh/uv/releases/latest"));
    r.add("node", std::make_unique<NodeIndexStrategy>("https://nodejs.org/dist/index.json"));
    r.add("bun", std::make_unique<RedirectTagStrategy>(
        "https://github.com/oven-sh/bun/releases/latest", "bun-v"));
    return r;
}

const ReleaseStrategyRegistry& ReleaseStrategyRegistry::defaults() {
    static const ReleaseStrategyRegistry registry = buildDefaultStrategies();
    return registry;
}

void ReleaseStrategyRegistry::add(const std::string& name, std::unique_ptr<ReleaseStrategy> strategy) {
    strategies_[name] = std::move(strategy);
}

const ReleaseStrategy* ReleaseStrategyRegistry::find(const std::string& name) const {
    auto it = strategies_.find(name);
    return it == strategies_.end() ? nullptr : it->second.get();
}

std::vector<std::string> ReleaseStrategyRegistry::names() const {
    std::vector<std::string> out;
    for (const auto& [name, strategy] : strategies_) out.push_back(name);
    return out;
}

}
}
