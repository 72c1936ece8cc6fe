#include "runtime/runtime_detector.h"
#include "infrastructure/error_handling.h"
#include "utils/logger.h"
#include <filesystem>
#include <algorithm>

namespace testbox {
namespace runtime {

namespace fs = std::filesystem;

static const char* kExcludedDirs[] = {
    ".git", ".hg", ".svn", "node_modules", ".venv", "venv", "__pycache__", ".pytest_cache",
    ".mypy_cache", ".tox", ".nox", "dist", "build",
};

bool isExcludedDirectory(const std::string& name) {
    if (!name.empty() && name[0] == '.') return true;
    for (const char* d : kExcludedDirs) {
        if (name == d) return true;
    }
    return false;
}

std::vector<std::string> listProjectFiles(const std::string& root) {
    std::vector<std::string> files;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) return files;
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) break;
        const fs::path& p = it->path();
        if (it->is_directory(ec)) {
            if (isExcludedDirectory(p.filename().string())) it.disable_recursion_pending();
            continue;
        }
        if (!it->is_regular_file(ec)) continue;
        files.push_back(fs::relative(p, root, ec).generic_string());
    }
    std::sort(files.begin(), files.end());
    return files;
}

static bool anyFileEndsWith(const std::vector<std::string>& files, const std::string& marker) {
    for (const auto& f : files) {
        if (f == marker) return true;
        if (f.size() > marker.size() && f.compare(f.size() - marker.size(), marker.size(), marker) == 0 &&
            f[f.size() - marker.size() - 1] == '/') {
            return true;
        }
    }
    return false;
}

bool signatureMatches(const Signature& signature, const std::vector<std::string>& files,
                      std::vector<std::string>* matched) {
    std::vector<std::string> hits;
    for (const auto& marker : signature.files) {
        if (anyFileEndsWith(files, marker)) hits.push_back(marker);
    }
    bool ok = signature.mode == MatchMode::ALL ? hits.size() == signature.files.size() && !hits.empty()
                                               : !hits.empty();
    if (ok && matched) *matched = hits;
    return ok;
}

const RuntimeConfig& detectRuntime(const std::string& workDir) {
    std::vector<std::string> files = listProjectFiles(workDir);
    for (const auto& config : runtimeRegistry()) {
        for (const auto& sig : config.signatures) {
            std::vector<std::string> matched;
            if (!signatureMatches(sig, files, &matched)) continue;
            std::string list;
            for (const auto& m : matched) list += (list.empty() ? "" : ",") + m;
            LOG_INFO("runtime detected runtime=" + std::string(runtimeNameString(config.name)) +
                     " matched=" + list + " dir=" + workDir);
            return config;
        }
    }
    TESTBOX_THROW(ErrorCode::NO_RUNTIME_DETECTED, "no supported runtime detected",
                  "dir=" + workDir + " files=" + std::to_string(files.size()));
}

}
}
