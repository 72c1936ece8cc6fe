#include "environment/source.h"
#include "infrastructure/error_handling.h"
#include "utils/config.h"
#include "utils/logger.h"
#include <filesystem>
#include <cstdlib>

namespace testbox {
namespace environment {

namespace fs = std::filesystem;

static bool startsWith(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

std::string normalizeRepositoryUrl(const std::string& url) {
    if (url.empty()) {
        TESTBOX_THROW(ErrorCode::INVALID_ARGUMENT, "repository url is empty", "");
    }
    if (url.find_first_of("?#") != std::string::npos) {
        TESTBOX_THROW(ErrorCode::INVALID_ARGUMENT, "repository urls with query parameters or fragments are not supported",
                      "url=" + url);
    }
    if (startsWith(url, "git@github.com:")) {
        return "https://github.com/" + url.substr(std::string("git@github.com:").size());
    }
    if (startsWith(url, "http://")) {
        TESTBOX_THROW(ErrorCode::INVALID_ARGUMENT, "plain http repository urls are not supported, use https",
                      "url=" + url);
    }
    if (startsWith(url, "https://")) return url;
    if (startsWith(url, "github.com/")) return "https://" + url;
    return "https://github.com/" + url;
}

bool isLocalSource(const std::string& source) {
    if (source.empty()) return false;
    std::error_code ec;
    return fs::is_directory(source, ec);
}

void moveContents(const std::string& from, const std::string& to) {
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(from, ec)) {
        fs::path target = fs::path(to) / entry.path().filename();
        std::error_code mvEc;
        fs::rename(entry.path(), target, mvEc);
        if (!mvEc) continue;
        fs::copy(entry.path(), target, fs::copy_options::recursive | fs::copy_options::copy_symlinks, mvEc);
        if (mvEc) {
            TESTBOX_THROW(ErrorCode::SOURCE_ERROR, "cannot move source tree",
                          "from=" + entry.path().string() + " error=" + mvEc.message());
        }
    }
    if (ec) {
        TESTBOX_THROW(ErrorCode::SOURCE_ERROR, "cannot read source tree", "dir=" + from + " error=" + ec.message());
    }
}

GitSourceProvider::GitSourceProvider(const sandbox::SandboxManager& manager, const std::string& hostPath,
                                     uint32_t timeoutSeconds)
    : manager_(manager), hostPath_(hostPath), timeoutSeconds_(timeoutSeconds) {}

void GitSourceProvider::materialize(const std::string& source, const std::string& branch,
                                    const std::string& destDir) {
    std::string url = normalizeRepositoryUrl(source);

    std::string hostPath = hostPath_;
    if (hostPath.empty()) {
        const char* env = std::getenv("PATH");
        hostPath = env ? env : "";
    }
    auto git = sandbox::findExecutable("git", hostPath);
    if (!git) {
        TESTBOX_THROW(ErrorCode::COMMAND_NOT_FOUND, "git not found on host", "path=" + hostPath);
    }

    sandbox::Sandbox staging = manager_.create(manager_.config().prefix + "clone-");
    struct StagingGuard {
        const sandbox::SandboxManager& manager;
        const sandbox::Sandbox& sb;
        ~StagingGuard() { manager.destroy(sb); }
    } guard{manager_, staging};

    std::error_code ec;
    fs::create_symlink(*git, fs::path(staging.binDir) / "git", ec);
    if (ec) {
        TESTBOX_THROW(ErrorCode::SOURCE_ERROR, "cannot link git into staging sandbox", "error=" + ec.message());
    }

    std::string cloneDir = (fs::path(staging.workDir) / "repo").string();
    std::string cmd = "git clone --depth 1";
    if (!branch.empty()) cmd += " -b " + sandbox::shellQuote(branch);
    cmd += " " + sandbox::shellQuote(url) + " " + sandbox::shellQuote(cloneDir);

    sandbox::CommandOptions opts;
    opts.timeoutMs = static_cast<uint32_t>(utils::boundedTimeoutSeconds(timeoutSeconds_)) * 1000;
    opts.extraEnv = {{"GIT_TERMINAL_PROMPT", "0"}};

    LOG_INFO("cloning repository url=" + url + (branch.empty() ? "" : " branch=" + branch));
    sandbox::CommandResult r = manager_.runCommand(staging, cmd, opts);
    if (r.timedOut || r.exitCode != 0) {
        std::string why = r.timedOut ? "timed out" : "exit " + std::to_string(r.exitCode);
        LOG_ERROR("clone failed url=" + url + " reason=" + why);
        TESTBOX_THROW(ErrorCode::SOURCE_ERROR, "git clone failed: " + why,
                      "url=" + url + " stderr=" + sandbox::tail(r.stderrText, 2048));
    }

    moveContents(cloneDir, destDir);
    LOG_INFO("repository cloned url=" + url + " dest=" + destDir);
}

void LocalPathSourceProvider::materialize(const std::string& source, const std::string& branch,
                                          const std::string& destDir) {
    if (!branch.empty()) LOG_WARN("branch ignored for local source path=" + source + " branch=" + branch);
    if (!isLocalSource(source)) {
        TESTBOX_THROW(ErrorCode::SOURCE_ERROR, "source directory does not exist", "path=" + source);
    }

    std::error_code ec;
    fs::path src = fs::canonical(source, ec);
    if (ec) {
        TESTBOX_THROW(ErrorCode::SOURCE_ERROR, "cannot resolve source directory", "path=" + source);
    }
    for (const auto& entry : fs::directory_iterator(src, ec)) {
        if (entry.path().filename() == ".git") continue;
        std::error_code cpEc;
        fs::copy(entry.path(), fs::path(destDir) / entry.path().filename(),
                 fs::copy_options::recursive | fs::copy_options::copy_symlinks, cpEc);
        if (cpEc) {
            TESTBOX_THROW(ErrorCode::SOURCE_ERROR, "cannot copy source tree",
                          "path=" + entry.path().string() + " error=" + cpEc.message());
        }
    }
    if (ec) {
        TESTBOX_THROW(ErrorCode::SOURCE_ERROR, "cannot read source directory", "path=" + source + " error=" + ec.message());
    }
    LOG_INFO("source copied path=" + src.string() + " dest=" + destDir);
}

}
}
