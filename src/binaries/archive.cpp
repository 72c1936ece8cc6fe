#include "binaries/archive.h"
#include "infrastructure/error_handling.h"
#include "sandbox/process.h"
#include "utils/logger.h"
#include <filesystem>
#include <sstream>

namespace testbox {
namespace binaries {

namespace fs = std::filesystem;

namespace {

constexpr uint32_t kToolTimeoutMs = 300 * 1000;

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

sandbox::ProcessResult runTool(const std::string& command, const std::string& context) {
    sandbox::ProcessOptions opts;
    opts.command = command;
    opts.env = sandbox::hostToolEnv();
    opts.timeoutMs = kToolTimeoutMs;
    sandbox::ProcessResult r = sandbox::runProcess(opts);
    if (!r.started) {
        TESTBOX_THROW(ErrorCode::ARCHIVE_FORMAT, "failed to start archive tool: " + r.error, context);
    }
    if (r.timedOut) {
        TESTBOX_THROW(ErrorCode::ARCHIVE_FORMAT, "archive tool timed out", context);
    }
    return r;
}

std::string baseName(const std::string& entry) {
    auto pos = entry.find_last_of('/');
    return pos == std::string::npos ? entry : entry.substr(pos + 1);
}

}

const char* archiveFormatName(ArchiveFormat format) {
    switch (format) {
        case ArchiveFormat::ZIP: return "zip";
        case ArchiveFormat::TAR_GZ: return "tar.gz";
        case ArchiveFormat::TAR_XZ: return "tar.xz";
        default: return "unknown";
    }
}

ArchiveFormat detectArchiveFormat(const std::string& path) {
    if (endsWith(path, ".zip")) return ArchiveFormat::ZIP;
    if (endsWith(path, ".tar.gz") || endsWith(path, ".tgz")) return ArchiveFormat::TAR_GZ;
    if (endsWith(path, ".tar.xz")) return ArchiveFormat::TAR_XZ;
    TESTBOX_THROW(ErrorCode::ARCHIVE_FORMAT, "unsupported archive format", "archive=" + path);
}

std::vector<std::string> listEntries(const std::string& archivePath) {
    ArchiveFormat format = detectArchiveFormat(archivePath);
    std::string context = "archive=" + archivePath;
    std::string cmd;
    switch (format) {
        case ArchiveFormat::ZIP:
            cmd = "unzip -Z1 " + sandbox::shellQuote(archivePath);
            break;
        case ArchiveFormat::TAR_GZ:
            cmd = "tar -tzf " + sandbox::shellQuote(archivePath);
            break;
        case ArchiveFormat::TAR_XZ:
            cmd = "tar -tJf " + sandbox::shellQuote(archivePath);
            break;
    }

    sandbox::ProcessResult r = runTool(cmd, context);
    if (r.exitCode != 0) {
        TESTBOX_THROW(ErrorCode::ARCHIVE_FORMAT,
                      "cannot list archive: " + sandbox::tail(r.stderrText, 512), context);
    }

    std::vector<std::string> entries;
    std::istringstream iss(r.stdoutText);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) entries.push_back(line);
    }
    return entries;
}

std::string extractBinary(const std::string& archivePath, const std::string& binaryName,
                          const std::string& destDir) {
    ArchiveFormat format = detectArchiveFormat(archivePath);
    std::string context = "archive=" + archivePath + " binary=" + binaryName;

    std::string match;
    for (const auto& entry : listEntries(archivePath)) {
        if (entry.back() == '/') continue;
        if (baseName(entry) == binaryName) {
            match = entry;
            break;
        }
    }
    if (match.empty()) {
        TESTBOX_THROW(ErrorCode::BINARY_NOT_FOUND, "binary not found in archive", context);
    }

    std::error_code ec;
    fs::create_directories(destDir, ec);
    if (ec) {
        TESTBOX_THROW(ErrorCode::ARCHIVE_FORMAT, "cannot create extraction dir: " + ec.message(), context);
    }

    // Tar entries keep their directories; unpack them apart from the target name.
    fs::path staging = fs::path(destDir) / (".extract-" + binaryName);
    fs::remove_all(staging, ec);

    std::string cmd;
    fs::path extracted;
    switch (format) {
        case ArchiveFormat::ZIP:
            cmd = "unzip -o -j " + sandbox::shellQuote(archivePath) + " " + sandbox::shellQuote(match) +
                  " -d " + sandbox::shellQuote(destDir);
            extracted = fs::path(destDir) / baseName(match);
            break;
        case ArchiveFormat::TAR_GZ:
        case ArchiveFormat::TAR_XZ:
            fs::create_directories(staging, ec);
            cmd = std::string("tar -x") + (format == ArchiveFormat::TAR_GZ ? "z" : "J") + "f " +
                  sandbox::shellQuote(archivePath) + " -C " + sandbox::shellQuote(staging.string()) + " " +
                  sandbox::shellQuote(match);
            extracted = staging / match;
            break;
    }

    sandbox::ProcessResult r = runTool(cmd, context);
    if (r.exitCode != 0) {
        fs::remove_all(staging, ec);
        TESTBOX_THROW(ErrorCode::ARCHIVE_FORMAT,
                      "extraction failed: " + sandbox::tail(r.stderrText, 512), context);
    }
    if (!fs::is_regular_file(extracted, ec)) {
        fs::remove_all(staging, ec);
        TESTBOX_THROW(ErrorCode::BINARY_NOT_FOUND, "extracted entry missing", context + " entry=" + match);
    }

    fs::path target = fs::path(destDir) / binaryName;
    if (extracted != target) {
        fs::rename(extracted, target, ec);
    }
    std::error_code cleanupEc;
    fs::remove_all(staging, cleanupEc);
    if (ec) {
        TESTBOX_THROW(ErrorCode::ARCHIVE_FORMAT, "cannot move extracted binary: " + ec.message(), context);
    }

    LOG_DEBUG("extracted " + match + " from " + archivePath + " to " + target.string());
    return target.string();
}

}
}
