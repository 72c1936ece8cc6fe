#include "web/curl_fetch.h"
#include "utils/logger.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

namespace testbox {
namespace web {

std::string shellEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('\'');
    for (char c : s) {
        if (c == '\'') out.append("'\\''");
        else out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

static std::string readSmallFile(const std::string& path, size_t maxBytes) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return {};
    std::string out;
    out.resize(maxBytes);
    in.read(out.data(), static_cast<std::streamsize>(maxBytes));
    out.resize(static_cast<size_t>(in.gcount()));
    return out;
}

static int decodeExitCode(int rc) {
    if (rc == -1) return -1;
    if (WIFEXITED(rc)) return WEXITSTATUS(rc);
    if (WIFSIGNALED(rc)) return 128 + WTERMSIG(rc);
    return rc;
}

static std::string makeTempPath(const std::string& prefix) {
    std::string tmpl = (std::filesystem::temp_directory_path() / (prefix + "XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    int fd = mkstemp(buf.data());
    if (fd < 0) return {};
    close(fd);
    return std::string(buf.data());
}

CurlHttpClient::CurlHttpClient(const HttpOptions& options) : options_(options) {}

HttpResponse CurlHttpClient::run(const std::string& url, const std::string& outPath) {
    HttpResponse result;
    std::string errPath = makeTempPath("testbox_curl_err_");
    if (errPath.empty()) {
        result.error = "mkstemp failed";
        return result;
    }

    std::ostringstream cmd;
    cmd << "curl -sS ";
    if (options_.followRedirects) cmd << "-L ";
    cmd << "--max-time " << options_.timeoutSeconds << " ";
    cmd << "--connect-timeout " << std::min<uint32_t>(options_.timeoutSeconds, 30) << " ";
    if (!options_.userAgent.empty()) {
        cmd << "-A " << shellEscape(options_.userAgent) << " ";
    }
    cmd << "-o " << shellEscape(outPath) << " ";
    cmd << "-w " << shellEscape("%{http_code} %{url_effective}") << " ";
    cmd << shellEscape(url) << " 2>" << shellEscape(errPath);

    // "e": the read end is close-on-exec, so sandboxed children never hold it.
    FILE* fp = popen(cmd.str().c_str(), "re");
    if (!fp) {
        result.error = "popen failed";
        std::remove(errPath.c_str());
        return result;
    }

    std::string meta;
    char buf[1024];
    while (true) {
        size_t n = fread(buf, 1, sizeof(buf), fp);
        if (n == 0) break;
        if (meta.size() < 16 * 1024) meta.append(buf, n);
    }

    int rc = pclose(fp);
    result.exitCode = decodeExitCode(rc);
    std::string stderrText = readSmallFile(errPath, 16 * 1024);
    std::remove(errPath.c_str());

    std::istringstream iss(meta);
    iss >> result.status >> result.effectiveUrl;
    if (result.effectiveUrl.empty()) result.effectiveUrl = url;

    std::error_code ec;
    auto size = std::filesystem::file_size(outPath, ec);
    if (!ec) result.bytes = static_cast<uint64_t>(size);

    if (result.exitCode != 0) {
        while (!stderrText.empty() && (stderrText.back() == '\n' || stderrText.back() == '\r')) {
            stderrText.pop_back();
        }
        result.error = "curl exited with code " + std::to_string(result.exitCode);
        if (!stderrText.empty()) result.error += ": " + stderrText;
    } else if (result.status < 200 || result.status >= 300) {
        result.error = "HTTP status " + std::to_string(result.status);
    }
    return result;
}

HttpResponse CurlHttpClient::fetch(const std::string& url) {
    std::string bodyPath = makeTempPath("testbox_curl_body_");
    if (bodyPath.empty()) {
        HttpResponse r;
        r.error = "mkstemp failed";
        return r;
    }
    HttpResponse result = run(url, bodyPath);
    result.body = readSmallFile(bodyPath, options_.maxBodyBytes);
    std::remove(bodyPath.c_str());
    LOG_DEBUG("http fetch url=" + url + " status=" + std::to_string(result.status) +
              " bytes=" + std::to_string(result.bytes));
    return result;
}

HttpResponse CurlHttpClient::download(const std::string& url, const std::string& destPath) {
    HttpResponse result = run(url, destPath);
    LOG_INFO("http download url=" + url + " status=" + std::to_string(result.status) +
             " bytes=" + std::to_string(result.bytes) + " dest=" + destPath);
    return result;
}

}
}
