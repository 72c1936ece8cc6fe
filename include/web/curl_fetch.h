#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace testbox {
namespace web {

struct HttpOptions {
    uint32_t timeoutSeconds = 300;
    size_t maxBodyBytes = 8 * 1024 * 1024;
    std::string userAgent = "testbox/0.1";
    bool followRedirects = true;
};

struct HttpResponse {
    long status = 0;
    std::string body;
    std::string effectiveUrl;
    std::string error;
    uint64_t bytes = 0;
    int exitCode = -1;

    bool ok() const { return error.empty() && status >= 200 && status < 300; }
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Small payloads (release metadata, checksum lists); body is capped.
    virtual HttpResponse fetch(const std::string& url) = 0;
    // Streams the response body into destPath; `bytes` is the size written.
    virtual HttpResponse download(const std::string& url, const std::string& destPath) = 0;
};

// Drives the host `curl` binary.
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(const HttpOptions& options = HttpOptions());

    HttpResponse fetch(const std::string& url) override;
    HttpResponse download(const std::string& url, const std::string& destPath) override;

private:
    HttpResponse run(const std::string& url, const std::string& outPath);

    HttpOptions options_;
};

std::string shellEscape(const std::string& s);

}
}
