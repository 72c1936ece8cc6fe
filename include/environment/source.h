#pragma once

#include "sandbox/sandbox.h"
#include <string>
#include <memory>

namespace testbox {
namespace environment {

// Canonical HTTPS form of a repository reference. Throws
// Exception(INVALID_ARGUMENT) for empty input, query strings, fragments and
// plain http.
std::string normalizeRepositoryUrl(const std::string& url);

// True when source names an existing local directory.
bool isLocalSource(const std::string& source);

class SourceProvider {
public:
    virtual ~SourceProvider() = default;
    virtual const char* kind() const = 0;
    // Fills destDir (which exists and is empty). Throws Exception(SOURCE_ERROR).
    virtual void materialize(const std::string& source, const std::string& branch,
                             const std::string& destDir) = 0;
};

// Shallow clone run inside a throw-away staging sandbox, then moved into
// destDir. The staging sandbox is destroyed on every path.
class GitSourceProvider : public SourceProvider {
public:
    GitSourceProvider(const sandbox::SandboxManager& manager, const std::string& hostPath = "",
                      uint32_t timeoutSeconds = 600);

    const char* kind() const override { return "git"; }
    void materialize(const std::string& source, const std::string& branch,
                     const std::string& destDir) override;

private:
    const sandbox::SandboxManager& manager_;
    std::string hostPath_;
    uint32_t timeoutSeconds_;
};

// Recursive copy that leaves out .git.
class LocalPathSourceProvider : public SourceProvider {
public:
    const char* kind() const override { return "local"; }
    void materialize(const std::string& source, const std::string& branch,
                     const std::string& destDir) override;
};

// Moves (or copies across filesystems) the children of from into to.
void moveContents(const std::string& from, const std::string& to);

}
}
