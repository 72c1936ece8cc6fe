#pragma once

#include "platform/platform.h"
#include <string>
#include <map>
#include <optional>
#include <vector>

namespace testbox {
namespace binaries {

enum class ChecksumStyle {
    SHASUMS_LIST,   // one file listing every asset of the release
    PER_ASSET       // <asset>.sha256 next to each asset
};

// Where a downloadable tool lives. Templates use {version}, {platform},
// {arch} and {format} placeholders.
struct BinarySpec {
    std::string name;
    std::string urlTemplate;
    std::string checksumTemplate;
    ChecksumStyle checksumStyle;
    std::string archiveEntry;
};

const BinarySpec* findBinarySpec(const std::string& name);
std::vector<std::string> downloadableBinaries();

std::string expandTemplate(const std::string& tmpl, const std::map<std::string, std::string>& vars);

std::string assetUrl(const BinarySpec& spec, const std::string& version,
                     const platform::RuntimePlatform& plat);
std::string checksumUrl(const BinarySpec& spec, const std::string& version, const std::string& assetUrl);
std::string assetFileName(const std::string& url);

// Finds the digest for fileName in `sha256sum`-style text. A single bare
// digest is accepted for per-asset files.
std::optional<std::string> findChecksum(const std::string& listing, const std::string& fileName);

}
}
