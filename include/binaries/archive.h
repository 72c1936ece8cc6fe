#pragma once

#include <string>
#include <vector>

namespace testbox {
namespace binaries {

enum class ArchiveFormat {
    ZIP,
    TAR_GZ,
    TAR_XZ
};

const char* archiveFormatName(ArchiveFormat format);

// By file extension; throws Exception(ARCHIVE_FORMAT) for anything else.
ArchiveFormat detectArchiveFormat(const std::string& path);

std::vector<std::string> listEntries(const std::string& archivePath);

// Extracts the first regular entry whose basename equals binaryName into
// destDir/binaryName and returns that path. Throws BINARY_NOT_FOUND when no
// entry matches.
std::string extractBinary(const std::string& archivePath, const std::string& binaryName,
                          const std::string& destDir);

}
}
