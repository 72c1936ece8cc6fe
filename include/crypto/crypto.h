#pragma once

#include <string>
#include <vector>
#include <array>
#include <cstdint>

namespace testbox {
namespace crypto {

constexpr size_t SHA256_SIZE = 32;
constexpr size_t ENVIRONMENT_ID_LENGTH = 22;

using Hash256 = std::array<uint8_t, SHA256_SIZE>;

// Incremental SHA-256 so large archives are hashed without loading them whole.
class Sha256 {
public:
    Sha256();

    void update(const uint8_t* data, size_t len);
    void update(const std::string& data);
    Hash256 finalize();

private:
    uint32_t state_[8];
    uint8_t buffer_[64];
    size_t bufferLen_;
    uint64_t totalLen_;
    bool finalized_;
};

Hash256 sha256(const uint8_t* data, size_t len);
Hash256 sha256(const std::string& data);
std::string sha256Hex(const std::string& data);

// Returns false (and leaves `outHex` untouched) when the file cannot be read.
bool sha256File(const std::string& path, std::string& outHex, uint64_t* bytesRead = nullptr);

std::vector<uint8_t> randomBytes(size_t count);

std::string toHex(const uint8_t* data, size_t len);
template<size_t N>
std::string toHex(const std::array<uint8_t, N>& data) {
    return toHex(data.data(), N);
}
bool isHexDigest(const std::string& s);

std::string base58Encode(const std::vector<uint8_t>& data);
std::string randomBase58Id(size_t length = ENVIRONMENT_ID_LENGTH);

}
}
