#include "crypto/crypto.h"
#include <cstring>
#include <random>
#include <fstream>
#include <cctype>
#include <algorithm>

namespace testbox {
namespace crypto {

static const char BASE58_ALPHABET[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

static inline uint32_t rotr32(uint32_t x, int n) { return (x >> n) | (x << (32 - n)); }
static inline uint32_t ch(uint32_t x, uint32_t y, uint32_t z) { return (x & y) ^ (~x & z); }
static inline uint32_t maj(uint32_t x, uint32_t y, uint32_t z) { return (x & y) ^ (x & z) ^ (y & z); }
static inline uint32_t sig0(uint32_t x) { return rotr32(x, 2) ^ rotr32(x, 13) ^ rotr32(x, 22); }
static inline uint32_t sig1(uint32_t x) { return rotr32(x, 6) ^ rotr32(x, 11) ^ rotr32(x, 25); }
static inline uint32_t ep0(uint32_t x) { return rotr32(x, 7) ^ rotr32(x, 18) ^ (x >> 3); }
static inline uint32_t ep1(uint32_t x) { return rotr32(x, 17) ^ rotr32(x, 19) ^ (x >> 10); }

static const uint32_t K256[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
};

static void sha256Transform(uint32_t state[8], const uint8_t block[64]) {
    uint32_t w[64];
    for (int i = 0; i < 16; i++) {
        w[i] = (static_cast<uint32_t>(block[i*4]) << 24) | (static_cast<uint32_t>(block[i*4+1]) << 16) |
               (static_cast<uint32_t>(block[i*4+2]) << 8) | block[i*4+3];
    }
    for (int i = 16; i < 64; i++) {
        w[i] = ep1(w[i-2]) + w[i-7] + ep0(w[i-15]) + w[i-16];
    }

    uint32_t a = state[0], b = state[1], c = state[2], d = state[3];
    uint32_t e = state[4], f = state[5], g = state[6], h = state[7];

    for (int i = 0; i < 64; i++) {
        uint32_t t1 = h + sig1(e) + ch(e, f, g) + K256[i] + w[i];
        uint32_t t2 = sig0(a) + maj(a, b, c);
        h = g; g = f; f = e; e = d + t1;
        d = c; c = b; b = a; a = t1 + t2;
    }

    state[0] += a; state[1] += b; state[2] += c; state[3] += d;
    state[4] += e; state[5] += f; state[6] += g; state[7] += h;
}

Sha256::Sha256() : state_{0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
                          0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19},
                   buffer_{}, bufferLen_(0), totalLen_(0), finalized_(false) {}

void Sha256::update(const uint8_t* data, size_t len) {
    if (finalized_ || len == 0) return;
    totalLen_ += len;

    if (bufferLen_ > 0) {
        size_t take = std::min(len, sizeof(buffer_) - bufferLen_);
        std::memcpy(buffer_ + bufferLen_, data, take);
        bufferLen_ += take;
        data += take;
        len -= take;
        if (bufferLen_ < sizeof(buffer_)) return;
        sha256Transform(state_, buffer_);
        bufferLen_ = 0;
    }

    while (len >= 64) {
        sha256Transform(state_, data);
        data += 64;
        len -= 64;
    }

    if (len > 0) {
        std::memcpy(buffer_, data, len);
        bufferLen_ = len;
    }
}

void Sha256::update(const std::string& data) {
    update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

Hash256 Sha256::finalize() {
    Hash256 hash{};
    if (!finalized_) {
        uint64_t bits = totalLen_ * 8;
        size_t rem = bufferLen_;
        buffer_[rem++] = 0x80;

        if (rem > 56) {
            std::memset(buffer_ + rem, 0, 64 - rem);
            sha256Transform(state_, buffer_);
            rem = 0;
        }

        std::memset(buffer_ + rem, 0, 56 - rem);
        for (int j = 0; j < 8; j++) {
            buffer_[56 + j] = (bits >> (56 - j * 8)) & 0xff;
        }
        sha256Transform(state_, buffer_);
        finalized_ = true;
    }

    for (int j = 0; j < 8; j++) {
        hash[j*4] = (state_[j] >> 24) & 0xff;
        hash[j*4+1] = (state_[j] >> 16) & 0xff;
        hash[j*4+2] = (state_[j] >> 8) & 0xff;
        hash[j*4+3] = state_[j] & 0xff;
    }
    return hash;
}

Hash256 sha256(const uint8_t* data, size_t len) {
    Sha256 ctx;
    ctx.update(data, len);
    return ctx.finalize();
}

Hash256 sha256(const std::string& data) {
    return sha256(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::string sha256Hex(const std::string& data) {
    Hash256 hash = sha256(data);
    return toHex(hash.data(), hash.size());
}

bool sha256File(const std::string& path, std::string& outHex, uint64_t* bytesRead) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return false;

    Sha256 ctx;
    std::vector<char> buf(64 * 1024);
    uint64_t total = 0;
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize got = in.gcount();
        if (got > 0) {
            ctx.update(reinterpret_cast<const uint8_t*>(buf.data()), static_cast<size_t>(got));
            total += static_cast<uint64_t>(got);
        }
    }
    if (in.bad()) return false;

    Hash256 hash = ctx.finalize();
    outHex = toHex(hash.data(), hash.size());
    if (bytesRead) *bytesRead = total;
    return true;
}

std::vector<uint8_t> randomBytes(size_t count) {
    std::vector<uint8_t> bytes(count);
    std::random_device rd;
    for (size_t i = 0; i < count; i++) {
        bytes[i] = static_cast<uint8_t>(rd() & 0xff);
    }
    return bytes;
}

std::string toHex(const uint8_t* data, size_t len) {
    static const char hex[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        result += hex[data[i] >> 4];
        result += hex[data[i] & 0x0f];
    }
    return result;
}

bool isHexDigest(const std::string& s) {
    if (s.size() != SHA256_SIZE * 2) return false;
    for (char c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::string base58Encode(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> digits(data.size() * 138 / 100 + 1, 0);
    size_t digitsLen = 1;

    for (size_t i = 0; i < data.size(); i++) {
        uint32_t carry = data[i];
        for (size_t j = 0; j < digitsLen; j++) {
            carry += static_cast<uint32_t>(digits[j]) << 8;
            digits[j] = carry % 58;
            carry /= 58;
        }
        while (carry > 0) {
            digits[digitsLen++] = carry % 58;
            carry /= 58;
        }
    }

    std::string result;
    for (size_t i = 0; i < data.size() && data[i] == 0; i++) {
        result += BASE58_ALPHABET[0];
    }
    for (size_t i = digitsLen; i-- > 0; ) {
        result += BASE58_ALPHABET[digits[i]];
    }
    return result;
}

// Fixed-length id: encode 16 random bytes, pad or cut to `length` characters
// with further random alphabet picks (rejection sampled, no modulo bias).
std::string randomBase58Id(size_t length) {
    std::string id = base58Encode(randomBytes(16));
    if (id.size() > length) id.resize(length);
    while (id.size() < length) {
        for (uint8_t b : randomBytes(length)) {
            if (b >= 58 * 4) continue;
            id += BASE58_ALPHABET[b % 58];
            if (id.size() == length) break;
        }
    }
    return id;
}

}
}
