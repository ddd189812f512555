#pragma once

#include <string>
#include <vector>
#include <array>
#include <cstdint>

namespace sigelnet {
namespace crypto {

constexpr size_t SHA256_SIZE = 32;

using Hash256 = std::array<uint8_t, SHA256_SIZE>;

Hash256 sha256(const uint8_t* data, size_t len);
Hash256 sha256(const std::vector<uint8_t>& data);
Hash256 sha256(const std::string& data);
Hash256 doubleSha256(const uint8_t* data, size_t len);
Hash256 doubleSha256(const std::vector<uint8_t>& data);
std::string sha256Hex(const std::string& data);

std::vector<uint8_t> randomBytes(size_t count);
uint64_t randomUint64();

std::string toHex(const uint8_t* data, size_t len);
std::string toHex(const std::vector<uint8_t>& data);
template<size_t N>
std::string toHex(const std::array<uint8_t, N>& data) {
    return toHex(data.data(), N);
}
std::vector<uint8_t> fromHex(const std::string& hex);
bool isHex(const std::string& str);
// Returns false unless hex is exactly 64 hex characters.
bool hashFromHex(const std::string& hex, Hash256& out);

bool isZero(const Hash256& hash);

}
}
