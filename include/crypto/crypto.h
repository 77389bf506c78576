#pragma once

#include <string>
#include <vector>
#include <array>
#include <cstdint>
#include <stdexcept>

namespace phichain {
namespace crypto {

constexpr size_t SHA3_256_SIZE = 32;

using Hash256 = std::array<uint8_t, SHA3_256_SIZE>;

// An OpenSSL call failed. Hashing has no recoverable failure mode, so this
// only surfaces for a broken or misconfigured libcrypto.
class CryptoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Throws CryptoError if the OpenSSL digest cannot be computed.
Hash256 sha3_256(const uint8_t* data, size_t len);
Hash256 sha3_256(const std::vector<uint8_t>& data);
Hash256 sha3_256(const std::string& data);
std::string sha3_256Hex(const std::vector<uint8_t>& data);

std::string toHex(const uint8_t* data, size_t len);
std::string toHex(const std::vector<uint8_t>& data);
template<size_t N>
std::string toHex(const std::array<uint8_t, N>& data) {
    return toHex(data.data(), N);
}
std::vector<uint8_t> fromHex(const std::string& hex);
bool isHex(const std::string& str, size_t length);

}
}
