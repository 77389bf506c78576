#include "crypto/crypto.h"
#include <openssl/evp.h>
#include <memory>

namespace phichain {
namespace crypto {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

}

Hash256 sha3_256(const uint8_t* data, size_t len) {
    Hash256 hash{};
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) throw CryptoError("OpenSSL: EVP_MD_CTX_new failed");

    unsigned int outLen = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha3_256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data, len) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), hash.data(), &outLen) != 1) {
        throw CryptoError("OpenSSL: SHA3-256 digest failed");
    }
    if (outLen != SHA3_256_SIZE) {
        throw CryptoError("OpenSSL: unexpected SHA3-256 digest length");
    }
    return hash;
}

Hash256 sha3_256(const std::vector<uint8_t>& data) {
    return sha3_256(data.data(), data.size());
}

Hash256 sha3_256(const std::string& data) {
    return sha3_256(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::string sha3_256Hex(const std::vector<uint8_t>& data) {
    Hash256 hash = sha3_256(data);
    return toHex(hash.data(), hash.size());
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

std::string toHex(const std::vector<uint8_t>& data) {
    return toHex(data.data(), data.size());
}

static int nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::vector<uint8_t> fromHex(const std::string& hex) {
    std::vector<uint8_t> result;
    result.reserve(hex.size() / 2);
    for (size_t i = 0; i + 1 < hex.size(); i += 2) {
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) return {};
        result.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return result;
}

bool isHex(const std::string& str, size_t length) {
    if (str.size() != length) return false;
    for (char c : str) {
        if (nibble(c) < 0) return false;
    }
    return true;
}

}
}
