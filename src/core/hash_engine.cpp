#include "core/hash_engine.h"
#include "crypto/crypto.h"

namespace phichain {
namespace core {

math::Uint256 HashEngine::baseValue(const std::vector<uint8_t>& payload) {
    crypto::Hash256 hash = crypto::sha3_256(payload);
    return math::Uint256::fromBigEndian(hash.data());
}

std::string HashEngine::primaryDigest(const std::vector<uint8_t>& payload) {
    return math::mulFloor(baseValue(payload), math::PHI).toHex();
}

std::string HashEngine::mirrorDigest(const std::vector<uint8_t>& payload, Direction direction) {
    if (direction == Direction::FORWARD) {
        return primaryDigest(payload);
    }
    return math::mulFloor(baseValue(payload), math::PHI_SQUARED).toHex();
}

math::Uint256 HashEngine::digestValue(const std::string& hex) {
    math::Uint256 value;
    if (!math::Uint256::fromHex(hex, value)) {
        return math::Uint256{};
    }
    return value;
}

}
}
