#pragma once

#include "core/record.h"
#include "math/phi_math.h"
#include <string>
#include <vector>
#include <cstdint>

namespace phichain {
namespace core {

// Phi-weighted 256-bit fingerprints. A digest is the SHA3-256 of the
// payload read as a big-endian integer, multiplied by phi (primary) or
// phi^2 (backward mirror), floored and reduced mod 2^256, then written as
// 64 lowercase hex characters.
class HashEngine {
public:
    static math::Uint256 baseValue(const std::vector<uint8_t>& payload);

    static std::string primaryDigest(const std::vector<uint8_t>& payload);
    static std::string mirrorDigest(const std::vector<uint8_t>& payload, Direction direction);

    // Zero for anything that is not exactly 64 hex characters.
    static math::Uint256 digestValue(const std::string& hex);
};

}
}
