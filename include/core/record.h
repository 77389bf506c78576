#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace phichain {
namespace core {

enum class Direction : uint8_t {
    FORWARD = 0,
    BACKWARD = 1
};

const char* directionToString(Direction direction);
bool directionFromString(const std::string& name, Direction& out);
Direction opposite(Direction direction);

// 64 hex zeros: predecessor of the first record in either chain.
extern const char* const GENESIS_SENTINEL;

// A single ledger entry. Only TemporalLedger creates these, so the chain
// linkage of a record reachable from a ledger always holds.
struct Record {
    std::vector<uint8_t> payload;
    Direction direction = Direction::FORWARD;
    double createdAt = 0.0;
    std::string predecessorDigest;
    std::string primaryDigest;
    std::string mirrorDigest;

    // Recomputes both digests from the payload and compares.
    bool verify() const;
    std::string payloadString() const;
};

}
}
