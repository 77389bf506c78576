#include "core/record.h"
#include "core/hash_engine.h"
#include <algorithm>
#include <cctype>

namespace phichain {
namespace core {

const char* const GENESIS_SENTINEL =
    "0000000000000000000000000000000000000000000000000000000000000000";

const char* directionToString(Direction direction) {
    switch (direction) {
        case Direction::FORWARD: return "forward";
        case Direction::BACKWARD: return "backward";
        default: return "unknown";
    }
}

bool directionFromString(const std::string& name, Direction& out) {
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "forward" || v == "f") {
        out = Direction::FORWARD;
        return true;
    }
    if (v == "backward" || v == "b") {
        out = Direction::BACKWARD;
        return true;
    }
    return false;
}

Direction opposite(Direction direction) {
    return direction == Direction::FORWARD ? Direction::BACKWARD : Direction::FORWARD;
}

bool Record::verify() const {
    if (primaryDigest != HashEngine::primaryDigest(payload)) return false;
    return mirrorDigest == HashEngine::mirrorDigest(payload, direction);
}

std::string Record::payloadString() const {
    return std::string(payload.begin(), payload.end());
}

}
}
