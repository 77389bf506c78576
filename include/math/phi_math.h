#pragma once

#include <string>
#include <vector>
#include <array>
#include <cstdint>

namespace phichain {
namespace math {

constexpr size_t UINT256_LIMBS = 4;
constexpr size_t FIXED_FRACTION_LIMBS = 5;
constexpr unsigned FIXED_FRACTION_BITS = 64 * FIXED_FRACTION_LIMBS;
constexpr int MAX_FIBONACCI_INDEX = 92;

// Unsigned 256-bit integer, little-endian 64-bit limbs.
struct Uint256 {
    std::array<uint64_t, UINT256_LIMBS> limbs{};

    static Uint256 fromU64(uint64_t value);
    static Uint256 fromBigEndian(const uint8_t* bytes);
    static bool fromHex(const std::string& hex, Uint256& out);

    std::string toHex() const;
    bool isZero() const;
    long double toLongDouble() const;

    bool operator==(const Uint256& other) const { return limbs == other.limbs; }
    bool operator!=(const Uint256& other) const { return limbs != other.limbs; }
};

// Unsigned fixed-point value: integer + fraction / 2^320.
struct FixedPoint {
    uint64_t integer = 0;
    std::array<uint64_t, FIXED_FRACTION_LIMBS> fraction{};

    long double toLongDouble() const;
};

// floor(phi * 2^320), the bit-exact constant every digest is scaled by.
extern const FixedPoint PHI;
// phi^2 == phi + 1, so only the integer part differs from PHI.
extern const FixedPoint PHI_SQUARED;
// Decimal expansion of phi, truncated.
extern const char* const PHI_DECIMAL;

// floor(value * factor) mod 2^256
Uint256 mulFloor(const Uint256& value, const FixedPoint& factor);

long double phiClosedForm();
long double phiFromFibonacci(int terms = 80);

// Cross-checks PHI against phi^2 == phi + 1, the Fibonacci limit
// identity floor(F(k) * phi) and both floating-point derivations.
bool verifyPhiConstant();

// Bidirectional Fibonacci: F(-n) = (-1)^(n+1) * F(n).
// Throws std::out_of_range when |n| > MAX_FIBONACCI_INDEX.
int64_t fibonacci(int n);

// Non-consecutive Fibonacci terms summing to n, largest first.
std::vector<int64_t> zeckendorf(int64_t n);

bool isFibonacciNumber(int64_t n);

}
}
