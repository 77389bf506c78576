#include "math/phi_math.h"
#include <cmath>
#include <stdexcept>

namespace phichain {
namespace math {

const FixedPoint PHI = {
    1,
    {0x2767f0b153d27b7fULL, 0xf86c6a11d0c18e95ULL, 0x1082276bf3a27251ULL,
     0xf39cc0605cedc834ULL, 0x9e3779b97f4a7c15ULL}
};

const FixedPoint PHI_SQUARED = {
    2,
    {0x2767f0b153d27b7fULL, 0xf86c6a11d0c18e95ULL, 0x1082276bf3a27251ULL,
     0xf39cc0605cedc834ULL, 0x9e3779b97f4a7c15ULL}
};

const char* const PHI_DECIMAL =
    "1.6180339887498948482045868343656381177203091798057628621354486227";

static std::vector<uint64_t> mulLimbs(const uint64_t* a, size_t na, const uint64_t* b, size_t nb) {
    std::vector<uint64_t> out(na + nb, 0);
    for (size_t i = 0; i < na; i++) {
        uint64_t carry = 0;
        for (size_t j = 0; j < nb; j++) {
            unsigned __int128 cur = static_cast<unsigned __int128>(a[i]) * b[j] + out[i + j] + carry;
            out[i + j] = static_cast<uint64_t>(cur);
            carry = static_cast<uint64_t>(cur >> 64);
        }
        out[i + nb] = carry;
    }
    return out;
}

static std::array<uint64_t, FIXED_FRACTION_LIMBS + 1> fixedLimbs(const FixedPoint& fp) {
    std::array<uint64_t, FIXED_FRACTION_LIMBS + 1> limbs{};
    for (size_t i = 0; i < FIXED_FRACTION_LIMBS; i++) limbs[i] = fp.fraction[i];
    limbs[FIXED_FRACTION_LIMBS] = fp.integer;
    return limbs;
}

Uint256 Uint256::fromU64(uint64_t value) {
    Uint256 v;
    v.limbs[0] = value;
    return v;
}

Uint256 Uint256::fromBigEndian(const uint8_t* bytes) {
    Uint256 v;
    for (size_t limb = 0; limb < UINT256_LIMBS; limb++) {
        const uint8_t* p = bytes + (UINT256_LIMBS - 1 - limb) * 8;
        uint64_t x = 0;
        for (int i = 0; i < 8; i++) x = (x << 8) | p[i];
        v.limbs[limb] = x;
    }
    return v;
}

bool Uint256::fromHex(const std::string& hex, Uint256& out) {
    if (hex.size() != 64) return false;
    Uint256 v;
    for (size_t i = 0; i < 64; i++) {
        char c = hex[i];
        uint64_t d;
        if (c >= '0' && c <= '9') d = c - '0';
        else if (c >= 'a' && c <= 'f') d = c - 'a' + 10;
        else if (c >= 'A' && c <= 'F') d = c - 'A' + 10;
        else return false;
        size_t bitPos = (63 - i) * 4;
        v.limbs[bitPos / 64] |= d << (bitPos % 64);
    }
    out = v;
    return true;
}

std::string Uint256::toHex() const {
    static const char hex[] = "0123456789abcdef";
    std::string result(64, '0');
    for (size_t i = 0; i < 64; i++) {
        size_t bitPos = (63 - i) * 4;
        result[i] = hex[(limbs[bitPos / 64] >> (bitPos % 64)) & 0x0f];
    }
    return result;
}

bool Uint256::isZero() const {
    for (uint64_t l : limbs) {
        if (l != 0) return false;
    }
    return true;
}

long double Uint256::toLongDouble() const {
    long double v = 0.0L;
    for (size_t i = 0; i < UINT256_LIMBS; i++) {
        v += std::ldexp(static_cast<long double>(limbs[i]), static_cast<int>(64 * i));
    }
    return v;
}

long double FixedPoint::toLongDouble() const {
    long double v = static_cast<long double>(integer);
    for (size_t i = 0; i < FIXED_FRACTION_LIMBS; i++) {
        v += std::ldexp(static_cast<long double>(fraction[i]),
                        static_cast<int>(64 * i) - static_cast<int>(FIXED_FRACTION_BITS));
    }
    return v;
}

Uint256 mulFloor(const Uint256& value, const FixedPoint& factor) {
    auto f = fixedLimbs(factor);
    auto product = mulLimbs(value.limbs.data(), UINT256_LIMBS, f.data(), f.size());
    Uint256 result;
    for (size_t i = 0; i < UINT256_LIMBS; i++) {
        result.limbs[i] = product[FIXED_FRACTION_LIMBS + i];
    }
    return result;
}

long double phiClosedForm() {
    return (1.0L + std::sqrt(5.0L)) / 2.0L;
}

long double phiFromFibonacci(int terms) {
    long double prev = 1.0L;
    long double cur = 1.0L;
    for (int i = 0; i < terms; i++) {
        long double next = prev + cur;
        prev = cur;
        cur = next;
    }
    return cur / prev;
}

static bool phiSquaredMatches() {
    auto f = fixedLimbs(PHI);
    auto sq = mulLimbs(f.data(), f.size(), f.data(), f.size());
    auto target = fixedLimbs(PHI_SQUARED);

    // Truncating both factors can only lose value, so PHI*PHI lands on
    // PHI_SQUARED or one unit below it.
    std::array<uint64_t, FIXED_FRACTION_LIMBS + 1> shifted{};
    for (size_t i = 0; i < shifted.size(); i++) shifted[i] = sq[FIXED_FRACTION_LIMBS + i];
    if (sq[sq.size() - 1] != 0) return false;
    if (shifted == target) return true;

    for (size_t i = 0; i < shifted.size(); i++) {
        if (++shifted[i] != 0) break;
    }
    return shifted == target;
}

bool verifyPhiConstant() {
    if (!phiSquaredMatches()) return false;

    // F(k+1) - phi * F(k) == (-1/phi)^k
    for (int k = 1; k < MAX_FIBONACCI_INDEX; k++) {
        int64_t fk = fibonacci(k);
        int64_t next = fibonacci(k + 1);
        int64_t expected = (k % 2 == 0) ? next - 1 : next;
        if (mulFloor(Uint256::fromU64(static_cast<uint64_t>(fk)), PHI) !=
            Uint256::fromU64(static_cast<uint64_t>(expected))) {
            return false;
        }
    }

    long double fixed = PHI.toLongDouble();
    if (std::fabs(fixed - phiClosedForm()) > 1e-15L) return false;
    if (std::fabs(fixed - phiFromFibonacci()) > 1e-15L) return false;
    return true;
}

int64_t fibonacci(int n) {
    if (n > MAX_FIBONACCI_INDEX || n < -MAX_FIBONACCI_INDEX) {
        throw std::out_of_range("fibonacci index out of range: " + std::to_string(n));
    }
    if (n == 0) return 0;

    int target = n < 0 ? -n : n;
    int64_t a = 0;
    int64_t b = 1;
    for (int i = 1; i < target; i++) {
        int64_t next = a + b;
        a = b;
        b = next;
    }

    if (n < 0 && target % 2 == 0) return -b;
    return b;
}

std::vector<int64_t> zeckendorf(int64_t n) {
    std::vector<int64_t> result;
    if (n == 0) return result;

    bool negative = n < 0;
    uint64_t remainder = negative ? 0 - static_cast<uint64_t>(n) : static_cast<uint64_t>(n);

    // F(1) == F(2); start at F(2) so every term is distinct.
    std::vector<uint64_t> fibs;
    for (int k = 2; k <= MAX_FIBONACCI_INDEX; k++) {
        uint64_t f = static_cast<uint64_t>(fibonacci(k));
        if (f > remainder) break;
        fibs.push_back(f);
    }

    for (auto it = fibs.rbegin(); it != fibs.rend() && remainder > 0; ++it) {
        if (*it <= remainder) {
            remainder -= *it;
            int64_t term = static_cast<int64_t>(*it);
            result.push_back(negative ? -term : term);
        }
    }
    return result;
}

bool isFibonacciNumber(int64_t n) {
    if (n < 0) return false;
    for (int k = 0; k <= MAX_FIBONACCI_INDEX; k++) {
        int64_t f = fibonacci(k);
        if (f == n) return true;
        if (f > n) return false;
    }
    return false;
}

}
}
