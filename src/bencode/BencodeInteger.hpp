#pragma once
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>

// Arbitrary-precision signed integer, as carried by bencode `i...e` values.
// The magnitude is stored as little-endian base-1e9 limbs; zero has no limbs
// and is never negative.
class BencodeInteger {
public:
    BencodeInteger() = default;
    BencodeInteger(int64_t value);

    // Parses an optional '-' followed by decimal digits. Throws
    // std::invalid_argument on anything else. Runs in time linear in the
    // number of digits.
    static BencodeInteger fromDecimal(const std::string& text);

    void negate();

    bool isZero() const { return limbs.empty(); }
    bool isNegative() const { return negative; }

    // Checked conversions; false when the value does not fit.
    bool toInt64(int64_t& out) const;
    bool toUint64(uint64_t& out) const;

    // Nearest double; may be infinite for huge magnitudes.
    double toDouble() const;

    std::string toString() const;

    bool operator==(const BencodeInteger& other) const {
        return negative == other.negative && limbs == other.limbs;
    }
    bool operator!=(const BencodeInteger& other) const { return !(*this == other); }

private:
    static constexpr uint32_t BASE = 1000000000u;
    static constexpr size_t DIGITS_PER_LIMB = 9;

    bool magnitudeToUint64(uint64_t& out) const;

    std::vector<uint32_t> limbs;
    bool negative = false;
};
