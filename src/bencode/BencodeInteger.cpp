#include "BencodeInteger.hpp"
#include <stdexcept>
#include <limits>
#include <cstdio>

BencodeInteger::BencodeInteger(int64_t value) {
    uint64_t magnitude = value < 0 ? uint64_t(0) - static_cast<uint64_t>(value) : static_cast<uint64_t>(value);
    while (magnitude) {
        limbs.push_back(static_cast<uint32_t>(magnitude % BASE));
        magnitude /= BASE;
    }
    negative = value < 0;
}

BencodeInteger BencodeInteger::fromDecimal(const std::string& text) {
    size_t start = (!text.empty() && text[0] == '-') ? 1 : 0;
    if (start == text.size()) {
        throw std::invalid_argument("Invalid decimal integer: " + text);
    }
    for (size_t i = start; i < text.size(); i++) {
        if (text[i] < '0' || text[i] > '9') {
            throw std::invalid_argument("Invalid decimal integer: " + text);
        }
    }

    // Each base-1e9 limb is exactly nine decimal digits, taken from the right
    BencodeInteger result;
    result.limbs.reserve((text.size() - start) / DIGITS_PER_LIMB + 1);
    size_t end = text.size();
    while (end > start) {
        size_t begin = end - start > DIGITS_PER_LIMB ? end - DIGITS_PER_LIMB : start;
        uint32_t limb = 0;
        for (size_t i = begin; i < end; i++) {
            limb = limb * 10u + static_cast<uint32_t>(text[i] - '0');
        }
        result.limbs.push_back(limb);
        end = begin;
    }
    while (!result.limbs.empty() && result.limbs.back() == 0) {
        result.limbs.pop_back();
    }

    if (start == 1) {
        result.negate();
    }
    return result;
}

void BencodeInteger::negate() {
    // Zero stays non-negative
    negative = !negative && !isZero();
}

bool BencodeInteger::magnitudeToUint64(uint64_t& out) const {
    const uint64_t max = std::numeric_limits<uint64_t>::max();
    uint64_t v = 0;
    for (size_t i = limbs.size(); i-- > 0;) {
        if (v > max / BASE) {
            return false;
        }
        v *= BASE;
        if (v > max - limbs[i]) {
            return false;
        }
        v += limbs[i];
    }
    out = v;
    return true;
}

bool BencodeInteger::toUint64(uint64_t& out) const {
    if (negative) {
        return false;
    }
    return magnitudeToUint64(out);
}

bool BencodeInteger::toInt64(int64_t& out) const {
    uint64_t magnitude = 0;
    if (!magnitudeToUint64(magnitude)) {
        return false;
    }

    const uint64_t limit = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    if (!negative) {
        if (magnitude > limit) {
            return false;
        }
        out = static_cast<int64_t>(magnitude);
    } else {
        if (magnitude > limit + 1) {
            return false;
        }
        // -(2^63) has no positive counterpart
        out = magnitude == limit + 1 ? std::numeric_limits<int64_t>::min()
                                     : -static_cast<int64_t>(magnitude);
    }
    return true;
}

double BencodeInteger::toDouble() const {
    double v = 0.0;
    for (size_t i = limbs.size(); i-- > 0;) {
        v = v * BASE + limbs[i];
    }
    return negative ? -v : v;
}

std::string BencodeInteger::toString() const {
    if (isZero()) {
        return "0";
    }

    std::string s = negative ? "-" : "";
    s += std::to_string(limbs.back());
    for (size_t i = limbs.size() - 1; i-- > 0;) {
        char buf[10];
        std::snprintf(buf, sizeof(buf), "%09u", limbs[i]);
        s += buf;
    }
    return s;
}
