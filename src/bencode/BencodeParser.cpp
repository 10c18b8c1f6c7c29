#include "BencodeParser.hpp"
#include "BencodeError.hpp"
#include "../utils/Utf8Utils.hpp"
#include <limits>
#include <stdexcept>

using ParseKind = BencodeParseError::Kind;

BencodeParser::BencodeParser(std::string input, const BencodeOptions& options)
    : bytes(std::move(input)), options(options) {}

BencodeValue BencodeParser::parse() {
    if (parsed) {
        throw std::logic_error("BencodeParser instances parse their input only once");
    }
    parsed = true;

    BencodeValue value = parse_value();
    if (!bytes.isAtEnd()) {
        throw BencodeParseError(ParseKind::UnexpectedCharacter, bytes.currentIndex());
    }
    return value;
}

BencodeValue BencodeParser::parse_value() {
    uint8_t c = bytes.peek();
    if (c == 'd') {
        bytes.pop();
        return BencodeValue(parse_dictionary());
    } else if (c == 'l') {
        bytes.pop();
        return BencodeValue(parse_list());
    } else if (c == 'i') {
        bytes.pop();
        return BencodeValue(parse_integer());
    } else if (c >= '0' && c <= '9') {
        return BencodeValue(parse_string());
    } else {
        throw BencodeParseError(ParseKind::UnexpectedCharacter, bytes.currentIndex());
    }
}

void BencodeParser::enter_container() {
    if (depth >= options.maxDepth) {
        throw BencodeParseError(ParseKind::NestingTooDeep, bytes.currentIndex());
    }
    depth++;
}

BencodeValue::Dictionary BencodeParser::parse_dictionary() {
    enter_container();

    BencodeValue::Dictionary dict;
    while (bytes.peek() != 'e') {
        size_t keyStart = bytes.currentIndex();
        std::string key = parse_key();
        BencodeValue value = parse_value();

        auto it = dict.find(key);
        if (it == dict.end()) {
            dict.emplace(std::move(key), std::move(value));
        } else if (options.rejectDuplicateKeys) {
            throw BencodeParseError(ParseKind::DuplicateKey, keyStart);
        } else {
            it->second = std::move(value);
        }
    }

    bytes.pop();
    depth--;
    return dict;
}

BencodeValue::List BencodeParser::parse_list() {
    enter_container();

    BencodeValue::List list;
    while (bytes.peek() != 'e') {
        list.push_back(parse_value());
    }

    bytes.pop();
    depth--;
    return list;
}

// i[-]<magnitude>e, the leading 'i' already consumed
BencodeInteger BencodeParser::parse_integer() {
    bool negative = false;
    size_t signPosition = bytes.currentIndex();
    if (bytes.peek() == '-') {
        bytes.pop();
        negative = true;
    }

    std::string digits = parse_magnitude('e');

    BencodeInteger value = BencodeInteger::fromDecimal(digits);

    if (negative) {
        if (value.isZero() && options.rejectNegativeZero) {
            throw BencodeParseError(ParseKind::NegativeZero, signPosition);
        }
        value.negate();
    }
    return value;
}

// <length>:<raw bytes>
BencodeValue::ByteString BencodeParser::parse_string() {
    size_t length = parse_length();
    return bytes.popBytes(length);
}

std::string BencodeParser::parse_key() {
    size_t keyStart = bytes.currentIndex();
    if (bytes.peek() < '0' || bytes.peek() > '9') {
        throw BencodeParseError(ParseKind::UnexpectedCharacter, keyStart);
    }

    BencodeValue::ByteString raw = parse_string();
    if (!Utf8Utils::isValid(raw)) {
        throw BencodeParseError(ParseKind::InvalidUtf8Key, keyStart);
    }
    return Utf8Utils::toString(raw);
}

size_t BencodeParser::parse_length() {
    size_t start = bytes.currentIndex();
    std::string digits = parse_magnitude(':');

    const size_t max = std::numeric_limits<size_t>::max();
    size_t length = 0;
    for (char digit : digits) {
        size_t d = static_cast<size_t>(digit - '0');
        if (length > (max - d) / 10) {
            throw BencodeParseError(ParseKind::IntegerNotRepresentable, start);
        }
        length = length * 10 + d;
    }
    return length;
}

// Reads decimal digits up to and including the terminator and returns them.
// A leading '0' must be the only digit.
std::string BencodeParser::parse_magnitude(uint8_t terminator) {
    bool hasLeadingZero = bytes.peek() == '0';
    std::string digits;
    if (hasLeadingZero) {
        digits.push_back(static_cast<char>(bytes.pop()));
    }

    while (bytes.peek() != terminator) {
        size_t position = bytes.currentIndex();
        uint8_t c = bytes.pop();
        if (c < '0' || c > '9') {
            throw BencodeParseError(ParseKind::UnexpectedCharacter, position);
        }
        if (hasLeadingZero) {
            throw BencodeParseError(ParseKind::IntegerWithLeadingZero, position);
        }
        digits.push_back(static_cast<char>(c));
    }

    if (digits.empty()) {
        throw BencodeParseError(ParseKind::UnexpectedCharacter, bytes.currentIndex());
    }

    bytes.pop();
    return digits;
}
