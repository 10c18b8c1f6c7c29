#include "BencodeError.hpp"

BencodeParseError::BencodeParseError(Kind kind, size_t position)
    : BencodeError(std::string(kindName(kind)) + " at offset " + std::to_string(position)),
      errorKind(kind),
      errorPosition(position) {}

const char* BencodeParseError::kindName(Kind kind) {
    switch (kind) {
        case Kind::UnexpectedCharacter: return "Unexpected character";
        case Kind::UnexpectedEndOfFile: return "Unexpected end of file";
        case Kind::IntegerWithLeadingZero: return "Integer with leading zero";
        case Kind::IntegerNotRepresentable: return "Integer not representable";
        case Kind::InvalidUtf8Key: return "Dictionary key is not valid UTF-8";
        case Kind::NegativeZero: return "Negative zero";
        case Kind::DuplicateKey: return "Duplicate dictionary key";
        case Kind::NestingTooDeep: return "Nesting too deep";
    }
    return "Unknown parse error";
}

BencodeDecodingError::BencodeDecodingError(Kind kind, const BencodeCodingPath& path, const std::string& detail,
                                           const std::string& found)
    : BencodeError(std::string(kindName(kind)) + " at " + path.toString() + ": " + describe(kind, detail, found)),
      errorKind(kind),
      path(path),
      errorDetail(detail) {}

std::string BencodeDecodingError::describe(Kind kind, const std::string& detail, const std::string& found) {
    switch (kind) {
        case Kind::TypeMismatch: return "expected " + detail + (found.empty() ? "" : ", found " + found);
        case Kind::NumberOutOfRange: return "does not fit in " + detail;
        default: return detail;
    }
}

const char* BencodeDecodingError::kindName(Kind kind) {
    switch (kind) {
        case Kind::TypeMismatch: return "Type mismatch";
        case Kind::ValueNotFound: return "Value not found";
        case Kind::DataCorrupted: return "Data corrupted";
        case Kind::NumberOutOfRange: return "Number out of range";
    }
    return "Unknown decoding error";
}

BencodeDecodingError BencodeDecodingError::typeMismatch(const BencodeCodingPath& path, const std::string& expected,
                                                       const std::string& found) {
    return BencodeDecodingError(Kind::TypeMismatch, path, expected, found);
}

BencodeDecodingError BencodeDecodingError::valueNotFound(const BencodeCodingPath& path, const std::string& detail) {
    return BencodeDecodingError(Kind::ValueNotFound, path, detail);
}

BencodeDecodingError BencodeDecodingError::dataCorrupted(const BencodeCodingPath& path, const std::string& reason) {
    return BencodeDecodingError(Kind::DataCorrupted, path, reason);
}

BencodeDecodingError BencodeDecodingError::numberOutOfRange(const BencodeCodingPath& path, const std::string& target) {
    return BencodeDecodingError(Kind::NumberOutOfRange, path, target);
}
