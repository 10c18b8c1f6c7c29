#pragma once
#include <stdexcept>
#include <string>
#include <cstddef>
#include "BencodeCodingPath.hpp"

// Base of everything the library throws
class BencodeError : public std::runtime_error {
public:
    explicit BencodeError(const std::string& message) : std::runtime_error(message) {}
};

// Syntax-level failures raised while turning bytes into a BencodeValue.
class BencodeParseError : public BencodeError {
public:
    enum class Kind {
        UnexpectedCharacter,
        UnexpectedEndOfFile,
        IntegerWithLeadingZero,
        IntegerNotRepresentable,
        InvalidUtf8Key,
        NegativeZero,
        DuplicateKey,
        NestingTooDeep
    };

    BencodeParseError(Kind kind, size_t position);

    Kind kind() const { return errorKind; }
    size_t position() const { return errorPosition; }

    static const char* kindName(Kind kind);

private:
    Kind errorKind;
    size_t errorPosition;
};

// Failures raised while mapping a BencodeValue onto a target type.
class BencodeDecodingError : public BencodeError {
public:
    enum class Kind {
        TypeMismatch,
        ValueNotFound,
        DataCorrupted,
        NumberOutOfRange
    };

    BencodeDecodingError(Kind kind, const BencodeCodingPath& path, const std::string& detail,
                         const std::string& found = std::string());

    Kind kind() const { return errorKind; }
    const BencodeCodingPath& codingPath() const { return path; }

    // Expected shape for TypeMismatch, target type for NumberOutOfRange,
    // free-form reason otherwise.
    const std::string& detail() const { return errorDetail; }

    static const char* kindName(Kind kind);

    static BencodeDecodingError typeMismatch(const BencodeCodingPath& path, const std::string& expected,
                                             const std::string& found);
    static BencodeDecodingError valueNotFound(const BencodeCodingPath& path, const std::string& detail);
    static BencodeDecodingError dataCorrupted(const BencodeCodingPath& path, const std::string& reason);
    static BencodeDecodingError numberOutOfRange(const BencodeCodingPath& path, const std::string& target);

private:
    static std::string describe(Kind kind, const std::string& detail, const std::string& found);

    Kind errorKind;
    BencodeCodingPath path;
    std::string errorDetail;
};
