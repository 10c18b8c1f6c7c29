#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include "BencodeOptions.hpp"
#include "BencodeValue.hpp"
#include "BencodeDecodable.hpp"

// Top-level entry point: bytes -> BencodeValue -> T.
class BencodeDecoder {
public:
    explicit BencodeDecoder(const BencodeOptions& options = BencodeOptions()) : options(options) {}

    // Throws BencodeParseError
    BencodeValue parse(const std::string& encoded_value) const;

    // Throws BencodeParseError or BencodeDecodingError
    template <typename T>
    T decode(const std::string& encoded_value) const {
        BencodeValue value = parse(encoded_value);
        return decode<T>(value);
    }

    template <typename T>
    T decode(const std::vector<uint8_t>& data) const {
        return decode<T>(std::string(data.begin(), data.end()));
    }

    // Decodes an already parsed tree; the tree can be decoded any number of
    // times into different types.
    template <typename T>
    T decode(const BencodeValue& value) const {
        return BencodeDecoderHandle(value).singleValueContainer().decode<T>();
    }

private:
    BencodeOptions options;
};
