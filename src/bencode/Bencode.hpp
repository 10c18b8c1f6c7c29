#pragma once
#include "BencodeDecoder.hpp"

class Bencode {
public:
    static BencodeValue parse(const std::string& encoded_value, const BencodeOptions& options = BencodeOptions()) {
        return BencodeDecoder(options).parse(encoded_value);
    }

    template <typename T>
    static T decode(const std::string& encoded_value, const BencodeOptions& options = BencodeOptions()) {
        return BencodeDecoder(options).decode<T>(encoded_value);
    }
};
