#pragma once

#include <map>
#include <string>
#include <vector>
#include <optional>
#include <type_traits>
#include "BencodeContainers.hpp"

// Composite types reconstruct themselves field by field.
template <typename T, typename Enable>
struct BencodeDecodable {
    static T decode(const BencodeDecoderHandle& decoder) {
        return T::decode(decoder);
    }
};

// Raw bytes. Takes precedence over the std::vector<T> list mapping below, so
// a list of small integers cannot be decoded into std::vector<uint8_t>.
template <>
struct BencodeDecodable<BencodeValue::ByteString> {
    static BencodeValue::ByteString decode(const BencodeDecoderHandle& decoder) {
        return decoder.singleValueContainer().decodeBytes();
    }
};

template <>
struct BencodeDecodable<std::string> {
    static std::string decode(const BencodeDecoderHandle& decoder) {
        return decoder.singleValueContainer().decodeString();
    }
};

template <>
struct BencodeDecodable<Url> {
    static Url decode(const BencodeDecoderHandle& decoder) {
        return decoder.singleValueContainer().decodeUrl();
    }
};

template <>
struct BencodeDecodable<BencodeInteger> {
    static BencodeInteger decode(const BencodeDecoderHandle& decoder) {
        return decoder.singleValueContainer().decodeInteger();
    }
};

template <>
struct BencodeDecodable<bool> {
    static bool decode(const BencodeDecoderHandle& decoder) {
        return decoder.singleValueContainer().decodeBool();
    }
};

// Leaves part of a document undecoded
template <>
struct BencodeDecodable<BencodeValue> {
    static BencodeValue decode(const BencodeDecoderHandle& decoder) {
        return decoder.getValue();
    }
};

template <typename T>
struct BencodeDecodable<T, std::enable_if_t<std::is_arithmetic<T>::value && !std::is_same<T, bool>::value>> {
    static T decode(const BencodeDecoderHandle& decoder) {
        return decoder.singleValueContainer().decodeNumber<T>();
    }
};

template <typename T>
struct BencodeDecodable<std::vector<T>> {
    static std::vector<T> decode(const BencodeDecoderHandle& decoder) {
        BencodeUnkeyedContainer container = decoder.unkeyedContainer();
        std::vector<T> result;
        result.reserve(container.count());
        while (!container.isAtEnd()) {
            result.push_back(container.decode<T>());
        }
        return result;
    }
};

template <typename T>
struct BencodeDecodable<std::map<std::string, T>> {
    static std::map<std::string, T> decode(const BencodeDecoderHandle& decoder) {
        BencodeKeyedContainer container = decoder.container();
        std::map<std::string, T> result;
        for (const auto& key : container.allKeys()) {
            result.emplace(key, container.decode<T>(key));
        }
        return result;
    }
};

// Reached only for present values; absent keys are handled by
// BencodeKeyedContainer::decodeIfPresent.
template <typename T>
struct BencodeDecodable<std::optional<T>> {
    static std::optional<T> decode(const BencodeDecoderHandle& decoder) {
        return decoder.singleValueContainer().decode<T>();
    }
};
