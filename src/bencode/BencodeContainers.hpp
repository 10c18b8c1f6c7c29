#pragma once

#include <string>
#include <vector>
#include <optional>
#include <limits>
#include <cmath>
#include <type_traits>
#include "BencodeValue.hpp"
#include "BencodeCodingPath.hpp"
#include "BencodeError.hpp"
#include "../utils/Url.hpp"

// Reconstructs a T from a decoder handle. Specialize it, or give T a
// `static T decode(const BencodeDecoderHandle&)`. The built-in
// specializations live in BencodeDecodable.hpp.
template <typename T, typename Enable = void>
struct BencodeDecodable;

class BencodeKeyedContainer;
class BencodeUnkeyedContainer;
class BencodeSingleValueContainer;

// A value in the tree together with the path that leads to it. This is what
// every decodable type is reconstructed from.
class BencodeDecoderHandle {
public:
    BencodeDecoderHandle(const BencodeValue& value, BencodeCodingPath path = BencodeCodingPath())
        : value(&value), path(std::move(path)) {}

    const BencodeCodingPath& codingPath() const { return path; }
    const BencodeValue& getValue() const { return *value; }

    // Throws DataCorrupted unless the value is a dictionary
    BencodeKeyedContainer container() const;
    // Throws DataCorrupted unless the value is a list
    BencodeUnkeyedContainer unkeyedContainer() const;
    BencodeSingleValueContainer singleValueContainer() const;

private:
    const BencodeValue* value;
    BencodeCodingPath path;
};

class BencodeKeyedContainer {
public:
    BencodeKeyedContainer(const BencodeValue::Dictionary& dictionary, BencodeCodingPath path)
        : dictionary(&dictionary), path(std::move(path)) {}

    const BencodeCodingPath& codingPath() const { return path; }
    std::vector<std::string> allKeys() const;
    bool contains(const std::string& key) const;

    // Throws ValueNotFound when the key is absent
    template <typename T>
    T decode(const std::string& key) const;

    // Empty when the key is absent; a present value must still decode as T.
    template <typename T>
    std::optional<T> decodeIfPresent(const std::string& key) const;

    // There is no null in bencode
    bool decodeNil(const std::string& key) const;

    BencodeKeyedContainer nestedContainer(const std::string& key) const;
    BencodeUnkeyedContainer nestedUnkeyedContainer(const std::string& key) const;
    BencodeDecoderHandle superDecoder(const std::string& key) const;
    BencodeDecoderHandle superDecoder() const;

private:
    BencodeDecoderHandle with(const std::string& key) const;

    const BencodeValue::Dictionary* dictionary;
    BencodeCodingPath path;
};

class BencodeUnkeyedContainer {
public:
    BencodeUnkeyedContainer(const BencodeValue::List& list, BencodeCodingPath path)
        : list(&list), path(std::move(path)) {}

    const BencodeCodingPath& codingPath() const { return path; }
    size_t count() const { return list->size(); }
    size_t currentIndex() const { return index; }
    bool isAtEnd() const { return index == list->size(); }

    // Decodes the element at currentIndex() and moves past it. Throws
    // ValueNotFound once the list is exhausted.
    template <typename T>
    T decode();

    bool decodeNil() const { return false; }

    BencodeKeyedContainer nestedContainer();
    BencodeUnkeyedContainer nestedUnkeyedContainer();
    BencodeDecoderHandle superDecoder();

private:
    BencodeDecoderHandle next();

    const BencodeValue::List* list;
    BencodeCodingPath path;
    size_t index = 0;
};

class BencodeSingleValueContainer {
public:
    BencodeSingleValueContainer(const BencodeValue& value, BencodeCodingPath path)
        : value(&value), path(std::move(path)) {}

    const BencodeCodingPath& codingPath() const { return path; }

    template <typename T>
    T decode() const;

    bool decodeNil() const { return false; }

    // Shapes the built-in BencodeDecodable specializations are made of
    BencodeValue::ByteString decodeBytes() const;
    std::string decodeString() const;
    Url decodeUrl() const;
    const BencodeInteger& decodeInteger() const;
    bool decodeBool() const;

    // Integer narrowed to T, NumberOutOfRange if it does not fit
    template <typename T>
    T decodeNumber() const;

private:
    template <typename T>
    static std::string numberTypeName();

    const BencodeValue* value;
    BencodeCodingPath path;
};

template <typename T>
T BencodeKeyedContainer::decode(const std::string& key) const {
    return with(key).singleValueContainer().decode<T>();
}

template <typename T>
std::optional<T> BencodeKeyedContainer::decodeIfPresent(const std::string& key) const {
    if (!contains(key)) {
        return std::nullopt;
    }
    return decode<T>(key);
}

template <typename T>
T BencodeUnkeyedContainer::decode() {
    return next().singleValueContainer().decode<T>();
}

template <typename T>
T BencodeSingleValueContainer::decode() const {
    return BencodeDecodable<T>::decode(BencodeDecoderHandle(*value, path));
}

template <typename T>
std::string BencodeSingleValueContainer::numberTypeName() {
    if (std::is_floating_point<T>::value) {
        return sizeof(T) == sizeof(float) ? "float" : "double";
    }
    return std::string(std::is_signed<T>::value ? "int" : "uint") + std::to_string(sizeof(T) * 8) + "_t";
}

template <typename T>
T BencodeSingleValueContainer::decodeNumber() const {
    const BencodeInteger& integer = decodeInteger();

    if constexpr (std::is_floating_point<T>::value) {
        double d = integer.toDouble();
        if (std::isinf(d) || std::fabs(d) > static_cast<double>(std::numeric_limits<T>::max())) {
            throw BencodeDecodingError::numberOutOfRange(path, numberTypeName<T>());
        }
        return static_cast<T>(d);
    } else if constexpr (std::is_signed<T>::value) {
        int64_t v;
        if (!integer.toInt64(v) || v < static_cast<int64_t>(std::numeric_limits<T>::min()) ||
            v > static_cast<int64_t>(std::numeric_limits<T>::max())) {
            throw BencodeDecodingError::numberOutOfRange(path, numberTypeName<T>());
        }
        return static_cast<T>(v);
    } else {
        uint64_t v;
        if (!integer.toUint64(v) || v > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
            throw BencodeDecodingError::numberOutOfRange(path, numberTypeName<T>());
        }
        return static_cast<T>(v);
    }
}
