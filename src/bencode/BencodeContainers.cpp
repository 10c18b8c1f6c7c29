#include "BencodeContainers.hpp"
#include "../utils/Utf8Utils.hpp"

BencodeKeyedContainer BencodeDecoderHandle::container() const {
    if (!value->isDictionary()) {
        throw BencodeDecodingError::dataCorrupted(path, "Expected dictionary");
    }
    return BencodeKeyedContainer(value->asDictionary(), path);
}

BencodeUnkeyedContainer BencodeDecoderHandle::unkeyedContainer() const {
    if (!value->isList()) {
        throw BencodeDecodingError::dataCorrupted(path, "Expected list");
    }
    return BencodeUnkeyedContainer(value->asList(), path);
}

BencodeSingleValueContainer BencodeDecoderHandle::singleValueContainer() const {
    return BencodeSingleValueContainer(*value, path);
}

std::vector<std::string> BencodeKeyedContainer::allKeys() const {
    std::vector<std::string> keys;
    keys.reserve(dictionary->size());
    for (const auto& entry : *dictionary) {
        keys.push_back(entry.first);
    }
    return keys;
}

bool BencodeKeyedContainer::contains(const std::string& key) const {
    return dictionary->find(key) != dictionary->end();
}

bool BencodeKeyedContainer::decodeNil(const std::string& key) const {
    return with(key).singleValueContainer().decodeNil();
}

BencodeKeyedContainer BencodeKeyedContainer::nestedContainer(const std::string& key) const {
    return with(key).container();
}

BencodeUnkeyedContainer BencodeKeyedContainer::nestedUnkeyedContainer(const std::string& key) const {
    return with(key).unkeyedContainer();
}

BencodeDecoderHandle BencodeKeyedContainer::superDecoder(const std::string& key) const {
    return with(key);
}

BencodeDecoderHandle BencodeKeyedContainer::superDecoder() const {
    return with("super");
}

BencodeDecoderHandle BencodeKeyedContainer::with(const std::string& key) const {
    BencodeCodingPath keyPath = path.appendingKey(key);

    auto it = dictionary->find(key);
    if (it == dictionary->end()) {
        throw BencodeDecodingError::valueNotFound(keyPath, "Value not found for key \"" + key + "\"");
    }
    return BencodeDecoderHandle(it->second, keyPath);
}

BencodeKeyedContainer BencodeUnkeyedContainer::nestedContainer() {
    return next().container();
}

BencodeUnkeyedContainer BencodeUnkeyedContainer::nestedUnkeyedContainer() {
    return next().unkeyedContainer();
}

BencodeDecoderHandle BencodeUnkeyedContainer::superDecoder() {
    return next();
}

BencodeDecoderHandle BencodeUnkeyedContainer::next() {
    BencodeCodingPath indexPath = path.appendingIndex(index);

    if (isAtEnd()) {
        throw BencodeDecodingError::valueNotFound(indexPath, "Unkeyed container is at end");
    }

    const BencodeValue& element = (*list)[index];
    index++;
    return BencodeDecoderHandle(element, indexPath);
}

BencodeValue::ByteString BencodeSingleValueContainer::decodeBytes() const {
    if (!value->isByteString()) {
        throw BencodeDecodingError::typeMismatch(path, "byte string", BencodeValue::typeName(value->type()));
    }
    return value->asByteString();
}

std::string BencodeSingleValueContainer::decodeString() const {
    if (!value->isByteString()) {
        throw BencodeDecodingError::typeMismatch(path, "byte string", BencodeValue::typeName(value->type()));
    }

    const BencodeValue::ByteString& bytes = value->asByteString();
    if (!Utf8Utils::isValid(bytes)) {
        throw BencodeDecodingError::dataCorrupted(path, "Unable to convert data to a string");
    }
    return Utf8Utils::toString(bytes);
}

Url BencodeSingleValueContainer::decodeUrl() const {
    std::string text = decodeString();

    std::optional<Url> url = Url::parse(text);
    if (!url) {
        throw BencodeDecodingError::dataCorrupted(path, "Invalid URL: " + text);
    }
    return *url;
}

const BencodeInteger& BencodeSingleValueContainer::decodeInteger() const {
    if (!value->isInteger()) {
        throw BencodeDecodingError::typeMismatch(path, "integer", BencodeValue::typeName(value->type()));
    }
    return value->asInteger();
}

bool BencodeSingleValueContainer::decodeBool() const {
    const BencodeInteger& integer = decodeInteger();
    if (integer.isZero()) {
        return false;
    }
    if (integer == BencodeInteger(1)) {
        return true;
    }
    throw BencodeDecodingError::numberOutOfRange(path, "bool");
}
