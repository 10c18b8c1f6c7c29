#pragma once
#include <map>
#include <string>
#include <vector>
#include <variant>
#include <utility>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "BencodeInteger.hpp"

// Generic tree produced by BencodeParser. Built once, read-only afterwards.
class BencodeValue {
public:
    using Dictionary = std::map<std::string, BencodeValue>;
    using List = std::vector<BencodeValue>;
    using Integer = BencodeInteger;
    using ByteString = std::vector<uint8_t>;

    enum class Type { Dictionary, List, Integer, ByteString };

    BencodeValue(Dictionary dictionary) : value(std::move(dictionary)) {}
    BencodeValue(List list) : value(std::move(list)) {}
    BencodeValue(Integer integer) : value(std::move(integer)) {}
    BencodeValue(ByteString bytes) : value(std::move(bytes)) {}

    static BencodeValue fromString(const std::string& text);

    Type type() const { return static_cast<Type>(value.index()); }
    static const char* typeName(Type type);

    bool isDictionary() const { return std::holds_alternative<Dictionary>(value); }
    bool isList() const { return std::holds_alternative<List>(value); }
    bool isInteger() const { return std::holds_alternative<Integer>(value); }
    bool isByteString() const { return std::holds_alternative<ByteString>(value); }

    // Throw std::bad_variant_access on the wrong alternative
    const Dictionary& asDictionary() const { return std::get<Dictionary>(value); }
    const List& asList() const { return std::get<List>(value); }
    const Integer& asInteger() const { return std::get<Integer>(value); }
    const ByteString& asByteString() const { return std::get<ByteString>(value); }

    // Byte strings that are not valid UTF-8 become {"bytes": "<hex>"}, and
    // integers outside the 64-bit range become their decimal text.
    nlohmann::json toJson() const;

    bool operator==(const BencodeValue& other) const { return value == other.value; }
    bool operator!=(const BencodeValue& other) const { return !(*this == other); }

private:
    std::variant<Dictionary, List, Integer, ByteString> value;
};
