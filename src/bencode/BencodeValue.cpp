#include "BencodeValue.hpp"
#include "../utils/Utf8Utils.hpp"
#include <sstream>
#include <iomanip>

BencodeValue BencodeValue::fromString(const std::string& text) {
    return BencodeValue(ByteString(text.begin(), text.end()));
}

const char* BencodeValue::typeName(Type type) {
    switch (type) {
        case Type::Dictionary: return "dictionary";
        case Type::List: return "list";
        case Type::Integer: return "integer";
        case Type::ByteString: return "byte string";
    }
    return "unknown";
}

nlohmann::json BencodeValue::toJson() const {
    switch (type()) {
        case Type::Dictionary: {
            nlohmann::json object = nlohmann::json::object();
            for (const auto& [key, child] : asDictionary()) {
                object[key] = child.toJson();
            }
            return object;
        }
        case Type::List: {
            nlohmann::json array = nlohmann::json::array();
            for (const auto& child : asList()) {
                array.push_back(child.toJson());
            }
            return array;
        }
        case Type::Integer: {
            const Integer& integer = asInteger();
            int64_t signedValue;
            if (integer.toInt64(signedValue)) {
                return nlohmann::json(signedValue);
            }
            uint64_t unsignedValue;
            if (integer.toUint64(unsignedValue)) {
                return nlohmann::json(unsignedValue);
            }
            return nlohmann::json(integer.toString());
        }
        case Type::ByteString: {
            const ByteString& bytes = asByteString();
            if (Utf8Utils::isValid(bytes)) {
                return nlohmann::json(Utf8Utils::toString(bytes));
            }
            std::stringstream ss;
            for (uint8_t b : bytes) {
                ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
            }
            return nlohmann::json{{"bytes", ss.str()}};
        }
    }
    return nullptr;
}
