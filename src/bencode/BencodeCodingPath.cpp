#include "BencodeCodingPath.hpp"

BencodeCodingKey BencodeCodingKey::dictionaryKey(const std::string& key) {
    return BencodeCodingKey(std::variant<std::string, size_t>(std::in_place_index<0>, key));
}

BencodeCodingKey BencodeCodingKey::listIndex(size_t index) {
    return BencodeCodingKey(std::variant<std::string, size_t>(std::in_place_index<1>, index));
}

std::string BencodeCodingKey::stringValue() const {
    if (isListIndex()) {
        return std::to_string(std::get<size_t>(frame));
    }
    return std::get<std::string>(frame);
}

BencodeCodingPath BencodeCodingPath::appending(const BencodeCodingKey& key) const {
    BencodeCodingPath extended = *this;
    extended.frames.push_back(key);
    return extended;
}

BencodeCodingPath BencodeCodingPath::appendingKey(const std::string& key) const {
    return appending(BencodeCodingKey::dictionaryKey(key));
}

BencodeCodingPath BencodeCodingPath::appendingIndex(size_t index) const {
    return appending(BencodeCodingKey::listIndex(index));
}

std::string BencodeCodingPath::toString() const {
    if (frames.empty()) {
        return "<root>";
    }

    std::string result;
    for (const auto& key : frames) {
        if (key.isListIndex()) {
            result += "[" + key.stringValue() + "]";
        } else {
            if (!result.empty()) {
                result += ".";
            }
            result += key.stringValue();
        }
    }
    return result;
}
