#include "BencodeBytes.hpp"
#include "BencodeError.hpp"

uint8_t BencodeBytes::peek() const {
    if (isAtEnd()) {
        throw BencodeParseError(BencodeParseError::Kind::UnexpectedEndOfFile, index);
    }
    return static_cast<uint8_t>(data[index]);
}

uint8_t BencodeBytes::pop() {
    uint8_t byte = peek();
    index++;
    return byte;
}

std::vector<uint8_t> BencodeBytes::popBytes(size_t count) {
    if (count > remaining()) {
        throw BencodeParseError(BencodeParseError::Kind::UnexpectedEndOfFile, data.size());
    }

    std::vector<uint8_t> bytes(data.begin() + index, data.begin() + index + count);
    index += count;
    return bytes;
}
