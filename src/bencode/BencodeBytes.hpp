#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <utility>

// Forward-only cursor over the input buffer. Owns the bytes for the lifetime
// of one parse.
class BencodeBytes {
public:
    explicit BencodeBytes(std::string data) : data(std::move(data)) {}

    // Both throw UnexpectedEndOfFile when nothing is left
    uint8_t peek() const;
    uint8_t pop();

    // Consumes exactly count bytes, or nothing at all if fewer remain.
    std::vector<uint8_t> popBytes(size_t count);

    size_t currentIndex() const { return index; }
    size_t remaining() const { return data.size() - index; }
    bool isAtEnd() const { return index == data.size(); }

private:
    std::string data;
    size_t index = 0;
};
