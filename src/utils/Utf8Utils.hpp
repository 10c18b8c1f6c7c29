#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

class Utf8Utils {
public:
    // Strict check: rejects overlong forms, surrogates and code points past U+10FFFF
    static bool isValid(const uint8_t* data, size_t len);
    static bool isValid(const std::vector<uint8_t>& bytes);

    static std::string toString(const std::vector<uint8_t>& bytes);
};
