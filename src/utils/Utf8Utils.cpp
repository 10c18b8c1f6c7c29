#include "Utf8Utils.hpp"

bool Utf8Utils::isValid(const uint8_t* data, size_t len) {
    size_t i = 0;
    while (i < len) {
        uint8_t lead = data[i];
        if ((lead & 0x80) == 0) {
            i++;
            continue;
        }

        size_t needed;
        uint32_t minCodepoint;
        uint32_t codepoint;
        if ((lead & 0xE0) == 0xC0) {
            needed = 1;
            minCodepoint = 0x80;
            codepoint = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            needed = 2;
            minCodepoint = 0x800;
            codepoint = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            needed = 3;
            minCodepoint = 0x10000;
            codepoint = lead & 0x07;
        } else {
            return false;
        }

        if (i + needed >= len) {
            return false;
        }

        for (size_t j = 1; j <= needed; j++) {
            uint8_t c = data[i + j];
            if ((c & 0xC0) != 0x80) {
                return false;
            }
            codepoint = (codepoint << 6) | (c & 0x3F);
        }

        if (codepoint < minCodepoint || codepoint > 0x10FFFF ||
            (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
            return false;
        }
        i += needed + 1;
    }
    return true;
}

bool Utf8Utils::isValid(const std::vector<uint8_t>& bytes) {
    return isValid(bytes.data(), bytes.size());
}

std::string Utf8Utils::toString(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}
