#pragma once

#include <string>
#include "BencodeBytes.hpp"
#include "BencodeOptions.hpp"
#include "BencodeValue.hpp"

// Recursive-descent parser for one complete bencoded value. Each instance
// owns its input and parses it exactly once.
class BencodeParser {
public:
    explicit BencodeParser(std::string input, const BencodeOptions& options = BencodeOptions());

    // Parses one value and requires the input to end right after it.
    // Throws BencodeParseError.
    BencodeValue parse();

private:
    BencodeValue parse_value();
    BencodeValue::Dictionary parse_dictionary();
    BencodeValue::List parse_list();
    BencodeInteger parse_integer();
    BencodeValue::ByteString parse_string();
    std::string parse_key();
    size_t parse_length();
    std::string parse_magnitude(uint8_t terminator);

    void enter_container();

    BencodeBytes bytes;
    BencodeOptions options;
    size_t depth = 0;
    bool parsed = false;
};
