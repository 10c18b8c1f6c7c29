#include "BencodeDecoder.hpp"
#include "BencodeParser.hpp"

BencodeValue BencodeDecoder::parse(const std::string& encoded_value) const {
    BencodeParser parser(encoded_value, options);
    return parser.parse();
}
