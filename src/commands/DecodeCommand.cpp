#include "DecodeCommand.hpp"
#include "../bencode/Bencode.hpp"
#include "../utils/FileUtils.hpp"
#include <iostream>
#include <stdexcept>

void DecodeCommand::execute(const CommandOptions& options) {
    try {
        std::string encoded_value;
        if (options.hasOption("-f")) {
            encoded_value = FileUtils::readBinaryFile(options.options.at("-f"));
        } else if (!options.args.empty()) {
            encoded_value = options.args[0];
        } else {
            throw std::runtime_error("No input provided for decode");
        }

        BencodeValue decoded_value = Bencode::parse(encoded_value, options.toBencodeOptions());
        std::cout << decoded_value.toJson().dump() << std::endl;
    } catch (const std::exception& e) {
        throw std::runtime_error("Decode failed: " + std::string(e.what()));
    }
}
