#include "CommandOptions.hpp"
#include <stdexcept>

namespace {
const std::set<std::string> knownFlags = {"--strict"};
}

CommandOptions CommandOptions::parse(int argc, char* argv[], int first) {
    CommandOptions options;

    for (int i = first; i < argc; i++) {
        std::string arg = argv[i];
        if (knownFlags.count(arg)) {
            options.flags.insert(arg);
        } else if (arg.size() > 1 && arg[0] == '-') {  // This is an option
            if (i + 1 >= argc) {
                throw std::runtime_error("Missing value for option " + arg);
            }
            options.options[arg] = argv[i + 1];
            i++;  // Skip the next argument since it's the option value
        } else {
            options.args.push_back(arg);
        }
    }

    return options;
}

BencodeOptions CommandOptions::toBencodeOptions() const {
    BencodeOptions bencodeOptions;

    auto it = options.find("--max-depth");
    if (it != options.end()) {
        try {
            size_t consumed = 0;
            unsigned long depth = std::stoul(it->second, &consumed);
            if (consumed != it->second.size() || depth == 0) {
                throw std::invalid_argument(it->second);
            }
            bencodeOptions.maxDepth = depth;
        } catch (const std::logic_error&) {
            throw std::runtime_error("Invalid value for --max-depth: " + it->second);
        }
    }

    if (hasFlag("--strict")) {
        bencodeOptions.rejectNegativeZero = true;
        bencodeOptions.rejectDuplicateKeys = true;
    }
    return bencodeOptions;
}
