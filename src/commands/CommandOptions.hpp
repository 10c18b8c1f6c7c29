#pragma once
#include <string>
#include <map>
#include <set>
#include <vector>
#include "../bencode/BencodeOptions.hpp"

struct CommandOptions {
    std::map<std::string, std::string> options;  // Stores options like -f and their values
    std::set<std::string> flags;                 // Stores value-less switches like --strict
    std::vector<std::string> args;               // Stores regular arguments

    // Parses everything after the command name
    static CommandOptions parse(int argc, char* argv[], int first);

    bool hasOption(const std::string& name) const { return options.count(name) != 0; }
    bool hasFlag(const std::string& name) const { return flags.count(name) != 0; }

    // --max-depth <n> and --strict mapped onto parser settings
    BencodeOptions toBencodeOptions() const;
};
