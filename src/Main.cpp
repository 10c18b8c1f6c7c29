#include "commands/DecodeCommand.hpp"
#include "commands/InfoCommand.hpp"
#include "manager/CommandManager.hpp"
#include <iostream>
#include <stdexcept>

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <command> [options] <args>" << std::endl;
        std::cerr << "Commands:" << std::endl;
        std::cerr << "  decode [--max-depth <n>] [--strict] (<bencoded_value> | -f <file>)" << std::endl;
        std::cerr << "  info [--max-depth <n>] [--strict] <torrent_file>" << std::endl;
        std::cerr << "decode prints JSON. A byte string that is not UTF-8 prints as {\"bytes\": \"<hex>\"}," << std::endl;
        std::cerr << "which is also how a dictionary with a single \"bytes\" key prints." << std::endl;
        return 1;
    }

    std::string command = argv[1];
    CommandOptions options;
    try {
        options = CommandOptions::parse(argc, argv, 2);
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    CommandManager manager;
    manager.registerCommand("decode", std::make_unique<DecodeCommand>());
    manager.registerCommand("info", std::make_unique<InfoCommand>());

    return manager.executeCommand(command, options) ? 0 : 1;
}
