#include "CommandManager.hpp"
#include <iostream>

void CommandManager::registerCommand(const std::string& name, std::unique_ptr<Command> command) {
    commands[name] = std::move(command);
}

bool CommandManager::executeCommand(const std::string& name, const CommandOptions& options) {
    auto it = commands.find(name);
    if (it == commands.end()) {
        std::cerr << "Unknown command: " << name << std::endl;
        return false;
    }

    try {
        it->second->execute(options);
    } catch (const std::exception& e) {
        std::cerr << "Error executing command: " << e.what() << std::endl;
        return false;
    }
    return true;
}
