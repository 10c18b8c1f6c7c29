#pragma once

#include "../commands/Command.hpp"
#include "../commands/CommandOptions.hpp"
#include <map>
#include <memory>

class CommandManager {
public:
    void registerCommand(const std::string& name, std::unique_ptr<Command> command);

    // Returns false if the command is unknown or failed; the reason goes to std::cerr
    bool executeCommand(const std::string& name, const CommandOptions& options);

private:
    std::map<std::string, std::unique_ptr<Command>> commands;
};
