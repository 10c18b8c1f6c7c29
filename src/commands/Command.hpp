#pragma once

#include <string>
#include <vector>
#include "CommandOptions.hpp"

class Command {
public:
    virtual ~Command() = default;

    // Throws on failure; the CommandManager reports the error.
    virtual void execute(const CommandOptions& options) = 0;
};
