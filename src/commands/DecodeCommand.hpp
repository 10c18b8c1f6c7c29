#pragma once

#include "Command.hpp"

// Prints a bencoded value as JSON. Input comes from the first argument or,
// with -f <file>, from a file. Byte strings that are not UTF-8 print as
// {"bytes": "<hex>"}, the same text as a dictionary holding one "bytes" key.
class DecodeCommand : public Command {
public:
    void execute(const CommandOptions& options) override;
};
