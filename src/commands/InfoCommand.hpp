#pragma once

#include "Command.hpp"
#include "../metainfo/Metainfo.hpp"

class InfoCommand : public Command {
public:
    void execute(const CommandOptions& options) override;

private:
    void displayTorrentInfo(const Metainfo& metainfo);
};
