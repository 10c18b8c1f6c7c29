#include "InfoCommand.hpp"
#include "../utils/FileUtils.hpp"
#include <iostream>
#include <stdexcept>

void InfoCommand::execute(const CommandOptions& options) {
    try {
        if (options.args.size() != 1) {
            throw std::runtime_error("Expected: <torrent_file>");
        }

        std::string torrentContent = FileUtils::readBinaryFile(options.args[0]);
        Metainfo metainfo = Bencode::decode<Metainfo>(torrentContent, options.toBencodeOptions());

        displayTorrentInfo(metainfo);
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to process torrent file: " + std::string(e.what()));
    }
}

void InfoCommand::displayTorrentInfo(const Metainfo& metainfo) {
    std::cout << "Tracker URL: " << metainfo.announce.toString() << std::endl;
    if (metainfo.announceList) {
        for (const auto& tier : *metainfo.announceList) {
            for (const auto& tracker : tier) {
                std::cout << "  Tracker: " << tracker << std::endl;
            }
        }
    }

    const MetainfoInfo& info = metainfo.info;
    std::cout << "Name: " << info.name << std::endl;
    std::cout << "Length: " << info.totalLength() << std::endl;
    if (info.files) {
        std::cout << "Files:" << std::endl;
        for (const auto& file : *info.files) {
            std::cout << "  " << file.joinedPath() << " (" << file.length << ")" << std::endl;
        }
    }

    if (metainfo.comment) {
        std::cout << "Comment: " << *metainfo.comment << std::endl;
    }
    if (metainfo.createdBy) {
        std::cout << "Created By: " << *metainfo.createdBy << std::endl;
    }
    if (metainfo.creationDate) {
        std::cout << "Creation Date: " << *metainfo.creationDate << std::endl;
    }

    std::cout << "Piece Length: " << info.pieceLength << std::endl;
    std::cout << "Piece Hashes:" << std::endl;
    for (const auto& hash : info.pieceHashesHex()) {
        std::cout << hash << std::endl;
    }
}
