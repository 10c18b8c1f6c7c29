#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include "../bencode/Bencode.hpp"
#include "../utils/Url.hpp"

// One entry of a multi-file torrent's "files" list.
struct MetainfoFile {
    uint64_t length;
    std::vector<std::string> path;

    static MetainfoFile decode(const BencodeDecoderHandle& decoder);

    // path components joined with '/'
    std::string joinedPath() const;
};

// The "info" dictionary. Single-file torrents carry `length`, multi-file
// torrents carry `files`; whichever is absent stays empty.
struct MetainfoInfo {
    static constexpr size_t PIECE_HASH_SIZE = 20;

    std::string name;
    uint64_t pieceLength;
    BencodeValue::ByteString pieces;
    std::optional<uint64_t> length;
    std::optional<std::vector<MetainfoFile>> files;
    std::optional<bool> isPrivate;

    static MetainfoInfo decode(const BencodeDecoderHandle& decoder);

    size_t pieceCount() const { return pieces.size() / PIECE_HASH_SIZE; }
    std::vector<std::string> pieceHashesHex() const;
    uint64_t totalLength() const;
};

struct Metainfo {
    Url announce;
    MetainfoInfo info;
    std::optional<std::vector<std::vector<std::string>>> announceList;
    std::optional<std::string> comment;
    std::optional<std::string> createdBy;
    std::optional<int64_t> creationDate;

    static Metainfo decode(const BencodeDecoderHandle& decoder);
};
