#include "Metainfo.hpp"
#include <sstream>
#include <iomanip>

MetainfoFile MetainfoFile::decode(const BencodeDecoderHandle& decoder) {
    BencodeKeyedContainer container = decoder.container();
    return MetainfoFile{
        container.decode<uint64_t>("length"),
        container.decode<std::vector<std::string>>("path"),
    };
}

std::string MetainfoFile::joinedPath() const {
    std::string joined;
    for (const auto& component : path) {
        if (!joined.empty()) {
            joined += "/";
        }
        joined += component;
    }
    return joined;
}

MetainfoInfo MetainfoInfo::decode(const BencodeDecoderHandle& decoder) {
    BencodeKeyedContainer container = decoder.container();
    return MetainfoInfo{
        container.decode<std::string>("name"),
        container.decode<uint64_t>("piece length"),
        container.decode<BencodeValue::ByteString>("pieces"),
        container.decodeIfPresent<uint64_t>("length"),
        container.decodeIfPresent<std::vector<MetainfoFile>>("files"),
        container.decodeIfPresent<bool>("private"),
    };
}

std::vector<std::string> MetainfoInfo::pieceHashesHex() const {
    std::vector<std::string> hashes;
    hashes.reserve(pieceCount());
    for (size_t i = 0; i + PIECE_HASH_SIZE <= pieces.size(); i += PIECE_HASH_SIZE) {
        std::stringstream ss;
        for (size_t j = i; j < i + PIECE_HASH_SIZE; j++) {
            ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(pieces[j]);
        }
        hashes.push_back(ss.str());
    }
    return hashes;
}

uint64_t MetainfoInfo::totalLength() const {
    if (length) {
        return *length;
    }

    uint64_t total = 0;
    if (files) {
        for (const auto& file : *files) {
            total += file.length;
        }
    }
    return total;
}

Metainfo Metainfo::decode(const BencodeDecoderHandle& decoder) {
    BencodeKeyedContainer container = decoder.container();
    return Metainfo{
        container.decode<Url>("announce"),
        container.decode<MetainfoInfo>("info"),
        container.decodeIfPresent<std::vector<std::vector<std::string>>>("announce-list"),
        container.decodeIfPresent<std::string>("comment"),
        container.decodeIfPresent<std::string>("created by"),
        container.decodeIfPresent<int64_t>("creation date"),
    };
}
