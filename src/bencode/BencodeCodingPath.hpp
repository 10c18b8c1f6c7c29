#pragma once
#include <string>
#include <vector>
#include <variant>
#include <utility>
#include <cstddef>

// One step from a container to one of its children: a dictionary key or a
// list index.
class BencodeCodingKey {
public:
    static BencodeCodingKey dictionaryKey(const std::string& key);
    static BencodeCodingKey listIndex(size_t index);

    bool isListIndex() const { return std::holds_alternative<size_t>(frame); }
    std::string stringValue() const;
    size_t intValue() const { return std::get<size_t>(frame); }

    bool operator==(const BencodeCodingKey& other) const { return frame == other.frame; }
    bool operator!=(const BencodeCodingKey& other) const { return !(*this == other); }

private:
    explicit BencodeCodingKey(std::variant<std::string, size_t> frame) : frame(std::move(frame)) {}

    std::variant<std::string, size_t> frame;
};

// Route from the root value to the value being decoded. A path is never
// modified once built; appending returns a new path.
class BencodeCodingPath {
public:
    BencodeCodingPath() = default;

    BencodeCodingPath appending(const BencodeCodingKey& key) const;
    BencodeCodingPath appendingKey(const std::string& key) const;
    BencodeCodingPath appendingIndex(size_t index) const;

    const std::vector<BencodeCodingKey>& keys() const { return frames; }
    bool empty() const { return frames.empty(); }
    size_t size() const { return frames.size(); }

    // e.g. "info.files[2].path[0]", or "<root>" for the empty path
    std::string toString() const;

    bool operator==(const BencodeCodingPath& other) const { return frames == other.frames; }

private:
    std::vector<BencodeCodingKey> frames;
};
