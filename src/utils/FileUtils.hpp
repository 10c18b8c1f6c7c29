#pragma once
#include <string>

class FileUtils {
public:
    // Whole file as raw bytes; throws std::runtime_error if it cannot be read
    static std::string readBinaryFile(const std::string& filepath);
};
