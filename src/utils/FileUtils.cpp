#include "FileUtils.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

std::string FileUtils::readBinaryFile(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("Cannot read file: " + filepath);
    }
    return buffer.str();
}
