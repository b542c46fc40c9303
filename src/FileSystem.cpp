// src/FileSystem.cpp
#include <Kiln/FileSystem.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace Kiln {

bool LocalFileSystem::exists(const std::filesystem::path& path) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

std::string LocalFileSystem::readText(const std::filesystem::path& path) const {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("could not open " + path.string());
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("I/O error while reading " + path.string());
    }
    return contents.str();
}

} // namespace Kiln
