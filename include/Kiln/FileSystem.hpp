// include/Kiln/FileSystem.hpp
#ifndef KILN_FILE_SYSTEM_HPP
#define KILN_FILE_SYSTEM_HPP

#include <filesystem>
#include <string>

namespace Kiln {

    // The file reads the launch pipeline needs. Tests swap in an in-memory tree.
    class FileSystem {
    public:
        virtual ~FileSystem() = default;

        virtual bool exists(const std::filesystem::path& path) const = 0;
        // Throws std::runtime_error if the file cannot be read
        virtual std::string readText(const std::filesystem::path& path) const = 0;
    };

    class LocalFileSystem : public FileSystem {
    public:
        bool exists(const std::filesystem::path& path) const override;
        std::string readText(const std::filesystem::path& path) const override;
    };

} // namespace Kiln

#endif //KILN_FILE_SYSTEM_HPP
