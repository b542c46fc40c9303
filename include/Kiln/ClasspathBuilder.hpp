// include/Kiln/ClasspathBuilder.hpp
#ifndef KILN_CLASSPATH_BUILDER_HPP
#define KILN_CLASSPATH_BUILDER_HPP

#include <Kiln/Config.hpp>
#include <Kiln/FileSystem.hpp>
#include <Kiln/Types/Version.hpp>
#include <Kiln/Utils/OS.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <spdlog/logger.h>
#include <string>
#include <vector>

namespace Kiln {

    // A dependency left off the classpath. Never fatal.
    struct DependencyResolutionSkip {
        enum class Reason {
            MALFORMED_COORDINATE,
            ARTIFACT_NOT_FOUND,
        };

        std::string coordinate;
        Reason reason;
    };

    std::string to_string(DependencyResolutionSkip::Reason reason);

    struct ClasspathResult {
        std::vector<std::filesystem::path> entries; // client jar first, then libraries in manifest order
        std::vector<DependencyResolutionSkip> skipped;

        std::string join(char separator) const;
    };

    class ClasspathBuilder {
    public:
        ClasspathBuilder(const FileSystem& fs, const GameDirectory& gameDir);

        ClasspathResult build(const Version& version, const PlatformInfo& platform) const;

        // Path of the jar a library resolves to on this platform, if any exists on disk
        std::optional<std::filesystem::path> resolveLibrary(const Library& library, const PlatformInfo& platform,
                                                            DependencyResolutionSkip::Reason& failure) const;

    private:
        const FileSystem& m_fs;
        const GameDirectory& m_gameDir;
        std::shared_ptr<spdlog::logger> m_logger;
    };

} // namespace Kiln

#endif //KILN_CLASSPATH_BUILDER_HPP
