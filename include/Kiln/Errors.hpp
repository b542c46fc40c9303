// include/Kiln/Errors.hpp
#ifndef KILN_ERRORS_HPP
#define KILN_ERRORS_HPP

#include <filesystem>
#include <stdexcept>
#include <string>

namespace Kiln {

    // The version manifest is missing, unreadable or not a usable manifest.
    class ManifestReadError : public std::runtime_error {
    public:
        ManifestReadError(const std::filesystem::path& manifestPath, const std::string& reason)
            : std::runtime_error("Cannot read version manifest " + manifestPath.string() + ": " + reason),
              m_manifestPath(manifestPath) {}

        const std::filesystem::path& manifestPath() const { return m_manifestPath; }

    private:
        std::filesystem::path m_manifestPath;
    };

    // The game process could not be started. Thrown after the command line was composed.
    class SpawnError : public std::runtime_error {
    public:
        SpawnError(const std::string& executable, const std::string& reason)
            : std::runtime_error("Cannot start '" + executable + "': " + reason),
              m_executable(executable) {}

        const std::string& executable() const { return m_executable; }

    private:
        std::string m_executable;
    };

    class SettingsError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

} // namespace Kiln

#endif //KILN_ERRORS_HPP
