// include/Kiln/Config.hpp
#ifndef KILN_CONFIG_HPP
#define KILN_CONFIG_HPP

#include <Kiln/FileSystem.hpp>
#include <Kiln/Types/LaunchOptions.hpp>
#include <filesystem>
#include <string>

namespace Kiln {

    // Layout of an installed game directory. Read-only: nothing here creates directories.
    struct GameDirectory {
        std::filesystem::path root;
        std::filesystem::path versionsDir;
        std::filesystem::path librariesDir;
        std::filesystem::path assetsDir;

        explicit GameDirectory(const std::filesystem::path& base = ".minecraft")
            : root(base),
              versionsDir(base / "versions"),
              librariesDir(base / "libraries"),
              assetsDir(base / "assets") {}

        std::filesystem::path versionDir(const std::string& versionName) const {
            return versionsDir / versionName;
        }
        std::filesystem::path manifestPath(const std::string& versionName) const {
            return versionDir(versionName) / (versionName + ".json");
        }
        std::filesystem::path clientJarPath(const std::string& versionName) const {
            return versionDir(versionName) / (versionName + ".jar");
        }
        std::filesystem::path log4jConfigPath(const std::string& versionName) const {
            return versionDir(versionName) / "log4j2.xml";
        }
        std::filesystem::path nativesDir(const std::string& versionName) const {
            return versionDir(versionName) / "natives-windows-x86_64";
        }
    };

    // Heap sizes must be at least 1 MB and fit the unsigned int LaunchOptions carries
    bool memoryMbInRange(unsigned long long mb);

    // User-level defaults, optionally read from a JSON file
    struct LauncherSettings {
        std::filesystem::path gameDirectory = ".minecraft";
        std::string playerName = "Player123";
        std::string javaPath = "java";
        std::optional<unsigned int> memoryMb = 4096;
        bool useSystemMemory = false;
        std::filesystem::path logDirectory = "logs";
        std::string logLevel = "info";

        LaunchOptions toLaunchOptions() const;

        // A missing file yields the defaults. Throws SettingsError if the file
        // exists but is not valid JSON or has a key of the wrong type.
        static LauncherSettings load(const FileSystem& fs, const std::filesystem::path& settingsPath);
    };

} // namespace Kiln

#endif //KILN_CONFIG_HPP
