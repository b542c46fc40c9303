// include/Kiln/GameLauncher.hpp
#ifndef KILN_GAME_LAUNCHER_HPP
#define KILN_GAME_LAUNCHER_HPP

#include <Kiln/FileSystem.hpp>
#include <Kiln/LaunchPlan.hpp>
#include <Kiln/ProcessSpawner.hpp>
#include <Kiln/Types/LaunchOptions.hpp>
#include <Kiln/Utils/OS.hpp>
#include <filesystem>
#include <memory>
#include <spdlog/logger.h>
#include <string>

namespace Kiln {

    class GameLauncher {
    public:
        GameLauncher(const FileSystem& fs, ProcessSpawner& spawner, PlatformInfo platform = PlatformInfo::current());

        // Reads versions/<versionName>/<versionName>.json under mcRoot and builds the plan.
        // Throws ManifestReadError.
        LaunchPlan prepare(const std::filesystem::path& mcRoot, const std::string& versionName,
                           const std::string& playerName, const LaunchOptions& options) const;

        // prepare() then start the game detached. Throws ManifestReadError or SpawnError.
        ProcessHandle launch(const std::filesystem::path& mcRoot, const std::string& versionName,
                             const std::string& playerName, const LaunchOptions& options);

        const PlatformInfo& platform() const { return m_platform; }

    private:
        const FileSystem& m_fs;
        ProcessSpawner& m_spawner;
        PlatformInfo m_platform;
        std::shared_ptr<spdlog::logger> m_logger;
    };

} // namespace Kiln

#endif //KILN_GAME_LAUNCHER_HPP
