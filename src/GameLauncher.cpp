// src/GameLauncher.cpp
#include <Kiln/GameLauncher.hpp>
#include <Kiln/ArgumentComposer.hpp>
#include <Kiln/ClasspathBuilder.hpp>
#include <Kiln/Config.hpp>
#include <Kiln/ManifestReader.hpp>
#include <Kiln/Utils/Logger.hpp>

namespace Kiln {

GameLauncher::GameLauncher(const FileSystem& fs, ProcessSpawner& spawner, PlatformInfo platform)
    : m_fs(fs), m_spawner(spawner), m_platform(std::move(platform)) {
    m_logger = Utils::Logger::GetOrCreateLogger("GameLauncher");
}

LaunchPlan GameLauncher::prepare(const std::filesystem::path& mcRoot, const std::string& versionName,
                                 const std::string& playerName, const LaunchOptions& options) const {
    GameDirectory gameDir(mcRoot);
    m_logger->info("Preparing {} for {} from {} ({}/{})", versionName, playerName, gameDir.root.string(),
                   m_platform.osName, m_platform.osArch);

    const Version version = readManifest(m_fs, gameDir.manifestPath(versionName));
    m_logger->info("Manifest {} ({}): main class {}, {} libraries", version.id,
                   version.type.empty() ? "unknown type" : version.type, version.mainClass, version.libraries.size());

    ClasspathBuilder classpathBuilder(m_fs, gameDir);
    ClasspathResult classpath = classpathBuilder.build(version, m_platform);
    if (!classpath.skipped.empty()) {
        m_logger->warn("{} libraries could not be resolved and were left off the classpath", classpath.skipped.size());
    }

    RuntimeContext context = RuntimeContext::forLaunch(gameDir, versionName, playerName, version);
    std::string gameArgs = composeGameArguments(version, context);

    return assembleLaunchPlan(gameDir, versionName, version.mainClass,
                              classpath.join(Utils::pathListSeparator(m_platform.osName)),
                              gameArgs, options);
}

ProcessHandle GameLauncher::launch(const std::filesystem::path& mcRoot, const std::string& versionName,
                                   const std::string& playerName, const LaunchOptions& options) {
    const LaunchPlan plan = prepare(mcRoot, versionName, playerName, options);
    m_logger->info("Launching Minecraft with command: {}", plan.commandLine());

    ProcessHandle handle = m_spawner.spawnDetached(plan);
    m_logger->info("Minecraft launched with PID: {}", handle.pid);
    return handle;
}

} // namespace Kiln
