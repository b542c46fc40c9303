// src/main.cpp
#include <Kiln/Config.hpp>
#include <Kiln/Errors.hpp>
#include <Kiln/FileSystem.hpp>
#include <Kiln/GameLauncher.hpp>
#include <Kiln/LauncherInfo.hpp>
#include <Kiln/ProcessSpawner.hpp>
#include <Kiln/Utils/Logger.hpp>
#include <spdlog/spdlog.h> // For spdlog::shutdown()

#include <cctype>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace {

struct CommandLine {
    std::filesystem::path configPath = "kiln.json";
    std::optional<std::string> versionName;
    std::optional<std::string> gameDirectory;
    std::optional<std::string> playerName;
    std::optional<std::string> javaPath;
    std::optional<unsigned int> memoryMb;
    bool useSystemMemory = false;
    bool dryRun = false;
    bool verbose = false;
    bool help = false;
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] <version>\n"
              << "\n"
              << "Options:\n"
              << "  --dir <path>        game directory (default .minecraft)\n"
              << "  --player <name>     player name\n"
              << "  --java <path>       java executable (default: java on PATH)\n"
              << "  --memory <MB>       heap size for -Xms/-Xmx\n"
              << "  --system-memory     let the JVM pick the heap size\n"
              << "  --config <file>     settings file (default kiln.json)\n"
              << "  --dry-run           print the command line instead of launching\n"
              << "  --verbose           log at trace level\n"
              << "  --help              show this help\n";
}

// Returns an error message, or nothing when parsing succeeded
std::optional<std::string> parse_command_line(int argc, char* argv[], CommandLine& cmd) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next_value = [&](std::string& out) -> bool {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--help" || arg == "-h") {
            cmd.help = true;
        } else if (arg == "--dry-run") {
            cmd.dryRun = true;
        } else if (arg == "--verbose" || arg == "-v") {
            cmd.verbose = true;
        } else if (arg == "--system-memory") {
            cmd.useSystemMemory = true;
        } else if (arg == "--dir" || arg == "--player" || arg == "--java" || arg == "--config" || arg == "--memory") {
            if (!next_value(value)) return "Missing value for " + arg;
            if (arg == "--dir") cmd.gameDirectory = value;
            else if (arg == "--player") cmd.playerName = value;
            else if (arg == "--java") cmd.javaPath = value;
            else if (arg == "--config") cmd.configPath = value;
            else {
                try {
                    // stoull would accept a sign and wrap it
                    if (value.empty() || !std::isdigit(static_cast<unsigned char>(value[0]))) {
                        throw std::invalid_argument(value);
                    }
                    std::size_t consumed = 0;
                    unsigned long long mb = std::stoull(value, &consumed);
                    if (consumed != value.size() || !Kiln::memoryMbInRange(mb)) throw std::invalid_argument(value);
                    cmd.memoryMb = static_cast<unsigned int>(mb);
                } catch (const std::logic_error&) {
                    return "Invalid --memory value: " + value;
                }
            }
        } else if (!arg.empty() && arg[0] == '-') {
            return "Unknown option: " + arg;
        } else if (!cmd.versionName) {
            cmd.versionName = arg;
        } else {
            return "Unexpected argument: " + arg;
        }
    }
    return std::nullopt;
}

} // namespace

int main(int argc, char* argv[]) {
    CommandLine cmd;
    if (auto error = parse_command_line(argc, argv, cmd)) {
        std::cerr << *error << "\n\n";
        print_usage(argv[0]);
        return 2;
    }
    if (cmd.help) {
        print_usage(argv[0]);
        return 0;
    }
    if (!cmd.versionName) {
        std::cerr << "No version given.\n\n";
        print_usage(argv[0]);
        return 2;
    }

    Kiln::LocalFileSystem fileSystem;
    Kiln::LauncherSettings settings;
    try {
        settings = Kiln::LauncherSettings::load(fileSystem, cmd.configPath);
    } catch (const Kiln::SettingsError& e) {
        KILN_LOG_CRITICAL("{}", e.what());
        spdlog::shutdown();
        return 1;
    }

    if (cmd.gameDirectory) settings.gameDirectory = *cmd.gameDirectory;
    if (cmd.playerName) settings.playerName = *cmd.playerName;
    if (cmd.javaPath) settings.javaPath = *cmd.javaPath;
    if (cmd.memoryMb) settings.memoryMb = cmd.memoryMb;
    if (cmd.useSystemMemory) settings.useSystemMemory = true;

    auto consoleLevel = Kiln::Utils::Logger::ParseLevel(settings.logLevel).value_or(spdlog::level::info);
    if (cmd.verbose) consoleLevel = spdlog::level::trace;
    Kiln::Utils::Logger::Init(settings.logDirectory, "kiln.log", consoleLevel, spdlog::level::trace);
    if (!Kiln::Utils::Logger::ParseLevel(settings.logLevel)) {
        KILN_LOG_WARN("Unknown log level '{}' in settings, using info.", settings.logLevel);
    }

    KILN_LOG_INFO("{} launcher v{} starting...", Kiln::LAUNCHER_NAME, Kiln::LAUNCHER_VERSION);
    KILN_LOG_INFO("Game directory: {}", settings.gameDirectory.string());

    Kiln::NativeProcessSpawner spawner;
    Kiln::GameLauncher launcher(fileSystem, spawner);
    const Kiln::LaunchOptions options = settings.toLaunchOptions();

    try {
        if (cmd.dryRun) {
            Kiln::LaunchPlan plan = launcher.prepare(settings.gameDirectory, *cmd.versionName, settings.playerName, options);
            std::cout << plan.commandLine() << std::endl;
        } else {
            Kiln::ProcessHandle handle = launcher.launch(settings.gameDirectory, *cmd.versionName, settings.playerName, options);
            KILN_LOG_INFO("Started {} (PID {}).", *cmd.versionName, handle.pid);
        }
    } catch (const Kiln::ManifestReadError& e) {
        KILN_LOG_CRITICAL("Failed to launch Minecraft: {}", e.what());
        spdlog::shutdown();
        return 1;
    } catch (const Kiln::SpawnError& e) {
        KILN_LOG_CRITICAL("Failed to launch Minecraft: {}", e.what());
        spdlog::shutdown();
        return 1;
    }

    spdlog::shutdown();
    return 0;
}
