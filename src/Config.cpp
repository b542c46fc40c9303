// src/Config.cpp
#include <Kiln/Config.hpp>
#include <Kiln/Errors.hpp>
#include <Kiln/Utils/Logger.hpp>
#include <nlohmann/json.hpp>
#include <climits>

namespace Kiln {

using json = nlohmann::json;

bool memoryMbInRange(unsigned long long mb) {
    return mb >= 1 && mb <= UINT_MAX;
}

LaunchOptions LauncherSettings::toLaunchOptions() const {
    LaunchOptions options;
    if (!javaPath.empty()) options.executablePath = javaPath;
    options.memoryMb = memoryMb;
    options.deferToSystemMemory = useSystemMemory;
    return options;
}

LauncherSettings LauncherSettings::load(const FileSystem& fs, const std::filesystem::path& settingsPath) {
    LauncherSettings settings;
    if (!fs.exists(settingsPath)) {
        KILN_LOG_TRACE("No settings file at {}, using defaults.", settingsPath.string());
        return settings;
    }

    json j;
    try {
        j = json::parse(fs.readText(settingsPath));
    } catch (const json::parse_error& e) {
        throw SettingsError("Invalid settings file " + settingsPath.string() + ": " + e.what());
    } catch (const std::runtime_error& e) {
        throw SettingsError("Cannot read settings file " + settingsPath.string() + ": " + e.what());
    }
    if (!j.is_object()) {
        throw SettingsError("Settings file " + settingsPath.string() + " must contain a JSON object");
    }

    try {
        if (j.contains("gameDirectory")) settings.gameDirectory = j.at("gameDirectory").get<std::string>();
        if (j.contains("playerName")) settings.playerName = j.at("playerName").get<std::string>();
        if (j.contains("javaPath")) settings.javaPath = j.at("javaPath").get<std::string>();
        if (j.contains("memory")) {
            if (j.at("memory").is_null()) {
                settings.memoryMb = std::nullopt;
            } else if (!j.at("memory").is_number_unsigned() ||
                       !memoryMbInRange(j.at("memory").get<unsigned long long>())) {
                throw SettingsError("'memory' in " + settingsPath.string() + " must be between 1 and " +
                                    std::to_string(UINT_MAX) + " megabytes");
            } else {
                settings.memoryMb = j.at("memory").get<unsigned int>();
            }
        }
        if (j.contains("useSystemMemory")) settings.useSystemMemory = j.at("useSystemMemory").get<bool>();
        if (j.contains("logDirectory")) settings.logDirectory = j.at("logDirectory").get<std::string>();
        if (j.contains("logLevel")) settings.logLevel = j.at("logLevel").get<std::string>();
    } catch (const json::type_error& e) {
        throw SettingsError("Bad value in settings file " + settingsPath.string() + ": " + e.what());
    }

    KILN_LOG_TRACE("Loaded settings from {}", settingsPath.string());
    return settings;
}

} // namespace Kiln
