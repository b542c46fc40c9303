// src/ArgumentComposer.cpp
#include <Kiln/ArgumentComposer.hpp>
#include <Kiln/LauncherInfo.hpp>
#include <Kiln/Utils/Logger.hpp>
#include <Kiln/Utils/Strings.hpp>

namespace Kiln {

RuntimeContext RuntimeContext::forLaunch(const GameDirectory& gameDir, const std::string& versionName,
                                         const std::string& playerName, const Version& version) {
    RuntimeContext context;
    context.playerName = playerName;
    context.versionName = versionName;
    context.gameDirectory = gameDir.root.string();
    context.assetsRoot = gameDir.assetsDir.string();
    context.assetIndexName = version.assets;
    context.versionType = std::string("\"") + LAUNCHER_BRAND + " " + LAUNCHER_VERSION + "\"";
    return context;
}

std::vector<std::pair<std::string, std::string>> RuntimeContext::substitutions() const {
    return {
        {"${auth_player_name}", playerName},
        {"${version_name}", versionName},
        {"${game_directory}", gameDirectory},
        {"${assets_root}", assetsRoot},
        {"${assets_index_name}", assetIndexName},
        {"${auth_uuid}", authUuid},
        {"${auth_access_token}", accessToken},
        {"${user_type}", userType},
        {"${version_type}", versionType},
    };
}

std::string gameArgumentTemplate(const Version& version) {
    std::string args;
    if (version.minecraftArguments) {
        args = *version.minecraftArguments;
    }
    // Both forms contribute when a manifest carries both
    if (version.arguments) {
        for (const auto& arg : version.arguments->game) {
            if (const auto* token = std::get_if<std::string>(&arg)) {
                args += ' ';
                args += *token;
            }
        }
    }
    return args;
}

std::string composeGameArguments(const Version& version, const RuntimeContext& context) {
    std::string args = gameArgumentTemplate(version);
    for (const auto& [placeholder, value] : context.substitutions()) {
        Utils::replaceAll(args, placeholder, value);
    }
    args = Utils::trim(args);
    KILN_LOG_TRACE("Composed game arguments for {}: {}", version.id, args);
    return args;
}

} // namespace Kiln
