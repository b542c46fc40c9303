// include/Kiln/ArgumentComposer.hpp
#ifndef KILN_ARGUMENT_COMPOSER_HPP
#define KILN_ARGUMENT_COMPOSER_HPP

#include <Kiln/Config.hpp>
#include <Kiln/Types/Version.hpp>
#include <string>
#include <utility>
#include <vector>

namespace Kiln {

    // Values substituted into the game argument template. There is no
    // authentication, so the identity fields carry offline placeholders.
    struct RuntimeContext {
        std::string playerName;
        std::string versionName;
        std::string gameDirectory;
        std::string assetsRoot;
        std::string assetIndexName;
        std::string authUuid = "00000000-0000-0000-0000-000000000000";
        std::string accessToken = "00000000000000000000000000000000";
        std::string userType = "legacy";
        std::string versionType;

        static RuntimeContext forLaunch(const GameDirectory& gameDir, const std::string& versionName,
                                        const std::string& playerName, const Version& version);

        // (placeholder, value) pairs in the order they are applied
        std::vector<std::pair<std::string, std::string>> substitutions() const;
    };

    // minecraftArguments followed by every plain string of arguments.game.
    // Conditional entries are not part of the template.
    std::string gameArgumentTemplate(const Version& version);

    // Template with placeholders replaced, trimmed. Unknown placeholders are kept verbatim.
    std::string composeGameArguments(const Version& version, const RuntimeContext& context);

} // namespace Kiln

#endif //KILN_ARGUMENT_COMPOSER_HPP
