//
// A parsed versions/<name>/<name>.json
//

#ifndef KILN_VERSION_HPP
#define KILN_VERSION_HPP

#include <string>
#include <vector>
#include <optional>
#include <Kiln/Types/Library.hpp>
#include <Kiln/Types/VersionArguments.hpp>
#include <nlohmann/json.hpp>

namespace Kiln {
    using std::string;
    using json = nlohmann::json;

    struct Version {
        string id;
        string mainClass;
        string assets; // asset index name
        string type;   // e.g. "snapshot", "release", "old_alpha"
        std::vector<Library> libraries;
        std::optional<string> minecraftArguments; // For old versions

        // Newer versions
        std::optional<Arguments> arguments;

        // Throws std::invalid_argument if id or mainClass is missing or empty
        static Version from_json(const json& j);
    };
}
#endif //KILN_VERSION_HPP
