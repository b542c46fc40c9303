//
// One dependency declared in a version manifest.
//

#ifndef KILN_LIBRARY_HPP
#define KILN_LIBRARY_HPP

#include <string>
#include <Kiln/Types/Rule.hpp>
#include <vector>
#include <map>
#include <optional>
#include <nlohmann/json.hpp>

namespace Kiln {
    using json = nlohmann::json;

    struct Library {
        std::string name; // group:artifact:version[:classifier]
        std::vector<Rule> rules;
        std::map<std::string, std::string> natives; // OS to classifier key e.g. "windows": "natives-windows-${arch}"

        static Library from_json(const json& j);
    };

    // A Maven coordinate split into its parts
    struct LibraryCoordinate {
        std::string group;
        std::string artifact;
        std::string version;
        std::optional<std::string> classifier;

        // Empty when the name does not have 3 or 4 non-empty ':'-separated segments
        static std::optional<LibraryCoordinate> parse(const std::string& name);

        // <group with '.' as '/'>/<artifact>/<version>
        std::string directory() const;
        // <artifact>-<version>[-<classifier>].jar
        std::string fileName(const std::optional<std::string>& classifierOverride = std::nullopt) const;
    };
}

#endif //KILN_LIBRARY_HPP
