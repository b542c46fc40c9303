// include/Kiln/Types/VersionArguments.hpp
#ifndef KILN_VERSIONARGUMENTS_HPP
#define KILN_VERSIONARGUMENTS_HPP

#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <Kiln/Types/Rule.hpp>

namespace Kiln {

    // {"rules": [...], "value": "x" | ["x", "y"]}
    struct ConditionalArgumentValue {
        std::vector<Rule> rules;
        std::variant<std::string, std::vector<std::string>> value;
        static ConditionalArgumentValue from_json(const json& j);
    };

    using VersionArgument = std::variant<std::string, ConditionalArgumentValue>;

    // The "arguments" object of 1.13+ manifests. Only "game" is read; the JVM
    // flags come from the launcher, not the manifest.
    struct Arguments {
        std::vector<VersionArgument> game;

        static Arguments from_json(const json& j);
        static std::vector<VersionArgument> parse_argument_array(const json& arr);
    };

} // namespace Kiln
#endif //KILN_VERSIONARGUMENTS_HPP
