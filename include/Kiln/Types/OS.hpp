//
// The "os" block of a manifest rule.
//

#ifndef KILN_RULEOS_HPP
#define KILN_RULEOS_HPP

#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace Kiln {
    using json = nlohmann::json;

    struct OS {
        std::string name;
        std::optional<std::string> arch;

        static OS from_json(const json& j);
    };
}

#endif //KILN_RULEOS_HPP
