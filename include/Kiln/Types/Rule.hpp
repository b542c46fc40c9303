//
// An allow/disallow predicate attached to a library or a conditional argument.
//

#ifndef KILN_RULE_HPP
#define KILN_RULE_HPP

#include <string>
#include <optional>
#include <Kiln/Types/OS.hpp>
#include <nlohmann/json.hpp>

namespace Kiln {
    using std::optional;
    using json = nlohmann::json;

    enum class RuleAction {
        ALLOW = 1,
        DISALLOW = 2,
        UNKNOWN = 3, // never touches the decision
    };

    RuleAction string_to_rule_action(const std::string& s);

    struct Rule {
        RuleAction action = RuleAction::UNKNOWN;
        optional<OS> os; // "features" conditions are not read; launches never enable any

        static Rule from_json(const json& j);
    };
}

#endif //KILN_RULE_HPP
