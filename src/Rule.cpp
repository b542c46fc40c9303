//
// src/Rule.cpp
//
#include <Kiln/Types/Rule.hpp>

namespace Kiln {

RuleAction string_to_rule_action(const std::string& s) {
    if (s == "allow") return RuleAction::ALLOW;
    if (s == "disallow") return RuleAction::DISALLOW;
    return RuleAction::UNKNOWN;
}

// Malformed parts degrade to "no constraint"; this never throws.
Rule Rule::from_json(const json& j) {
    Rule rule_obj;
    if (!j.is_object()) return rule_obj;

    if (j.contains("action") && j.at("action").is_string()) {
        rule_obj.action = string_to_rule_action(j.at("action").get<std::string>());
    }

    if (j.contains("os") && j.at("os").is_object()) {
        rule_obj.os = OS::from_json(j.at("os"));
    }
    return rule_obj;
}

} // namespace Kiln
