// src/VersionArguments.cpp
#include <Kiln/Types/VersionArguments.hpp>
#include <Kiln/Utils/Logger.hpp>

namespace Kiln {

ConditionalArgumentValue ConditionalArgumentValue::from_json(const json& j) {
    ConditionalArgumentValue cav;
    if (j.contains("rules") && j.at("rules").is_array()) {
        for (const auto& rule_json : j.at("rules")) {
            cav.rules.push_back(Rule::from_json(rule_json));
        }
    }
    if (j.contains("value")) {
        if (j.at("value").is_string()) {
            cav.value = j.at("value").get<std::string>();
        } else if (j.at("value").is_array()) {
            std::vector<std::string> values;
            for (const auto& val_item : j.at("value")) {
                if (val_item.is_string()) values.push_back(val_item.get<std::string>());
            }
            cav.value = values;
        }
    }
    return cav;
}

std::vector<VersionArgument> Arguments::parse_argument_array(const json& arr) {
    std::vector<VersionArgument> result_args;
    if (arr.is_array()) {
        for (const auto& arg_item_json : arr) {
            if (arg_item_json.is_string()) {
                result_args.emplace_back(arg_item_json.get<std::string>());
            } else if (arg_item_json.is_object()) {
                result_args.emplace_back(ConditionalArgumentValue::from_json(arg_item_json));
            } else {
                KILN_LOG_WARN("[VersionArgsParser] Unknown argument type in array: {}", arg_item_json.dump());
            }
        }
    }
    return result_args;
}

Arguments Arguments::from_json(const json& j) {
    KILN_LOG_TRACE("[VersionArgsParser] Parsing 'arguments' object.");
    Arguments args;
    if (!j.is_object()) {
        KILN_LOG_WARN("[VersionArgsParser] 'arguments' is not an object, ignoring it.");
        return args;
    }
    if (j.contains("game")) {
        args.game = parse_argument_array(j.at("game"));
    }
    KILN_LOG_TRACE("[VersionArgsParser] Parsed {} game arguments.", args.game.size());
    return args;
}

} // namespace Kiln
