//
// src/Library.cpp
//
#include <Kiln/Types/Library.hpp>
#include <algorithm>
#include <sstream>

namespace Kiln {

Library Library::from_json(const json& j) {
    Library lib;
    if (!j.is_object()) return lib;

    if (j.contains("name") && j.at("name").is_string()) {
        lib.name = j.at("name").get<std::string>();
    }

    if (j.contains("rules") && j.at("rules").is_array()) {
        for (const auto& rule_json : j.at("rules")) {
            lib.rules.push_back(Rule::from_json(rule_json));
        }
    }

    if (j.contains("natives") && j.at("natives").is_object()) {
        for (auto& [os_key, classifier_val] : j.at("natives").items()) {
            if (classifier_val.is_string()) {
                lib.natives[os_key] = classifier_val.get<std::string>();
            }
        }
    }

    return lib;
}

std::optional<LibraryCoordinate> LibraryCoordinate::parse(const std::string& name) {
    std::vector<std::string> parts;
    std::stringstream ss(name);
    std::string part;
    while (std::getline(ss, part, ':')) {
        parts.push_back(part);
    }
    // getline drops a trailing empty segment ("a:b:c:")
    if (!name.empty() && name.back() == ':') {
        parts.emplace_back();
    }

    if (parts.size() < 3 || parts.size() > 4) return std::nullopt;
    if (std::any_of(parts.begin(), parts.end(), [](const std::string& p) { return p.empty(); })) {
        return std::nullopt;
    }

    LibraryCoordinate coordinate;
    coordinate.group = parts[0];
    coordinate.artifact = parts[1];
    coordinate.version = parts[2];
    if (parts.size() == 4) coordinate.classifier = parts[3];
    return coordinate;
}

std::string LibraryCoordinate::directory() const {
    std::string groupPath = group;
    std::replace(groupPath.begin(), groupPath.end(), '.', '/');
    return groupPath + "/" + artifact + "/" + version;
}

std::string LibraryCoordinate::fileName(const std::optional<std::string>& classifierOverride) const {
    std::string file = artifact + "-" + version;
    const auto& suffix = classifierOverride ? classifierOverride : classifier;
    if (suffix && !suffix->empty()) {
        file += "-" + *suffix;
    }
    return file + ".jar";
}

} // namespace Kiln
