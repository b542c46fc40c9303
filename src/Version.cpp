// src/Version.cpp
#include <Kiln/Types/Version.hpp>
#include <Kiln/Utils/Logger.hpp>
#include <stdexcept>

namespace Kiln {

namespace {

string required_string(const json& j, const char* key) {
    if (!j.contains(key) || !j.at(key).is_string()) {
        throw std::invalid_argument(string("missing or non-string '") + key + "'");
    }
    string value = j.at(key).get<string>();
    if (value.empty()) {
        throw std::invalid_argument(string("'") + key + "' is empty");
    }
    return value;
}

string optional_string(const json& j, const char* key) {
    if (j.contains(key) && j.at(key).is_string()) {
        return j.at(key).get<string>();
    }
    return {};
}

} // namespace

Version Version::from_json(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("manifest root is not an object");
    }
    KILN_LOG_TRACE("[VersionParser] Parsing version JSON for ID: {}", optional_string(j, "id"));
    Version version;

    version.id = required_string(j, "id");
    version.mainClass = required_string(j, "mainClass");
    version.type = optional_string(j, "type");

    version.assets = optional_string(j, "assets");
    if (version.assets.empty() && j.contains("assetIndex") && j.at("assetIndex").is_object()) {
        version.assets = optional_string(j.at("assetIndex"), "id");
    }

    if (j.contains("libraries") && j.at("libraries").is_array()) {
        for (const auto& lib_json : j.at("libraries")) {
            version.libraries.push_back(Library::from_json(lib_json));
        }
    }

    if (j.contains("minecraftArguments") && j.at("minecraftArguments").is_string()) {
        version.minecraftArguments = j.at("minecraftArguments").get<string>();
    }
    if (j.contains("arguments")) {
        version.arguments = Arguments::from_json(j.at("arguments"));
    }

    KILN_LOG_TRACE("[VersionParser] Parsed version {} ({} libraries)", version.id, version.libraries.size());
    return version;
}

} // namespace Kiln
