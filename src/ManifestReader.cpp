// src/ManifestReader.cpp
#include <Kiln/ManifestReader.hpp>
#include <Kiln/Errors.hpp>
#include <Kiln/Utils/Logger.hpp>
#include <nlohmann/json.hpp>

namespace Kiln {

Version readManifest(const FileSystem& fs, const std::filesystem::path& manifestPath) {
    if (!fs.exists(manifestPath)) {
        throw ManifestReadError(manifestPath, "file does not exist");
    }

    std::string text;
    try {
        text = fs.readText(manifestPath);
    } catch (const std::runtime_error& e) {
        throw ManifestReadError(manifestPath, e.what());
    }
    KILN_LOG_TRACE("Read {} bytes from {}", text.size(), manifestPath.string());

    nlohmann::json manifest_json;
    try {
        manifest_json = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ManifestReadError(manifestPath, std::string("invalid JSON: ") + e.what());
    }

    try {
        return Version::from_json(manifest_json);
    } catch (const std::invalid_argument& e) {
        throw ManifestReadError(manifestPath, e.what());
    } catch (const nlohmann::json::exception& e) {
        throw ManifestReadError(manifestPath, e.what());
    }
}

} // namespace Kiln
