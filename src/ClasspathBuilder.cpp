// src/ClasspathBuilder.cpp
#include <Kiln/ClasspathBuilder.hpp>
#include <Kiln/RuleEvaluator.hpp>
#include <Kiln/Utils/Logger.hpp>
#include <Kiln/Utils/Strings.hpp>

namespace Kiln {

std::string to_string(DependencyResolutionSkip::Reason reason) {
    switch (reason) {
        case DependencyResolutionSkip::Reason::MALFORMED_COORDINATE: return "malformed coordinate";
        case DependencyResolutionSkip::Reason::ARTIFACT_NOT_FOUND: return "artifact not found";
    }
    return "unknown";
}

std::string ClasspathResult::join(char separator) const {
    std::string joined;
    for (const auto& entry : entries) {
        if (!joined.empty()) joined += separator;
        joined += entry.string();
    }
    return joined;
}

ClasspathBuilder::ClasspathBuilder(const FileSystem& fs, const GameDirectory& gameDir)
    : m_fs(fs), m_gameDir(gameDir) {
    m_logger = Utils::Logger::GetOrCreateLogger("ClasspathBuilder");
}

ClasspathResult ClasspathBuilder::build(const Version& version, const PlatformInfo& platform) const {
    ClasspathResult result;
    // The client jar always leads, whether or not it is on disk
    result.entries.push_back(m_gameDir.clientJarPath(version.id));

    for (const auto& library : version.libraries) {
        if (!evaluateRules(library.rules, platform)) {
            m_logger->trace("Rules exclude {} on {}/{}", library.name, platform.osName, platform.osArch);
            continue;
        }

        DependencyResolutionSkip::Reason failure = DependencyResolutionSkip::Reason::ARTIFACT_NOT_FOUND;
        auto path = resolveLibrary(library, platform, failure);
        if (!path) {
            m_logger->warn("Skipping library '{}': {}", library.name, to_string(failure));
            result.skipped.push_back({library.name, failure});
            continue;
        }
        result.entries.push_back(*path);
    }

    m_logger->debug("Classpath for {} has {} entries ({} libraries skipped)",
                    version.id, result.entries.size(), result.skipped.size());
    return result;
}

std::optional<std::filesystem::path> ClasspathBuilder::resolveLibrary(const Library& library,
                                                                      const PlatformInfo& platform,
                                                                      DependencyResolutionSkip::Reason& failure) const {
    auto coordinate = LibraryCoordinate::parse(library.name);
    if (!coordinate) {
        failure = DependencyResolutionSkip::Reason::MALFORMED_COORDINATE;
        return std::nullopt;
    }

    std::filesystem::path baseDir = m_gameDir.librariesDir / coordinate->directory();

    auto native = library.natives.find(platform.osName);
    if (native != library.natives.end()) {
        std::string classifier = native->second;
        Utils::replaceAll(classifier, "${arch}", Utils::archBitsLabel(platform.osArch));
        std::filesystem::path nativePath = baseDir / coordinate->fileName(classifier);
        if (m_fs.exists(nativePath)) {
            return nativePath;
        }
        m_logger->trace("Native artifact {} not found, trying the plain jar", nativePath.string());
    }

    std::filesystem::path jarPath = baseDir / coordinate->fileName();
    if (m_fs.exists(jarPath)) {
        return jarPath;
    }

    failure = DependencyResolutionSkip::Reason::ARTIFACT_NOT_FOUND;
    return std::nullopt;
}

} // namespace Kiln
