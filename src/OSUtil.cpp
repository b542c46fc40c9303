// src/OSUtil.cpp
#include <Kiln/Utils/OS.hpp>

namespace Kiln {
namespace Utils {

OperatingSystem getCurrentOS() {
    #if defined(_WIN32) || defined(_WIN64)
        return OperatingSystem::WINDOWS;
    #elif defined(__APPLE__) || defined(__MACH__)
        return OperatingSystem::MACOS;
    #elif defined(__linux__)
        return OperatingSystem::LINUX;
    #else
        return OperatingSystem::UNKNOWN;
    #endif
}

Architecture getCurrentArch() {
    #if defined(_M_AMD64) || defined(__amd64__) || defined(__x86_64__)
        return Architecture::X64;
    #elif defined(_M_IX86) || defined(__i386__)
        return Architecture::X86;
    #elif defined(__aarch64__) || defined(_M_ARM64)
        return Architecture::ARM64;
    #elif defined(__arm__) || defined(_M_ARM)
        return Architecture::ARM32;
    #else
        return Architecture::UNKNOWN;
    #endif
}

std::string getOSStringForManifest(OperatingSystem os) {
    switch (os) {
        case OperatingSystem::WINDOWS: return "windows";
        case OperatingSystem::MACOS: return "osx"; // Mojang still calls it osx
        case OperatingSystem::LINUX: return "linux";
        default: return "unknown";
    }
}

std::string getArchStringForManifest(Architecture arch) {
    switch (arch) {
        case Architecture::X64: return "x86_64";
        case Architecture::X86: return "x86";
        case Architecture::ARM64: return "arm64";
        case Architecture::ARM32: return "arm32";
        default: return "unknown";
    }
}

std::string archBitsLabel(const std::string& osArch) {
    if (osArch == "x86_64" || osArch == "amd64" || osArch == "x64" ||
        osArch == "arm64" || osArch == "aarch64") {
        return "64";
    }
    return "32";
}

char pathListSeparator(const std::string& osName) {
    return osName == "windows" ? ';' : ':';
}

} // namespace Utils

PlatformInfo PlatformInfo::current() {
    return PlatformInfo{Utils::getOSStringForManifest(Utils::getCurrentOS()),
                        Utils::getArchStringForManifest(Utils::getCurrentArch())};
}

} // namespace Kiln
