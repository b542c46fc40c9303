// include/Kiln/Utils/OS.hpp
#ifndef KILN_OS_UTIL_HPP
#define KILN_OS_UTIL_HPP

#include <string>

namespace Kiln {
    namespace Utils {

        enum class OperatingSystem {
            WINDOWS,
            MACOS,
            LINUX,
            UNKNOWN
        };

        enum class Architecture {
            X86,        // 32-bit x86
            X64,        // 64-bit x86_64/amd64
            ARM64,      // 64-bit ARM (aarch64)
            ARM32,      // 32-bit ARM
            UNKNOWN
        };

        OperatingSystem getCurrentOS();
        Architecture getCurrentArch();

        // Names used by the "os" block of version manifest rules
        std::string getOSStringForManifest(OperatingSystem os);
        std::string getArchStringForManifest(Architecture arch);

        // "64" or "32", substituted for ${arch} in native classifiers
        std::string archBitsLabel(const std::string& osArch);

        char pathListSeparator(const std::string& osName);

    } // namespace Utils

    // The platform a launch is evaluated against. Defaults to the host, but any
    // value can be injected so rules and natives can be resolved for other targets.
    struct PlatformInfo {
        std::string osName;
        std::string osArch;

        static PlatformInfo current();
    };

} // namespace Kiln

#endif //KILN_OS_UTIL_HPP
