// include/Kiln/Types/LaunchOptions.hpp
#ifndef KILN_LAUNCH_OPTIONS_HPP
#define KILN_LAUNCH_OPTIONS_HPP

#include <optional>
#include <string>

namespace Kiln {

    struct LaunchOptions {
        std::optional<std::string> executablePath; // unset: "java" looked up on PATH
        std::optional<unsigned int> memoryMb;
        bool deferToSystemMemory = false;          // leave heap sizing to the JVM
    };

} // namespace Kiln

#endif //KILN_LAUNCH_OPTIONS_HPP
