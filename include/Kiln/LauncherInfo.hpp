// include/Kiln/LauncherInfo.hpp
#ifndef KILN_LAUNCHER_INFO_HPP
#define KILN_LAUNCHER_INFO_HPP

namespace Kiln {

    inline constexpr const char* LAUNCHER_NAME = "Kiln";

    // Identity reported to the game (-Dminecraft.launcher.* and ${version_type})
    inline constexpr const char* LAUNCHER_BRAND = "WMML";
    inline constexpr const char* LAUNCHER_VERSION = "0.1.26";

} // namespace Kiln

#endif //KILN_LAUNCHER_INFO_HPP
