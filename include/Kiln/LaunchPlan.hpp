// include/Kiln/LaunchPlan.hpp
#ifndef KILN_LAUNCH_PLAN_HPP
#define KILN_LAUNCH_PLAN_HPP

#include <Kiln/Config.hpp>
#include <Kiln/Types/LaunchOptions.hpp>
#include <string>
#include <vector>

namespace Kiln {

    inline constexpr const char* DEFAULT_JAVA_EXECUTABLE = "java";

    // Everything needed to start the game, fully resolved.
    struct LaunchPlan {
        std::string executable;
        std::vector<std::string> memoryFlags; // empty when heap sizing is left to the JVM
        std::vector<std::string> jvmFlags;
        std::string classpath;
        std::string mainClass;
        std::string gameArguments;

        // exe [memory flags] jvm flags -cp "<classpath>" mainClass gameArguments
        std::string commandLine() const;

        // The same command as separate arguments, executable first, with no shell quoting
        std::vector<std::string> arguments() const;
    };

    std::vector<std::string> memoryFlags(const LaunchOptions& options);

    // The fixed JVM flags, with paths pointing into versions/<versionName>/
    std::vector<std::string> fixedJvmFlags(const GameDirectory& gameDir, const std::string& versionName);

    // Pure construction, no I/O
    LaunchPlan assembleLaunchPlan(const GameDirectory& gameDir, const std::string& versionName,
                                  const std::string& mainClass, const std::string& classpath,
                                  const std::string& composedArgs, const LaunchOptions& options);

} // namespace Kiln

#endif //KILN_LAUNCH_PLAN_HPP
