// include/Kiln/ProcessSpawner.hpp
#ifndef KILN_PROCESS_SPAWNER_HPP
#define KILN_PROCESS_SPAWNER_HPP

#include <Kiln/LaunchPlan.hpp>
#include <cstdint>
#include <memory>
#include <spdlog/logger.h>
#include <string>

namespace Kiln {

    struct ProcessHandle {
        std::int64_t pid = 0;
    };

    class ProcessSpawner {
    public:
        virtual ~ProcessSpawner() = default;

        // Starts the plan's command and returns without waiting for it.
        // Throws SpawnError if the process cannot be started.
        virtual ProcessHandle spawnDetached(const LaunchPlan& plan) = 0;
    };

    class NativeProcessSpawner : public ProcessSpawner {
    public:
        NativeProcessSpawner();

        ProcessHandle spawnDetached(const LaunchPlan& plan) override;

        // Full path of the executable: taken as-is when it contains a directory
        // part, otherwise searched on PATH. Throws SpawnError when it is not found.
        static std::string resolveExecutable(const std::string& executable);

    private:
        std::shared_ptr<spdlog::logger> m_logger;
    };

} // namespace Kiln

#endif //KILN_PROCESS_SPAWNER_HPP
