// src/ProcessSpawner.cpp
#include <Kiln/ProcessSpawner.hpp>
#include <Kiln/Errors.hpp>
#include <Kiln/Utils/Logger.hpp>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <vector>

#if defined(_WIN32)
    #include <windows.h>
#else
    #include <spawn.h>
    #include <sys/types.h>
    #include <unistd.h>
extern char** environ;
#endif

namespace Kiln {

NativeProcessSpawner::NativeProcessSpawner() {
    m_logger = Utils::Logger::GetOrCreateLogger("ProcessSpawner");
}

#if defined(_WIN32)

namespace {

// Re-quotes each argument so CreateProcess hands the child the same argv
std::string windows_command_line(const std::vector<std::string>& arguments) {
    std::string commandLine;
    for (const auto& argument : arguments) {
        if (!commandLine.empty()) commandLine += ' ';
        if (!argument.empty() && argument.find_first_of(" \t\"") == std::string::npos) {
            commandLine += argument;
            continue;
        }
        commandLine += '"';
        std::size_t backslashes = 0;
        for (char c : argument) {
            if (c == '\\') {
                ++backslashes;
            } else if (c == '"') {
                commandLine.append(backslashes + 1, '\\');
                commandLine += c;
                backslashes = 0;
                continue;
            } else {
                backslashes = 0;
            }
            commandLine += c;
        }
        commandLine.append(backslashes, '\\');
        commandLine += '"';
    }
    return commandLine;
}

} // namespace

std::string NativeProcessSpawner::resolveExecutable(const std::string& executable) {
    char buffer[MAX_PATH];
    DWORD length = SearchPathA(nullptr, executable.c_str(), ".exe", MAX_PATH, buffer, nullptr);
    if (length == 0 || length >= MAX_PATH) {
        throw SpawnError(executable, "executable not found");
    }
    return std::string(buffer, length);
}

ProcessHandle NativeProcessSpawner::spawnDetached(const LaunchPlan& plan) {
    const std::string resolved = resolveExecutable(plan.executable);
    m_logger->debug("Resolved {} to {}", plan.executable, resolved);

    std::vector<std::string> arguments = plan.arguments();
    arguments.front() = resolved;
    std::string commandLine = windows_command_line(arguments);
    STARTUPINFOA si;
    PROCESS_INFORMATION pi;
    ZeroMemory(&si, sizeof(si));
    si.cb = sizeof(si);
    ZeroMemory(&pi, sizeof(pi));

    BOOL ok = CreateProcessA(resolved.c_str(), commandLine.data(), nullptr, nullptr, FALSE,
                             DETACHED_PROCESS | CREATE_NEW_PROCESS_GROUP, nullptr, nullptr, &si, &pi);
    if (!ok) {
        throw SpawnError(plan.executable, "CreateProcess failed with error " + std::to_string(GetLastError()));
    }
    CloseHandle(pi.hThread);
    CloseHandle(pi.hProcess);
    return ProcessHandle{static_cast<std::int64_t>(pi.dwProcessId)};
}

#else

std::string NativeProcessSpawner::resolveExecutable(const std::string& executable) {
    if (executable.empty()) {
        throw SpawnError(executable, "no executable given");
    }
    if (executable.find('/') != std::string::npos) {
        if (access(executable.c_str(), X_OK) != 0) {
            throw SpawnError(executable, std::strerror(errno));
        }
        return executable;
    }

    const char* pathEnv = std::getenv("PATH");
    std::stringstream dirs(pathEnv ? pathEnv : "");
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + executable;
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    throw SpawnError(executable, "not found on PATH");
}

ProcessHandle NativeProcessSpawner::spawnDetached(const LaunchPlan& plan) {
    const std::string resolved = resolveExecutable(plan.executable);
    m_logger->debug("Resolved {} to {}", plan.executable, resolved);

    // Arguments go straight to the child; no shell sees them
    std::vector<std::string> arguments = plan.arguments();
    std::vector<char*> argv;
    argv.reserve(arguments.size() + 1);
    for (auto& argument : arguments) {
        argv.push_back(argument.data());
    }
    argv.push_back(nullptr);

    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
#if defined(POSIX_SPAWN_SETSID)
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSID);
#else
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(&attr, 0);
#endif

    pid_t pid = 0;
    int spawnResult = posix_spawn(&pid, resolved.c_str(), nullptr, &attr, argv.data(), environ);
    posix_spawnattr_destroy(&attr);
    if (spawnResult != 0) {
        throw SpawnError(plan.executable, std::strerror(spawnResult));
    }
    return ProcessHandle{static_cast<std::int64_t>(pid)};
}

#endif

} // namespace Kiln
