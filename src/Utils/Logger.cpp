// src/Utils/Logger.cpp
#include <Kiln/Utils/Logger.hpp>
#include <iostream> // For errors raised before any sink exists

namespace Kiln {
namespace Utils {

    std::shared_ptr<spdlog::logger> Logger::s_CoreLogger;
    std::vector<spdlog::sink_ptr> Logger::s_GlobalSinks;

    namespace {

    // Reused if Init() fails more than once
    std::shared_ptr<spdlog::logger> FallbackLogger(const std::string& name) {
        if (auto existing = spdlog::get(name)) {
            return existing;
        }
        return spdlog::stdout_color_mt(name);
    }

    } // namespace

    void Logger::Init(const std::filesystem::path& logDir,
                      const std::string& logFileName,
                      spdlog::level::level_enum consoleLevel,
                      spdlog::level::level_enum fileLevel) {
        try {
            s_GlobalSinks.clear();
            if (s_CoreLogger) {
                spdlog::drop(s_CoreLogger->name());
            }

            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(consoleLevel);
            console_sink->set_pattern("%^[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v%$");
            s_GlobalSinks.push_back(console_sink);

            if (!logDir.empty() && !logFileName.empty()) {
                if (!std::filesystem::exists(logDir)) {
                    std::filesystem::create_directories(logDir);
                }
                std::filesystem::path logFilePath = logDir / logFileName;
                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logFilePath.string(), 1024 * 1024 * 5, 3);
                file_sink->set_level(fileLevel);
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
                s_GlobalSinks.push_back(file_sink);
            }

            s_CoreLogger = std::make_shared<spdlog::logger>("Core", s_GlobalSinks.begin(), s_GlobalSinks.end());
            spdlog::register_logger(s_CoreLogger);
            s_CoreLogger->set_level(spdlog::level::trace);
            s_CoreLogger->flush_on(spdlog::level::trace);

            s_CoreLogger->debug("Logger initialized. Console level: {}, File level: {}",
                                spdlog::level::to_string_view(consoleLevel),
                                spdlog::level::to_string_view(fileLevel));

        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Log initialization failed: " << ex.what() << std::endl;
            s_CoreLogger = FallbackLogger("Core_Fallback");
            s_CoreLogger->set_level(spdlog::level::err);
            s_CoreLogger->error("LOGGER INITIALIZATION FAILED. USING FALLBACK CONSOLE LOGGER.");
        } catch (const std::exception& ex) {
            std::cerr << "Log file system setup failed: " << ex.what() << std::endl;
            s_CoreLogger = FallbackLogger("Core_FS_Fallback");
            s_CoreLogger->set_level(spdlog::level::err);
            s_CoreLogger->error("LOGGER FILE SYSTEM SETUP FAILED. USING FALLBACK CONSOLE LOGGER.");
        }
    }

    std::shared_ptr<spdlog::logger>& Logger::GetCoreLogger() {
        if (!s_CoreLogger) {
            Init("", "", spdlog::level::warn, spdlog::level::trace);
        }
        return s_CoreLogger;
    }

    std::shared_ptr<spdlog::logger> Logger::GetOrCreateLogger(const std::string& name) {
        auto logger = spdlog::get(name);
        if (!logger) {
            if (s_GlobalSinks.empty()) {
                GetCoreLogger(); // installs the console-only sinks
            }
            logger = std::make_shared<spdlog::logger>(name, s_GlobalSinks.begin(), s_GlobalSinks.end());
            logger->set_level(spdlog::level::trace); // Sinks do the filtering
            logger->flush_on(spdlog::level::trace);
            spdlog::register_logger(logger);
        }
        return logger;
    }

    void Logger::SetLevel(const std::string& loggerName, spdlog::level::level_enum level) {
        auto logger = spdlog::get(loggerName);
        if (logger) {
            logger->set_level(level);
        } else {
            if (s_CoreLogger) {
                 s_CoreLogger->warn("Attempted to set level for non-existent logger: {}", loggerName);
            } else {
                 std::cerr << "Attempted to set level for non-existent logger: " << loggerName << " (Core logger also unavailable)" << std::endl;
            }
        }
    }

    std::optional<spdlog::level::level_enum> Logger::ParseLevel(const std::string& name) {
        auto level = spdlog::level::from_str(name);
        // from_str() maps anything it does not know to "off"
        if (level == spdlog::level::off && name != "off") {
            return std::nullopt;
        }
        return level;
    }

} // namespace Utils
} // namespace Kiln
