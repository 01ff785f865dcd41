#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <memory>
#include <string>

namespace Enclave {

class Logger {
public:
    enum class Level {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5,
        Off = 6
    };

    static Logger& instance();

    // An empty path logs to the console only
    void initialize(const std::string& logFilePath = "enclave.log",
                    Level level = Level::Info);

    void setLevel(Level level);
    Level level() const;

    // Accepts trace, debug, info, warn, error, critical, off
    static bool parseLevel(const std::string& name, Level& level);

    template<typename... Args>
    void trace(fmt::format_string<Args...> format, Args&&... args) {
        get()->trace(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) {
        get()->debug(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args) {
        get()->info(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args) {
        get()->warn(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args) {
        get()->error(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(fmt::format_string<Args...> format, Args&&... args) {
        get()->critical(format, std::forward<Args>(args)...);
    }

private:
    Logger() = default;

    // Lazily falls back to a console logger so library code may log before initialize()
    spdlog::logger* get();

    std::shared_ptr<spdlog::logger> logger_;
};

#define ENCLAVE_TRACE(...) Enclave::Logger::instance().trace(__VA_ARGS__)
#define ENCLAVE_DEBUG(...) Enclave::Logger::instance().debug(__VA_ARGS__)
#define ENCLAVE_INFO(...) Enclave::Logger::instance().info(__VA_ARGS__)
#define ENCLAVE_WARN(...) Enclave::Logger::instance().warn(__VA_ARGS__)
#define ENCLAVE_ERROR(...) Enclave::Logger::instance().error(__VA_ARGS__)
#define ENCLAVE_CRITICAL(...) Enclave::Logger::instance().critical(__VA_ARGS__)

} // namespace Enclave
