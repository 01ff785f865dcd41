#include "Logger.hpp"
#include <spdlog/pattern_formatter.h>
#include <mutex>

namespace Enclave {

namespace {
std::mutex loggerMutex;
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& logFilePath, Level level) {
    std::lock_guard<std::mutex> lock(loggerMutex);

    if (logger_) {
        spdlog::drop(logger_->name());
    }

    try {
        auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        consoleSink->set_pattern("[%H:%M:%S] [%^%l%$] [%t] %v");

        spdlog::sinks_init_list sinks = {consoleSink};
        if (logFilePath.empty()) {
            logger_ = std::make_shared<spdlog::logger>("enclave", sinks);
        } else {
            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFilePath, 1024 * 1024 * 5, 3); // 5MB, 3 files
            fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%l] [%t] %v");
            logger_ = std::make_shared<spdlog::logger>("enclave",
                spdlog::sinks_init_list{consoleSink, fileSink});
        }

        logger_->set_level(static_cast<spdlog::level::level_enum>(level));
        spdlog::register_logger(logger_);

        logger_->info("Logger initialized with file: {}",
                      logFilePath.empty() ? std::string("<console>") : logFilePath);

    } catch (const spdlog::spdlog_ex& ex) {
        spdlog::drop("enclave_fallback");
        logger_ = spdlog::stderr_color_mt("enclave_fallback");
        logger_->set_level(static_cast<spdlog::level::level_enum>(level));
        logger_->error("Logger initialization failed: {}", ex.what());
    }
}

void Logger::setLevel(Level level) {
    get()->set_level(static_cast<spdlog::level::level_enum>(level));
}

Logger::Level Logger::level() const {
    if (!logger_) {
        return Level::Info;
    }
    return static_cast<Level>(logger_->level());
}

bool Logger::parseLevel(const std::string& name, Level& level) {
    static const std::pair<const char*, Level> names[] = {
        {"trace", Level::Trace},
        {"debug", Level::Debug},
        {"info", Level::Info},
        {"warn", Level::Warn},
        {"warning", Level::Warn},
        {"error", Level::Error},
        {"critical", Level::Critical},
        {"off", Level::Off}
    };

    for (const auto& [candidate, value] : names) {
        if (name == candidate) {
            level = value;
            return true;
        }
    }
    return false;
}

spdlog::logger* Logger::get() {
    std::lock_guard<std::mutex> lock(loggerMutex);
    if (!logger_) {
        logger_ = spdlog::get("enclave_console");
        if (!logger_) {
            logger_ = spdlog::stderr_color_mt("enclave_console");
        }
    }
    return logger_.get();
}

} // namespace Enclave
