#include "core/Logging.hpp"
#include <vector>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace swissgeo::core {

std::expected<void, LogError> setupLogging(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (!config.quiet) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(config.verbose ? spdlog::level::debug : spdlog::level::info);
        sinks.push_back(console_sink);
    }

    if (!config.logFile.empty()) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.logFile, true);
            file_sink->set_level(spdlog::level::trace);
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::error("Cannot open log file {}: {}", config.logFile, e.what());
            return std::unexpected(LogError::FileSinkFailed);
        }
    }

    auto newLogger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    newLogger->set_level(spdlog::level::trace);
    spdlog::set_default_logger(newLogger);

    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    return {};
}

std::shared_ptr<spdlog::logger> logger() {
    if (auto named = spdlog::get(kLoggerName)) {
        return named;
    }
    return spdlog::default_logger();
}

} // namespace swissgeo::core
