#pragma once

#include <expected>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace swissgeo::core {

inline constexpr const char* kLoggerName = "swissgeo";

// 日志配置错误类型
enum class LogError {
    FileSinkFailed
};

// 日志配置
struct LogConfig {
    bool verbose{false};   // 控制台输出 debug 级别
    bool quiet{false};     // 关闭控制台输出
    std::string logFile;   // 为空时不写文件
};

// 设置日志系统：创建名为 "swissgeo" 的 logger 并设为默认
[[nodiscard]] std::expected<void, LogError> setupLogging(const LogConfig& config);

// 库内部使用的 logger；未调用 setupLogging 时退回 spdlog 默认 logger
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

} // namespace swissgeo::core
