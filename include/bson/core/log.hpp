#pragma once

#include <cstdint>

namespace bson::core {

/**
 * @brief 日志级别（控制库内 "bson" logger 的输出）。
 *
 * 说明：
 * - 库内部日志使用 spdlog，但不把 spdlog 类型暴露到 public headers；
 * - 库使用独立的 logger，不修改业务侧的 spdlog 默认 logger；
 * - 默认级别为 warn：解码失败等 debug 级诊断需要显式打开。
 */
enum class LogLevel : std::uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    critical = 5,
    off = 6,
};

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

} // namespace bson::core
