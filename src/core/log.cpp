#include "bson/core/log.hpp"

#include "core/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <array>
#include <memory>
#include <utility>

namespace bson::core {
namespace {

// LogLevel 与 spdlog::level 的取值一一对应，按下标映射。
constexpr std::array<spdlog::level::level_enum, 7> kSpdlogLevels{
    spdlog::level::trace,
    spdlog::level::debug,
    spdlog::level::info,
    spdlog::level::warn,
    spdlog::level::err,
    spdlog::level::critical,
    spdlog::level::off,
};

[[nodiscard]] std::shared_ptr<spdlog::logger> make_logger() {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto created = std::make_shared<spdlog::logger>("bson", std::move(sink));
    created->set_level(spdlog::level::warn);
    return created;
}

} // namespace

namespace detail {

spdlog::logger &logger() noexcept {
    // 不注册到 spdlog registry，避免与业务侧同名 logger 冲突。
    static const std::shared_ptr<spdlog::logger> instance = make_logger();
    return *instance;
}

} // namespace detail

void set_log_level(LogLevel level) noexcept {
    const auto index = static_cast<std::size_t>(level);
    if (index >= kSpdlogLevels.size()) {
        return;
    }
    detail::logger().set_level(kSpdlogLevels[index]);
}

LogLevel log_level() noexcept {
    const auto current = detail::logger().level();
    for (std::size_t i = 0; i < kSpdlogLevels.size(); ++i) {
        if (kSpdlogLevels[i] == current) {
            return static_cast<LogLevel>(i);
        }
    }
    return LogLevel::off;
}

} // namespace bson::core
