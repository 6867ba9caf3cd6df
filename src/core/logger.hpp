#pragma once

#include <spdlog/logger.h>

namespace bson::core::detail {

// 库内共享的 "bson" logger（输出到 stderr），首次调用时创建。
[[nodiscard]] spdlog::logger &logger() noexcept;

} // namespace bson::core::detail
