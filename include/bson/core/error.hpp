#pragma once

#include <system_error>

namespace bson::core {

/**
 * @brief 本库通用错误码（跨模块复用）。
 *
 * 约定：
 * - 所有接口优先返回 std::error_code，避免异常路径。
 * - invalid_buffer_type：边界输入不是可识别的字节载体（Buffer Adapter 的类型错误）。
 * - buffer_out_of_range：视图的 offset/length 超出其所属内存块。
 */
enum class errc : int {
  ok = 0,
  invalid_argument = 1,
  buffer_overflow = 2,
  invalid_buffer_type = 3,
  buffer_out_of_range = 4,
  out_of_memory = 5,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace bson::core

namespace std {
template <>
struct is_error_code_enum<bson::core::errc> : true_type {};
}  // namespace std
