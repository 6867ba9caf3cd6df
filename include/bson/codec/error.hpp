#pragma once

#include <system_error>

namespace bson::codec {

/**
 * @brief 编解码错误码。
 *
 * 分类：
 * - 不支持的值：unsupported_value
 * - 编码侧：buffer_overflow / length_overflow / size_mismatch / invalid_key / invalid_cstring
 * - 格式错误（解码侧帧校验失败）：truncated ... trailing_bytes，见 is_format_error()
 * - 深度超限：depth_exceeded（编码、解码、长度计算共用）
 */
enum class errc : int {
  ok = 0,
  unsupported_value = 1,
  buffer_overflow = 2,
  length_overflow = 3,
  size_mismatch = 4,
  invalid_key = 5,
  invalid_cstring = 6,

  truncated = 10,
  invalid_document_size = 11,
  document_size_mismatch = 12,
  missing_terminator = 13,
  invalid_element_type = 14,
  invalid_name = 15,
  invalid_string_length = 16,
  invalid_utf8 = 17,
  invalid_binary_length = 18,
  invalid_code_w_scope = 19,
  invalid_boolean = 20,
  trailing_bytes = 21,

  depth_exceeded = 30,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

// 是否为解码期的帧格式错误（truncated..trailing_bytes）。
[[nodiscard]] bool is_format_error(const std::error_code& ec) noexcept;

}  // namespace bson::codec

namespace std {
template <>
struct is_error_code_enum<bson::codec::errc> : true_type {};
}  // namespace std
