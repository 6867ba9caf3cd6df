#pragma once

#include "bson/codec/error.hpp"
#include "bson/codec/value.hpp"

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>

namespace bson::codec::detail {

constexpr bool checked_add(std::size_t a, std::size_t b, std::size_t& out) noexcept {
  if (a > kMaxDocumentSize || b > (kMaxDocumentSize - a)) {
    return false;
  }
  out = a + b;
  return true;
}

/**
 * @brief Number 的宽度规则：整数、处于安全整数范围且处于 int32 范围 -> 4 字节 int32；
 * 否则 8 字节 double。
 *
 * 长度计算与编码共用此规则，保证两者选择同一分支。
 */
[[nodiscard]] bool number_fits_int32(double v) noexcept;

// 函数源码规范化：首个 "function(" 替换为 "function ("。
[[nodiscard]] std::string normalized_function_string(std::string_view source);
// 规范化后的长度，不分配。
[[nodiscard]] std::size_t normalized_function_size(std::string_view source) noexcept;

// DBRef 写出时的保留键。
inline constexpr std::string_view kDbRefCollectionKey = "$ref";
inline constexpr std::string_view kDbRefIdKey = "$id";
inline constexpr std::string_view kDbRefDbKey = "$db";

/**
 * @brief 调用 Custom 的 to_bson() 转换（仅一次）。
 *
 * 成功时 out 为转换结果；converter 为空、to_bson() 抛出异常、
 * 或转换结果仍为 Custom 时返回 errc::unsupported_value。
 * to_bson() 抛出 std::bad_alloc 时返回 core::errc::out_of_memory。
 */
std::error_code resolve_custom(const Custom& custom, Value& out) noexcept;

// 数组下标键（"0"、"1"...），写入调用方提供的缓冲区。
using index_key_buffer = std::array<char, 24>;
[[nodiscard]] std::string_view index_key(std::size_t index, index_key_buffer& buf) noexcept;

[[nodiscard]] bool contains_nul(std::string_view s) noexcept;

[[nodiscard]] bool is_valid_utf8(std::string_view s) noexcept;

}  // namespace bson::codec::detail
