#pragma once

#include "bson/core/common.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace bson::codec {

using byte = bson::core::byte;
using bytes_view = bson::core::bytes_view;
using mutable_bytes_view = bson::core::mutable_bytes_view;

/**
 * @brief BSON 元素类型标签（每个元素帧的第一个字节）。
 *
 * 编码器写出的标签与解码器识别的标签都以此表为准。
 * db_pointer 已废弃，仅在解码时识别（转换为 DBRef）。
 */
enum class element_type : std::uint8_t {
  double_ = 0x01,
  string = 0x02,
  document = 0x03,
  array = 0x04,
  binary = 0x05,
  undefined = 0x06,
  object_id = 0x07,
  boolean = 0x08,
  datetime = 0x09,
  null = 0x0A,
  regex = 0x0B,
  db_pointer = 0x0C,
  code = 0x0D,
  symbol = 0x0E,
  code_w_scope = 0x0F,
  int32 = 0x10,
  timestamp = 0x11,
  int64 = 0x12,
  decimal128 = 0x13,
  min_key = 0xFF,
  max_key = 0x7F,
};

/**
 * @brief Binary 元素的子类型字节。
 *
 * byte_array（0x02）为旧格式：payload 前还有一个 int32 内层长度。
 */
enum class binary_subtype : std::uint8_t {
  generic = 0x00,
  function = 0x01,
  byte_array = 0x02,
  uuid_old = 0x03,
  uuid = 0x04,
  md5 = 0x05,
  encrypted = 0x06,
  column = 0x07,
  user_defined = 0x80,
};

inline constexpr std::int32_t kInt32Max = 0x7FFF'FFFF;
inline constexpr std::int32_t kInt32Min = -kInt32Max - 1;

// 双精度浮点可精确表示的整数范围 [-2^53, 2^53]。
inline constexpr double kJsIntMax = 9007199254740992.0;
inline constexpr double kJsIntMin = -9007199254740992.0;

inline constexpr std::size_t kObjectIdSize = 12;
inline constexpr std::size_t kDecimal128Size = 16;

// 最小文档：int32 长度 + 结尾 0x00。
inline constexpr std::size_t kMinDocumentSize = 5;
inline constexpr std::size_t kMaxDocumentSize = static_cast<std::size_t>(kInt32Max);

// 默认嵌套深度上限：顶层文档为深度 0。
inline constexpr std::size_t kDefaultMaxDepth = 100;

[[nodiscard]] std::optional<element_type> element_type_from_byte(std::uint8_t b) noexcept;
[[nodiscard]] std::string_view element_type_name(element_type type) noexcept;

}  // namespace bson::codec
