#pragma once

#include "bson/codec/error.hpp"
#include "bson/codec/options.hpp"
#include "bson/codec/value.hpp"

#include <cstddef>
#include <system_error>

namespace bson::codec {

/**
 * @brief 计算文档编码后的字节数（含 int32 长度前缀与结尾 0x00），不分配输出。
 *
 * 与 serialize() 使用同一选项时，结果等于实际写出的字节数。
 *
 * 宽松策略：
 * - 不支持的值（Custom 转换失败等）贡献 0 字节，不报错；
 * - 仅在嵌套超过 options.max_depth（errc::depth_exceeded）
 *   或总长度超过 int32 上限（errc::length_overflow）时失败。
 */
std::error_code calculate_object_size(const Document& doc, const SerializeOptions& options, std::size_t& out_size) noexcept;

// 数组按 "0"、"1"... 为键的文档计算。
std::error_code calculate_object_size(const Array& array, const SerializeOptions& options, std::size_t& out_size) noexcept;

/**
 * @brief 计算单个无名元素的字节数（类型标签 + payload，名称贡献为 0）。
 *
 * 被跳过的值（未开启 serialize_functions 的 Function、不支持的值）返回 0。
 */
std::error_code calculate_value_size(const Value& value, const SerializeOptions& options, std::size_t& out_size) noexcept;

}  // namespace bson::codec
