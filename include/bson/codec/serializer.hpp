#pragma once

#include "bson/codec/error.hpp"
#include "bson/codec/options.hpp"
#include "bson/codec/value.hpp"

#include <cstddef>
#include <system_error>
#include <vector>

namespace bson::codec {

/**
 * @brief 序列化文档并追加到 out。
 *
 * 先用 calculate_object_size() 计算长度，一次性 resize，再写入；
 * 失败时 out 恢复为调用前的长度。
 */
std::error_code serialize(const Document& doc, std::vector<byte>& out, const SerializeOptions& options = {}) noexcept;
std::error_code serialize(const Array& array, std::vector<byte>& out, const SerializeOptions& options = {}) noexcept;

/**
 * @brief 序列化到调用方提供的缓冲区。
 *
 * 注意：
 * - out 过小返回 errc::buffer_overflow
 * - 不支持的值（Custom 转换失败）返回 errc::unsupported_value
 * - 成功时 written 为写入字节数
 */
std::error_code serialize_into(mutable_bytes_view out,
                               const Document& doc,
                               std::size_t& written,
                               const SerializeOptions& options = {}) noexcept;
std::error_code serialize_into(mutable_bytes_view out,
                               const Array& array,
                               std::size_t& written,
                               const SerializeOptions& options = {}) noexcept;

/**
 * @brief 从 start_index 开始写入 out，end_index 为最后一个写入字节的下标。
 */
std::error_code serialize_with_buffer_and_index(const Document& doc,
                                                mutable_bytes_view out,
                                                std::size_t start_index,
                                                std::size_t& end_index,
                                                const SerializeOptions& options = {}) noexcept;
std::error_code serialize_with_buffer_and_index(const Array& array,
                                                mutable_bytes_view out,
                                                std::size_t start_index,
                                                std::size_t& end_index,
                                                const SerializeOptions& options = {}) noexcept;

}  // namespace bson::codec
