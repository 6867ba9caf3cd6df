#pragma once

#include "bson/codec/error.hpp"
#include "bson/codec/options.hpp"
#include "bson/codec/value.hpp"

#include <cstddef>
#include <system_error>
#include <vector>

namespace bson::codec {

/**
 * @brief 把一个完整的 BSON 文档解码为 Document。
 *
 * 帧校验（任一失败即返回错误，out 不被修改）：
 * - 输入不足 5 字节或声明长度 < 5：errc::invalid_document_size
 * - 声明长度大于输入：errc::truncated
 * - 声明长度小于输入且未开启 allow_object_smaller_than_buffer_size：errc::document_size_mismatch
 * - 文档最后一个字节不是 0x00：errc::missing_terminator
 * - 未知类型标签：errc::invalid_element_type；名称缺少结尾：errc::invalid_name
 * - 字符串/二进制长度越过文档边界：errc::invalid_string_length / errc::invalid_binary_length
 * - 嵌套超过 max_depth：errc::depth_exceeded
 */
std::error_code deserialize(bytes_view in, Document& out, const DeserializeOptions& options = {}) noexcept;

/**
 * @brief 从 start_index 开始连续解码 count 个首尾相接的文档，追加到 out。
 *
 * 成功时 next_index 为最后一个文档之后的下标；失败时 out 保持调用前内容。
 */
std::error_code deserialize_stream(bytes_view in,
                                   std::size_t start_index,
                                   std::size_t count,
                                   std::vector<Document>& out,
                                   std::size_t& next_index,
                                   const DeserializeOptions& options = {}) noexcept;

}  // namespace bson::codec
