#pragma once

#include "bson/codec/error.hpp"
#include "bson/codec/options.hpp"
#include "bson/codec/value.hpp"
#include "bson/core/buffer.hpp"

#include <cstddef>
#include <system_error>

namespace bson::codec {

/**
 * @brief 增量文档读取器：分片喂入字节，逐个取出完整文档。
 *
 * 线上是首尾相接的 BSON 文档（每个文档自带 int32 长度前缀）。
 * 出现帧错误后读取器进入失败状态，之后的 next() 都返回同一错误，直到 reset()。
 *
 * 注意：本类不做线程安全保证。
 */
class DocumentReader final {
 public:
  explicit DocumentReader(DeserializeOptions options = {},
                          std::size_t max_buffered = core::kDefaultBufferMaxCapacity);

  // 追加一段输入；超过 max_buffered 时返回 core::errc::buffer_overflow，已缓存数据不变。
  std::error_code feed(bytes_view chunk) noexcept;

  /**
   * @brief 取出下一个完整文档。
   *
   * - 缓存不足一个完整文档：返回成功且 ready=false
   * - 解码成功：ready=true，out 为文档，对应字节被消费
   * - 帧错误：返回错误，读取器进入失败状态
   */
  std::error_code next(Document& out, bool& ready) noexcept;

  [[nodiscard]] std::size_t buffered() const noexcept { return buffer_.size(); }
  [[nodiscard]] bool failed() const noexcept { return static_cast<bool>(error_); }

  // 丢弃缓存并清除失败状态。
  void reset() noexcept;

 private:
  DeserializeOptions options_;
  core::ByteBuffer buffer_;
  std::error_code error_;
};

}  // namespace bson::codec
