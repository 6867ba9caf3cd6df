#include "bson/codec/stream.hpp"

#include "bson/codec/deserializer.hpp"
#include "bson/codec/error.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cstdint>
#include <utility>

namespace bson::codec {
namespace {

std::int32_t read_length_prefix(bytes_view in) noexcept {
  std::uint32_t v = 0;
  for (std::size_t i = 0; i < 4; ++i) {
    v |= static_cast<std::uint32_t>(in[i]) << (8u * i);
  }
  return static_cast<std::int32_t>(v);
}

}  // namespace

DocumentReader::DocumentReader(DeserializeOptions options, std::size_t max_buffered)
    : options_(options), buffer_(std::min(core::kDefaultBufferCapacity, max_buffered), max_buffered) {}

std::error_code DocumentReader::feed(bytes_view chunk) noexcept {
  return buffer_.append(chunk);
}

std::error_code DocumentReader::next(Document& out, bool& ready) noexcept {
  ready = false;
  if (error_) {
    return error_;
  }

  const auto pending = buffer_.readable_bytes();
  if (pending.size() < 4) {
    return {};
  }
  const auto size = read_length_prefix(pending);
  if (size < static_cast<std::int32_t>(kMinDocumentSize)) {
    error_ = make_error_code(errc::invalid_document_size);
  } else if (static_cast<std::size_t>(size) > buffer_.max_capacity()) {
    // 单个文档超过缓存上限，永远等不到完整帧。
    error_ = bson::core::make_error_code(bson::core::errc::buffer_overflow);
  }
  if (error_) {
    bson::core::detail::logger().debug("bson stream framing error: {}", error_.message());
    return error_;
  }
  if (pending.size() < static_cast<std::size_t>(size)) {
    return {};
  }

  Document doc;
  auto ec = deserialize(pending.first(static_cast<std::size_t>(size)), doc, options_);
  if (ec) {
    error_ = ec;
    return ec;
  }
  ec = buffer_.consume(static_cast<std::size_t>(size));
  if (ec) {
    error_ = ec;
    return ec;
  }
  out = std::move(doc);
  ready = true;
  return {};
}

void DocumentReader::reset() noexcept {
  buffer_.clear();
  error_.clear();
}

}  // namespace bson::codec
