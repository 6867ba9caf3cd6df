#pragma once

#include "bson/codec/error.hpp"
#include "bson/codec/types.hpp"

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <type_traits>

namespace bson::codec::detail {

/**
 * @brief 带边界检查的顺序写游标（小端）。
 *
 * 写入位置由游标显式维护；文档长度前缀先写占位，写完后用 patch_i32 回填。
 */
class SpanWriter final {
 public:
  explicit SpanWriter(mutable_bytes_view out) : out_(out) {}

  [[nodiscard]] std::size_t written() const noexcept { return written_; }

  std::error_code write_u8(byte v) noexcept {
    if (written_ >= out_.size()) {
      return make_error_code(errc::buffer_overflow);
    }
    out_[written_++] = v;
    return {};
  }

  std::error_code write_bytes(bytes_view v) noexcept {
    if (v.empty()) {
      return {};
    }
    if (out_.size() - written_ < v.size()) {
      return make_error_code(errc::buffer_overflow);
    }
    std::copy(v.begin(), v.end(), out_.begin() + static_cast<std::ptrdiff_t>(written_));
    written_ += v.size();
    return {};
  }

  template <class UInt>
  std::error_code write_le_uint(UInt v) noexcept {
    static_assert(std::is_unsigned_v<UInt>);
    if (out_.size() - written_ < sizeof(UInt)) {
      return make_error_code(errc::buffer_overflow);
    }
    for (std::size_t i = 0; i < sizeof(UInt); ++i) {
      out_[written_ + i] = static_cast<byte>((v >> (8u * i)) & 0xFFu);
    }
    written_ += sizeof(UInt);
    return {};
  }

  std::error_code write_i32(std::int32_t v) noexcept { return write_le_uint(static_cast<std::uint32_t>(v)); }
  std::error_code write_i64(std::int64_t v) noexcept { return write_le_uint(static_cast<std::uint64_t>(v)); }
  std::error_code write_f64(double v) noexcept { return write_le_uint(std::bit_cast<std::uint64_t>(v)); }

  // 名称/正则等 cstring：调用方负责保证内容不含 0x00。
  std::error_code write_cstring(std::string_view s) noexcept {
    auto ec = write_bytes(bytes_view{reinterpret_cast<const byte*>(s.data()), s.size()});
    if (ec) {
      return ec;
    }
    return write_u8(0x00);
  }

  // string：int32 长度（含结尾 0x00）+ UTF-8 字节 + 0x00。
  std::error_code write_string(std::string_view s) noexcept {
    if (s.size() + 1 > kMaxDocumentSize) {
      return make_error_code(errc::length_overflow);
    }
    auto ec = write_i32(static_cast<std::int32_t>(s.size() + 1));
    if (ec) {
      return ec;
    }
    return write_cstring(s);
  }

  // 回填已写入位置上的 int32（长度前缀）。
  std::error_code patch_i32(std::size_t pos, std::int32_t v) noexcept {
    if (pos > written_ || written_ - pos < sizeof(std::int32_t)) {
      return make_error_code(errc::buffer_overflow);
    }
    const auto bits = static_cast<std::uint32_t>(v);
    for (std::size_t i = 0; i < sizeof(std::uint32_t); ++i) {
      out_[pos + i] = static_cast<byte>((bits >> (8u * i)) & 0xFFu);
    }
    return {};
  }

 private:
  mutable_bytes_view out_{};
  std::size_t written_{0};
};

/**
 * @brief 顺序读游标（小端），读越界返回 errc::truncated。
 */
class SpanReader final {
 public:
  explicit SpanReader(bytes_view in) : in_(in) {}

  [[nodiscard]] std::size_t remaining() const noexcept { return in_.size() - pos_; }
  [[nodiscard]] std::size_t consumed() const noexcept { return pos_; }
  [[nodiscard]] bool empty() const noexcept { return remaining() == 0; }

  // 不移动游标，查看剩余输入。
  [[nodiscard]] bytes_view rest() const noexcept { return in_.subspan(pos_); }

  std::error_code read_u8(byte& out) noexcept {
    if (pos_ >= in_.size()) {
      return make_error_code(errc::truncated);
    }
    out = in_[pos_++];
    return {};
  }

  template <class UInt>
  std::error_code read_le_uint(UInt& out) noexcept {
    static_assert(std::is_unsigned_v<UInt>);
    if (remaining() < sizeof(UInt)) {
      return make_error_code(errc::truncated);
    }
    UInt v = 0;
    for (std::size_t i = 0; i < sizeof(UInt); ++i) {
      v = static_cast<UInt>(v | (static_cast<UInt>(in_[pos_ + i]) << (8u * i)));
    }
    pos_ += sizeof(UInt);
    out = v;
    return {};
  }

  std::error_code read_i32(std::int32_t& out) noexcept {
    std::uint32_t bits = 0;
    auto ec = read_le_uint(bits);
    if (!ec) {
      out = std::bit_cast<std::int32_t>(bits);
    }
    return ec;
  }

  std::error_code read_i64(std::int64_t& out) noexcept {
    std::uint64_t bits = 0;
    auto ec = read_le_uint(bits);
    if (!ec) {
      out = std::bit_cast<std::int64_t>(bits);
    }
    return ec;
  }

  std::error_code read_f64(double& out) noexcept {
    std::uint64_t bits = 0;
    auto ec = read_le_uint(bits);
    if (!ec) {
      out = std::bit_cast<double>(bits);
    }
    return ec;
  }

  std::error_code read_bytes(std::size_t n, bytes_view& out) noexcept {
    if (remaining() < n) {
      return make_error_code(errc::truncated);
    }
    out = in_.subspan(pos_, n);
    pos_ += n;
    return {};
  }

  // 读取以 0x00 结尾的字节串（不含结尾）；找不到结尾返回 errc::truncated。
  std::error_code read_cstring(std::string_view& out) noexcept {
    const auto rest_bytes = rest();
    const auto it = std::find(rest_bytes.begin(), rest_bytes.end(), byte{0x00});
    if (it == rest_bytes.end()) {
      return make_error_code(errc::truncated);
    }
    const auto n = static_cast<std::size_t>(it - rest_bytes.begin());
    out = std::string_view{reinterpret_cast<const char*>(rest_bytes.data()), n};
    pos_ += n + 1;
    return {};
  }

 private:
  bytes_view in_{};
  std::size_t pos_{0};
};

}  // namespace bson::codec::detail
