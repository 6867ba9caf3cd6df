#include "codec/internal.hpp"

#include "bson/core/error.hpp"
#include "core/logger.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <exception>
#include <new>

namespace bson::codec::detail {

bool number_fits_int32(double v) noexcept {
  if (std::floor(v) != v) {
    return false;  // 非整数与 NaN
  }
  if (v < kJsIntMin || v > kJsIntMax) {
    return false;
  }
  return v >= static_cast<double>(kInt32Min) && v <= static_cast<double>(kInt32Max);
}

namespace {

constexpr std::string_view kFunctionPrefix = "function(";

}  // namespace

std::string normalized_function_string(std::string_view source) {
  std::string out(source);
  const auto pos = out.find(kFunctionPrefix);
  if (pos != std::string::npos) {
    out.replace(pos, kFunctionPrefix.size(), "function (");
  }
  return out;
}

std::size_t normalized_function_size(std::string_view source) noexcept {
  return source.find(kFunctionPrefix) != std::string_view::npos ? source.size() + 1 : source.size();
}

std::error_code resolve_custom(const Custom& custom, Value& out) noexcept {
  if (!custom.converter) {
    return make_error_code(errc::unsupported_value);
  }
  try {
    out = custom.converter->to_bson();
  } catch (const std::bad_alloc&) {
    return bson::core::make_error_code(bson::core::errc::out_of_memory);
  } catch (const std::exception& e) {
    bson::core::detail::logger().debug("to_bson() conversion failed: {}", e.what());
    return make_error_code(errc::unsupported_value);
  }
  if (out.holds<Custom>()) {
    return make_error_code(errc::unsupported_value);
  }
  return {};
}

std::string_view index_key(std::size_t index, index_key_buffer& buf) noexcept {
  const auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), index);
  if (ec != std::errc{}) {
    return {};
  }
  return std::string_view{buf.data(), static_cast<std::size_t>(ptr - buf.data())};
}

bool contains_nul(std::string_view s) noexcept {
  return s.find('\0') != std::string_view::npos;
}

// 按 RFC 3629 校验：拒绝过长编码、代理区（U+D800..U+DFFF）与超出 U+10FFFF 的码点。
bool is_valid_utf8(std::string_view s) noexcept {
  const auto* p = reinterpret_cast<const unsigned char*>(s.data());
  const auto n = s.size();
  std::size_t i = 0;
  while (i < n) {
    const unsigned char c = p[i];
    if (c < 0x80) {
      ++i;
      continue;
    }
    std::size_t len = 0;
    std::uint32_t cp = 0;
    if ((c & 0xE0) == 0xC0) {
      len = 2;
      cp = c & 0x1Fu;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      cp = c & 0x0Fu;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      cp = c & 0x07u;
    } else {
      return false;
    }
    if (n - i < len) {
      return false;
    }
    for (std::size_t k = 1; k < len; ++k) {
      const unsigned char cc = p[i + k];
      if ((cc & 0xC0) != 0x80) {
        return false;
      }
      cp = (cp << 6) | (cc & 0x3Fu);
    }
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) {
      return false;
    }
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
      return false;
    }
    i += len;
  }
  return true;
}

}  // namespace bson::codec::detail
