#include "bson/codec/error.hpp"

#include <string>

namespace bson::codec {
namespace {

class bson_codec_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "bson.codec"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::unsupported_value:
        return "unsupported bson value";
      case errc::buffer_overflow:
        return "output buffer overflow";
      case errc::length_overflow:
        return "bson document length overflow";
      case errc::size_mismatch:
        return "written size differs from calculated size";
      case errc::invalid_key:
        return "invalid bson key";
      case errc::invalid_cstring:
        return "cstring must not contain null bytes";
      case errc::truncated:
        return "truncated bson input";
      case errc::invalid_document_size:
        return "invalid bson document size";
      case errc::document_size_mismatch:
        return "buffer length does not match bson document size";
      case errc::missing_terminator:
        return "bson document missing terminator";
      case errc::invalid_element_type:
        return "unrecognized bson element type";
      case errc::invalid_name:
        return "bson element name is not terminated";
      case errc::invalid_string_length:
        return "bad string length in bson";
      case errc::invalid_utf8:
        return "invalid utf-8 string in bson";
      case errc::invalid_binary_length:
        return "invalid bson binary length";
      case errc::invalid_code_w_scope:
        return "invalid bson code_w_scope";
      case errc::invalid_boolean:
        return "illegal bson boolean value";
      case errc::trailing_bytes:
        return "bson document has trailing bytes";
      case errc::depth_exceeded:
        return "bson nesting too deep";
      default:
        return "unknown bson.codec error";
    }
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static bson_codec_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

bool is_format_error(const std::error_code& ec) noexcept {
  if (ec.category() != error_category()) {
    return false;
  }
  const auto v = ec.value();
  return v >= static_cast<int>(errc::truncated) && v <= static_cast<int>(errc::trailing_bytes);
}

}  // namespace bson::codec
