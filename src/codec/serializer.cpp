#include "bson/codec/serializer.hpp"

#include "bson/codec/calculate_size.hpp"
#include "bson/core/error.hpp"
#include "codec/internal.hpp"
#include "codec/span_io.hpp"
#include "core/logger.hpp"

#include <limits>
#include <new>
#include <string>
#include <type_traits>

namespace bson::codec {
namespace {

using detail::SpanWriter;

class Serializer final {
 public:
  Serializer(const SerializeOptions& options, SpanWriter& w) : options_(options), w_(w) {}

  // int32 长度占位 -> 元素 -> 0x00 -> 回填长度。
  std::error_code write_document(const Document& doc, std::size_t depth) noexcept {
    if (depth > options_.max_depth) {
      return make_error_code(errc::depth_exceeded);
    }
    const auto start = w_.written();
    auto ec = w_.write_i32(0);
    if (ec) {
      return ec;
    }
    for (const auto& element : doc) {
      ec = check_key(element.name);
      if (ec) {
        return ec;
      }
      ec = write_element(element.name, element.value, false, depth);
      if (ec) {
        return ec;
      }
    }
    return finish_document(start);
  }

  std::error_code write_array(const Array& array, std::size_t depth) noexcept {
    if (depth > options_.max_depth) {
      return make_error_code(errc::depth_exceeded);
    }
    const auto start = w_.written();
    auto ec = w_.write_i32(0);
    if (ec) {
      return ec;
    }
    detail::index_key_buffer key_buf{};
    for (std::size_t i = 0; i < array.size(); ++i) {
      ec = write_element(detail::index_key(i, key_buf), array.at(i), true, depth);
      if (ec) {
        return ec;
      }
    }
    return finish_document(start);
  }

 private:
  std::error_code finish_document(std::size_t start) noexcept {
    auto ec = w_.write_u8(0x00);
    if (ec) {
      return ec;
    }
    const auto size = w_.written() - start;
    if (size > kMaxDocumentSize) {
      return make_error_code(errc::length_overflow);
    }
    return w_.patch_i32(start, static_cast<std::int32_t>(size));
  }

  std::error_code check_key(std::string_view name) const noexcept {
    if (detail::contains_nul(name)) {
      return make_error_code(errc::invalid_key);
    }
    if (!options_.check_keys) {
      return {};
    }
    if (!name.empty() && name.front() == '$') {
      return make_error_code(errc::invalid_key);
    }
    if (name.find('.') != std::string_view::npos) {
      return make_error_code(errc::invalid_key);
    }
    return {};
  }

  std::error_code write_header(element_type type, std::string_view name) noexcept {
    auto ec = w_.write_u8(static_cast<byte>(type));
    if (ec) {
      return ec;
    }
    return w_.write_cstring(name);
  }

  std::error_code write_element(std::string_view name, const Value& value, bool in_array, std::size_t depth) noexcept {
    return std::visit(
      [&](const auto& v) -> std::error_code {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Null>) {
          return write_header(element_type::null, name);
        } else if constexpr (std::is_same_v<T, Undefined>) {
          if (!in_array && options_.ignore_undefined) {
            return {};
          }
          return write_header(element_type::null, name);
        } else if constexpr (std::is_same_v<T, MinKey>) {
          return write_header(element_type::min_key, name);
        } else if constexpr (std::is_same_v<T, MaxKey>) {
          return write_header(element_type::max_key, name);
        } else if constexpr (std::is_same_v<T, Boolean>) {
          auto ec = write_header(element_type::boolean, name);
          if (ec) {
            return ec;
          }
          return w_.write_u8(static_cast<byte>(v.value ? 0x01 : 0x00));
        } else if constexpr (std::is_same_v<T, Number>) {
          return write_number(name, v.value);
        } else if constexpr (std::is_same_v<T, Int32>) {
          auto ec = write_header(element_type::int32, name);
          if (ec) {
            return ec;
          }
          return w_.write_i32(v.value);
        } else if constexpr (std::is_same_v<T, Long>) {
          auto ec = write_header(element_type::int64, name);
          if (ec) {
            return ec;
          }
          return w_.write_i64(v.value);
        } else if constexpr (std::is_same_v<T, Double>) {
          auto ec = write_header(element_type::double_, name);
          if (ec) {
            return ec;
          }
          return w_.write_f64(v.value);
        } else if constexpr (std::is_same_v<T, DateTime>) {
          auto ec = write_header(element_type::datetime, name);
          if (ec) {
            return ec;
          }
          return w_.write_i64(v.millis);
        } else if constexpr (std::is_same_v<T, Timestamp>) {
          auto ec = write_header(element_type::timestamp, name);
          if (ec) {
            return ec;
          }
          ec = w_.write_le_uint<std::uint32_t>(v.increment);
          if (ec) {
            return ec;
          }
          return w_.write_le_uint<std::uint32_t>(v.time);
        } else if constexpr (std::is_same_v<T, String>) {
          auto ec = write_header(element_type::string, name);
          if (ec) {
            return ec;
          }
          return w_.write_string(v.value);
        } else if constexpr (std::is_same_v<T, Symbol>) {
          auto ec = write_header(element_type::symbol, name);
          if (ec) {
            return ec;
          }
          return w_.write_string(v.value);
        } else if constexpr (std::is_same_v<T, Document>) {
          auto ec = write_header(element_type::document, name);
          if (ec) {
            return ec;
          }
          return write_document(v, depth + 1);
        } else if constexpr (std::is_same_v<T, Array>) {
          auto ec = write_header(element_type::array, name);
          if (ec) {
            return ec;
          }
          return write_array(v, depth + 1);
        } else if constexpr (std::is_same_v<T, Binary>) {
          return write_binary(name, v);
        } else if constexpr (std::is_same_v<T, ObjectId>) {
          auto ec = write_header(element_type::object_id, name);
          if (ec) {
            return ec;
          }
          return w_.write_bytes(bytes_view{v.bytes.data(), v.bytes.size()});
        } else if constexpr (std::is_same_v<T, Decimal128>) {
          auto ec = write_header(element_type::decimal128, name);
          if (ec) {
            return ec;
          }
          return w_.write_bytes(bytes_view{v.bytes.data(), v.bytes.size()});
        } else if constexpr (std::is_same_v<T, RegExp>) {
          if (detail::contains_nul(v.pattern) || detail::contains_nul(v.options)) {
            return make_error_code(errc::invalid_cstring);
          }
          auto ec = write_header(element_type::regex, name);
          if (ec) {
            return ec;
          }
          ec = w_.write_cstring(v.pattern);
          if (ec) {
            return ec;
          }
          return w_.write_cstring(v.options);
        } else if constexpr (std::is_same_v<T, Code>) {
          return write_code(name, v.code, v.scope, depth);
        } else if constexpr (std::is_same_v<T, Function>) {
          if (!options_.serialize_functions) {
            return {};
          }
          std::string source;
          try {
            source = detail::normalized_function_string(v.source);
          } catch (const std::bad_alloc&) {
            return bson::core::make_error_code(bson::core::errc::out_of_memory);
          }
          return write_code(name, source, v.scope, depth);
        } else if constexpr (std::is_same_v<T, DBRef>) {
          auto ec = write_header(element_type::document, name);
          if (ec) {
            return ec;
          }
          return write_dbref(v, depth + 1);
        } else if constexpr (std::is_same_v<T, Custom>) {
          Value converted;
          auto ec = detail::resolve_custom(v, converted);
          if (ec) {
            return ec;
          }
          return write_element(name, converted, in_array, depth);
        } else {
          return make_error_code(errc::unsupported_value);
        }
      },
      value.storage());
  }

  // 与 SizeCalculator 使用同一宽度规则。
  std::error_code write_number(std::string_view name, double value) noexcept {
    if (detail::number_fits_int32(value)) {
      auto ec = write_header(element_type::int32, name);
      if (ec) {
        return ec;
      }
      return w_.write_i32(static_cast<std::int32_t>(value));
    }
    auto ec = write_header(element_type::double_, name);
    if (ec) {
      return ec;
    }
    return w_.write_f64(value);
  }

  std::error_code write_binary(std::string_view name, const Binary& v) noexcept {
    const bool legacy = v.subtype == binary_subtype::byte_array;
    const auto total = v.data.size() + (legacy ? 4u : 0u);
    if (total > kMaxDocumentSize) {
      return make_error_code(errc::length_overflow);
    }
    auto ec = write_header(element_type::binary, name);
    if (ec) {
      return ec;
    }
    ec = w_.write_i32(static_cast<std::int32_t>(total));
    if (ec) {
      return ec;
    }
    ec = w_.write_u8(static_cast<byte>(v.subtype));
    if (ec) {
      return ec;
    }
    if (legacy) {
      ec = w_.write_i32(static_cast<std::int32_t>(v.data.size()));
      if (ec) {
        return ec;
      }
    }
    return w_.write_bytes(bytes_view{v.data.data(), v.data.size()});
  }

  std::error_code write_code(std::string_view name, std::string_view source, const Document& scope, std::size_t depth) noexcept {
    if (scope.empty()) {
      auto ec = write_header(element_type::code, name);
      if (ec) {
        return ec;
      }
      return w_.write_string(source);
    }

    auto ec = write_header(element_type::code_w_scope, name);
    if (ec) {
      return ec;
    }
    const auto start = w_.written();
    ec = w_.write_i32(0);
    if (ec) {
      return ec;
    }
    ec = w_.write_string(source);
    if (ec) {
      return ec;
    }
    ec = write_document(scope, depth + 1);
    if (ec) {
      return ec;
    }
    const auto total = w_.written() - start;
    if (total > kMaxDocumentSize) {
      return make_error_code(errc::length_overflow);
    }
    return w_.patch_i32(start, static_cast<std::int32_t>(total));
  }

  // { $ref, $id, fields..., $db }；保留键不受 check_keys 约束，附加字段照常校验。
  std::error_code write_dbref(const DBRef& ref, std::size_t depth) noexcept {
    if (depth > options_.max_depth) {
      return make_error_code(errc::depth_exceeded);
    }
    const auto start = w_.written();
    auto ec = w_.write_i32(0);
    if (!ec) {
      ec = write_header(element_type::string, detail::kDbRefCollectionKey);
    }
    if (!ec) {
      ec = w_.write_string(ref.collection());
    }
    if (!ec) {
      ec = write_element(detail::kDbRefIdKey, ref.id(), false, depth);
    }
    if (ec) {
      return ec;
    }
    for (const auto& field : ref.fields()) {
      ec = check_key(field.name);
      if (ec) {
        return ec;
      }
      ec = write_element(field.name, field.value, false, depth);
      if (ec) {
        return ec;
      }
    }
    if (ref.db()) {
      ec = write_header(element_type::string, detail::kDbRefDbKey);
      if (!ec) {
        ec = w_.write_string(*ref.db());
      }
      if (ec) {
        return ec;
      }
    }
    return finish_document(start);
  }

  const SerializeOptions& options_;
  SpanWriter& w_;
};

template <class Root>
std::error_code write_root(const Root& root, SpanWriter& w, const SerializeOptions& options) noexcept {
  Serializer s(options, w);
  if constexpr (std::is_same_v<Root, Array>) {
    return s.write_array(root, 0);
  } else {
    return s.write_document(root, 0);
  }
}

template <class Root>
std::error_code serialize_into_impl(mutable_bytes_view out,
                                    const Root& root,
                                    std::size_t& written,
                                    const SerializeOptions& options) noexcept {
  SpanWriter w(out);
  auto ec = write_root(root, w, options);
  written = w.written();
  return ec;
}

template <class Root>
std::error_code serialize_impl(const Root& root, std::vector<byte>& out, const SerializeOptions& options) noexcept {
  std::size_t size = 0;
  auto ec = calculate_object_size(root, options, size);
  if (ec) {
    return ec;
  }

  const auto offset = out.size();
  if (size > (std::numeric_limits<std::size_t>::max() - offset)) {
    return make_error_code(errc::length_overflow);
  }

  try {
    out.resize(offset + size);
  } catch (const std::bad_alloc&) {
    return bson::core::make_error_code(bson::core::errc::out_of_memory);
  }
  mutable_bytes_view dest{out.data() + offset, size};

  std::size_t written = 0;
  ec = serialize_into_impl(dest, root, written, options);
  if (ec) {
    out.resize(offset);
    return ec;
  }
  if (written != size) {
    bson::core::detail::logger().error("bson serializer wrote {} bytes, calculated {}", written, size);
    out.resize(offset);
    return make_error_code(errc::size_mismatch);
  }
  return {};
}

template <class Root>
std::error_code serialize_with_index_impl(const Root& root,
                                          mutable_bytes_view out,
                                          std::size_t start_index,
                                          std::size_t& end_index,
                                          const SerializeOptions& options) noexcept {
  if (start_index > out.size()) {
    return make_error_code(errc::buffer_overflow);
  }
  std::size_t written = 0;
  auto ec = serialize_into_impl(out.subspan(start_index), root, written, options);
  if (ec) {
    return ec;
  }
  end_index = start_index + written - 1;
  return {};
}

}  // namespace

std::error_code serialize(const Document& doc, std::vector<byte>& out, const SerializeOptions& options) noexcept {
  return serialize_impl(doc, out, options);
}

std::error_code serialize(const Array& array, std::vector<byte>& out, const SerializeOptions& options) noexcept {
  return serialize_impl(array, out, options);
}

std::error_code serialize_into(mutable_bytes_view out,
                               const Document& doc,
                               std::size_t& written,
                               const SerializeOptions& options) noexcept {
  return serialize_into_impl(out, doc, written, options);
}

std::error_code serialize_into(mutable_bytes_view out,
                               const Array& array,
                               std::size_t& written,
                               const SerializeOptions& options) noexcept {
  return serialize_into_impl(out, array, written, options);
}

std::error_code serialize_with_buffer_and_index(const Document& doc,
                                                mutable_bytes_view out,
                                                std::size_t start_index,
                                                std::size_t& end_index,
                                                const SerializeOptions& options) noexcept {
  return serialize_with_index_impl(doc, out, start_index, end_index, options);
}

std::error_code serialize_with_buffer_and_index(const Array& array,
                                                mutable_bytes_view out,
                                                std::size_t start_index,
                                                std::size_t& end_index,
                                                const SerializeOptions& options) noexcept {
  return serialize_with_index_impl(array, out, start_index, end_index, options);
}

}  // namespace bson::codec
