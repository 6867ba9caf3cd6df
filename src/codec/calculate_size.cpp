#include "bson/codec/calculate_size.hpp"

#include "bson/core/error.hpp"
#include "codec/internal.hpp"
#include "core/logger.hpp"

#include <string_view>
#include <type_traits>

namespace bson::codec {
namespace {

using detail::checked_add;

/*
 * 长度计算与 serializer.cpp 的编码遍历保持同构：
 * - 同样的遍历顺序、同样的按类别分支；
 * - element_size() 返回“类型标签 + payload”的字节数，0 表示该元素整体不写出
 *   （此时名称也不计入）。
 */
class SizeCalculator final {
 public:
  explicit SizeCalculator(const SerializeOptions& options) : options_(options) {}

  std::error_code object_size(const Document& doc, std::size_t depth, std::size_t& out) const noexcept {
    if (depth > options_.max_depth) {
      return make_error_code(errc::depth_exceeded);
    }
    std::size_t total = kMinDocumentSize;
    for (const auto& element : doc) {
      std::size_t size = 0;
      auto ec = named_element_size(element.name, element.value, false, depth, size);
      if (ec) {
        return ec;
      }
      if (!checked_add(total, size, total)) {
        return make_error_code(errc::length_overflow);
      }
    }
    out = total;
    return {};
  }

  std::error_code array_size(const Array& array, std::size_t depth, std::size_t& out) const noexcept {
    if (depth > options_.max_depth) {
      return make_error_code(errc::depth_exceeded);
    }
    std::size_t total = kMinDocumentSize;
    detail::index_key_buffer key_buf{};
    for (std::size_t i = 0; i < array.size(); ++i) {
      std::size_t size = 0;
      auto ec = named_element_size(detail::index_key(i, key_buf), array.at(i), true, depth, size);
      if (ec) {
        return ec;
      }
      if (!checked_add(total, size, total)) {
        return make_error_code(errc::length_overflow);
      }
    }
    out = total;
    return {};
  }

  // 名称贡献 = UTF-8 字节数 + 结尾 0x00；元素被跳过时整体为 0。
  std::error_code named_element_size(std::string_view name,
                                     const Value& value,
                                     bool in_array,
                                     std::size_t depth,
                                     std::size_t& out) const noexcept {
    std::size_t size = 0;
    auto ec = element_size(value, in_array, depth, size);
    if (ec) {
      return ec;
    }
    if (size == 0) {
      out = 0;
      return {};
    }
    if (!checked_add(size, name.size() + 1, out)) {
      return make_error_code(errc::length_overflow);
    }
    return {};
  }

  std::error_code element_size(const Value& value, bool in_array, std::size_t depth, std::size_t& out) const noexcept {
    return std::visit(
      [&](const auto& v) -> std::error_code {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Null> || std::is_same_v<T, MinKey> || std::is_same_v<T, MaxKey>) {
          out = 1;
        } else if constexpr (std::is_same_v<T, Undefined>) {
          // 数组槽位永不丢弃，写成 null 以保持下标对齐。
          out = (in_array || !options_.ignore_undefined) ? 1 : 0;
        } else if constexpr (std::is_same_v<T, Boolean>) {
          out = 1 + 1;
        } else if constexpr (std::is_same_v<T, Number>) {
          out = detail::number_fits_int32(v.value) ? 1 + 4 : 1 + 8;
        } else if constexpr (std::is_same_v<T, Int32>) {
          out = 1 + 4;
        } else if constexpr (std::is_same_v<T, Long> || std::is_same_v<T, Double> || std::is_same_v<T, DateTime> ||
                             std::is_same_v<T, Timestamp>) {
          out = 1 + 8;
        } else if constexpr (std::is_same_v<T, String> || std::is_same_v<T, Symbol>) {
          return string_element(v.value.size(), out);
        } else if constexpr (std::is_same_v<T, Document>) {
          return nested(object_size(v, depth + 1, out), out);
        } else if constexpr (std::is_same_v<T, Array>) {
          return nested(array_size(v, depth + 1, out), out);
        } else if constexpr (std::is_same_v<T, Binary>) {
          // int32 长度 + 子类型字节 + payload；旧格式 byte_array 额外带 int32 内层长度。
          std::size_t size = 1 + 4 + 1;
          if (v.subtype == binary_subtype::byte_array) {
            size += 4;
          }
          if (!checked_add(size, v.data.size(), out)) {
            return make_error_code(errc::length_overflow);
          }
        } else if constexpr (std::is_same_v<T, ObjectId>) {
          out = 1 + kObjectIdSize;
        } else if constexpr (std::is_same_v<T, Decimal128>) {
          out = 1 + kDecimal128Size;
        } else if constexpr (std::is_same_v<T, RegExp>) {
          std::size_t size = 0;
          if (!checked_add(1 + v.pattern.size() + 1, v.options.size() + 1, size)) {
            return make_error_code(errc::length_overflow);
          }
          out = size;
        } else if constexpr (std::is_same_v<T, Code>) {
          return code_element(v.code.size(), v.scope, depth, out);
        } else if constexpr (std::is_same_v<T, Function>) {
          if (!options_.serialize_functions) {
            out = 0;
            return {};
          }
          return code_element(detail::normalized_function_size(v.source), v.scope, depth, out);
        } else if constexpr (std::is_same_v<T, DBRef>) {
          return nested(dbref_size(v, depth + 1, out), out);
        } else if constexpr (std::is_same_v<T, Custom>) {
          Value converted;
          auto ec = detail::resolve_custom(v, converted);
          if (ec == bson::core::errc::out_of_memory) {
            return ec;
          }
          if (ec) {
            bson::core::detail::logger().trace("sizing unsupported custom value as 0 bytes: {}", ec.message());
            out = 0;
            return {};
          }
          return element_size(converted, in_array, depth, out);
        } else {
          out = 0;
        }
        return {};
      },
      value.storage());
  }

 private:
  // 类型标签 + int32 长度 + 字节 + 0x00
  static std::error_code string_element(std::size_t length, std::size_t& out) noexcept {
    if (!checked_add(1 + 4 + 1, length, out)) {
      return make_error_code(errc::length_overflow);
    }
    return {};
  }

  // 嵌套文档：类型标签 + 子文档长度。
  static std::error_code nested(std::error_code ec, std::size_t& out) noexcept {
    if (ec) {
      return ec;
    }
    if (!checked_add(1, out, out)) {
      return make_error_code(errc::length_overflow);
    }
    return {};
  }

  /*
   * code：类型标签 + int32 长度 + 源码 + 0x00
   * code_w_scope（scope 非空）：类型标签 + int32 总长 + int32 长度 + 源码 + 0x00 + scope 文档
   */
  std::error_code code_element(std::size_t source_size,
                               const Document& scope,
                               std::size_t depth,
                               std::size_t& out) const noexcept {
    if (scope.empty()) {
      return string_element(source_size, out);
    }
    std::size_t scope_size = 0;
    auto ec = object_size(scope, depth + 1, scope_size);
    if (ec) {
      return ec;
    }
    std::size_t size = 0;
    if (!checked_add(1 + 4 + 4 + 1, source_size, size) || !checked_add(size, scope_size, out)) {
      return make_error_code(errc::length_overflow);
    }
    return {};
  }

  // DBRef 按 { $ref, $id, fields..., $db } 原位计算，不构造中间文档。
  std::error_code dbref_size(const DBRef& ref, std::size_t depth, std::size_t& out) const noexcept {
    if (depth > options_.max_depth) {
      return make_error_code(errc::depth_exceeded);
    }
    std::size_t total = kMinDocumentSize;
    std::size_t size = 0;
    auto ec = named_string_size(detail::kDbRefCollectionKey, ref.collection().size(), size);
    if (ec) {
      return ec;
    }
    if (!checked_add(total, size, total)) {
      return make_error_code(errc::length_overflow);
    }
    ec = named_element_size(detail::kDbRefIdKey, ref.id(), false, depth, size);
    if (ec) {
      return ec;
    }
    if (!checked_add(total, size, total)) {
      return make_error_code(errc::length_overflow);
    }
    for (const auto& field : ref.fields()) {
      ec = named_element_size(field.name, field.value, false, depth, size);
      if (ec) {
        return ec;
      }
      if (!checked_add(total, size, total)) {
        return make_error_code(errc::length_overflow);
      }
    }
    if (ref.db()) {
      ec = named_string_size(detail::kDbRefDbKey, ref.db()->size(), size);
      if (ec) {
        return ec;
      }
      if (!checked_add(total, size, total)) {
        return make_error_code(errc::length_overflow);
      }
    }
    out = total;
    return {};
  }

  static std::error_code named_string_size(std::string_view name, std::size_t length, std::size_t& out) noexcept {
    auto ec = string_element(length, out);
    if (ec) {
      return ec;
    }
    if (!checked_add(out, name.size() + 1, out)) {
      return make_error_code(errc::length_overflow);
    }
    return {};
  }

  const SerializeOptions& options_;
};

}  // namespace

std::error_code calculate_object_size(const Document& doc, const SerializeOptions& options, std::size_t& out_size) noexcept {
  return SizeCalculator(options).object_size(doc, 0, out_size);
}

std::error_code calculate_object_size(const Array& array, const SerializeOptions& options, std::size_t& out_size) noexcept {
  return SizeCalculator(options).array_size(array, 0, out_size);
}

std::error_code calculate_value_size(const Value& value, const SerializeOptions& options, std::size_t& out_size) noexcept {
  return SizeCalculator(options).element_size(value, false, 0, out_size);
}

}  // namespace bson::codec
