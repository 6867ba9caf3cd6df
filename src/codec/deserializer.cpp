#include "bson/codec/deserializer.hpp"

#include "bson/core/error.hpp"
#include "codec/internal.hpp"
#include "codec/span_io.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <iterator>
#include <new>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bson::codec {
namespace {

using detail::SpanReader;

std::int32_t peek_i32(bytes_view in) noexcept {
  std::uint32_t v = 0;
  for (std::size_t i = 0; i < 4; ++i) {
    v |= static_cast<std::uint32_t>(in[i]) << (8u * i);
  }
  return static_cast<std::int32_t>(v);
}

/**
 * @brief 判断文档是否应提升为 DBRef。
 *
 * 条件：至少一个以 '$' 开头的键，且所有 '$' 键都属于 $ref/$id/$db；
 * $ref 为字符串、存在 $id、$db（若有）为字符串。
 */
bool is_dbref_like(const Document& doc) noexcept {
  bool has_dollar_key = false;
  for (const auto& element : doc) {
    if (element.name.empty() || element.name.front() != '$') {
      continue;
    }
    if (element.name != "$ref" && element.name != "$id" && element.name != "$db") {
      return false;
    }
    has_dollar_key = true;
  }
  if (!has_dollar_key) {
    return false;
  }
  const auto* ref = doc.find("$ref");
  const auto* id = doc.find("$id");
  const auto* db = doc.find("$db");
  if (ref == nullptr || !ref->holds<String>() || id == nullptr) {
    return false;
  }
  return db == nullptr || db->holds<String>();
}

Value make_dbref(const Document& doc) {
  std::optional<std::string> db;
  if (const auto* v = doc.find("$db")) {
    db = v->get_if<String>()->value;
  }
  Document::container_type fields;
  fields.reserve(doc.size());
  for (const auto& element : doc) {
    if (element.name == "$ref" || element.name == "$id" || element.name == "$db") {
      continue;
    }
    fields.push_back(element);
  }
  return Value::dbref(doc.find("$ref")->get_if<String>()->value, *doc.find("$id"), std::move(db),
                      Document(std::move(fields)));
}

class Deserializer final {
 public:
  explicit Deserializer(const DeserializeOptions& options) : options_(options) {}

  std::error_code read_document(bytes_view doc_bytes, std::size_t depth, Document& out) const {
    Document::container_type elements;
    auto ec = read_elements(doc_bytes, depth, [&](std::string_view name, Value&& value) {
      elements.push_back(Element{std::string(name), std::move(value)});
    });
    if (ec) {
      return ec;
    }
    // 重复键：后出现者覆盖，位置保持首次出现处。
    out = Document(std::move(elements));
    return {};
  }

  // 数组按出现顺序取值，键名不参与。
  std::error_code read_array(bytes_view doc_bytes, std::size_t depth, Array& out) const {
    std::vector<Value> values;
    auto ec = read_elements(doc_bytes, depth, [&](std::string_view, Value&& value) {
      values.push_back(std::move(value));
    });
    if (ec) {
      return ec;
    }
    out = Array(std::move(values));
    return {};
  }

  /*
   * doc_bytes 恰好覆盖一个文档（int32 长度 .. 0x00），长度与结尾已由调用方校验。
   * 元素区为 [4, size - 1)；读到元素区末尾即结束，元素区内出现 0x00 类型字节说明
   * 声明长度与内容不一致。每个元素解码后交给 sink(name, value)。
   */
  template <class Sink>
  std::error_code read_elements(bytes_view doc_bytes, std::size_t depth, Sink&& sink) const {
    if (depth > options_.max_depth) {
      return make_error_code(errc::depth_exceeded);
    }
    SpanReader r(doc_bytes.subspan(4, doc_bytes.size() - kMinDocumentSize));
    while (!r.empty()) {
      byte tag = 0;
      auto ec = r.read_u8(tag);
      if (ec) {
        return ec;
      }
      if (tag == 0x00) {
        return make_error_code(errc::trailing_bytes);
      }
      const auto type = element_type_from_byte(tag);
      if (!type) {
        return make_error_code(errc::invalid_element_type);
      }
      std::string_view name;
      ec = r.read_cstring(name);
      if (ec) {
        return make_error_code(errc::invalid_name);
      }
      if (options_.validate_utf8 && !detail::is_valid_utf8(name)) {
        return make_error_code(errc::invalid_utf8);
      }
      Value value;
      ec = read_value(*type, r, depth, value);
      if (ec) {
        return ec;
      }
      sink(name, std::move(value));
    }
    return {};
  }

  std::error_code read_value(element_type type, SpanReader& r, std::size_t depth, Value& out) const {
    switch (type) {
      case element_type::double_: {
        double v = 0.0;
        auto ec = r.read_f64(v);
        if (ec) {
          return ec;
        }
        out = options_.promote_values ? Value::number(v) : Value::float64(v);
        return {};
      }
      case element_type::string:
      case element_type::code:
      case element_type::symbol: {
        std::string s;
        auto ec = read_string(r, s);
        if (ec) {
          return ec;
        }
        if (type == element_type::string) {
          out = Value::string(std::move(s));
        } else if (type == element_type::code) {
          out = Value::code(std::move(s));
        } else {
          out = Value::symbol(std::move(s));
        }
        return {};
      }
      case element_type::document: {
        bytes_view doc_bytes;
        Document doc;
        auto ec = read_embedded(r, doc_bytes);
        if (!ec) {
          ec = read_document(doc_bytes, depth + 1, doc);
        }
        if (ec) {
          return ec;
        }
        out = is_dbref_like(doc) ? make_dbref(doc) : Value::document(std::move(doc));
        return {};
      }
      case element_type::array: {
        bytes_view doc_bytes;
        Array array;
        auto ec = read_embedded(r, doc_bytes);
        if (!ec) {
          ec = read_array(doc_bytes, depth + 1, array);
        }
        if (ec) {
          return ec;
        }
        out = Value::array(std::move(array));
        return {};
      }
      case element_type::binary:
        return read_binary(r, out);
      case element_type::undefined:
        out = Value::undefined();
        return {};
      case element_type::object_id: {
        std::array<byte, kObjectIdSize> oid{};
        auto ec = read_fixed(r, oid);
        if (ec) {
          return ec;
        }
        out = Value::object_id(oid);
        return {};
      }
      case element_type::boolean: {
        byte b = 0;
        auto ec = r.read_u8(b);
        if (ec) {
          return ec;
        }
        if (b != 0x00 && b != 0x01) {
          return make_error_code(errc::invalid_boolean);
        }
        out = Value::boolean(b == 0x01);
        return {};
      }
      case element_type::datetime: {
        std::int64_t v = 0;
        auto ec = r.read_i64(v);
        if (ec) {
          return ec;
        }
        out = Value::datetime(v);
        return {};
      }
      case element_type::null:
        out = Value::null();
        return {};
      case element_type::regex: {
        std::string_view pattern;
        std::string_view opts;
        auto ec = r.read_cstring(pattern);
        if (!ec) {
          ec = r.read_cstring(opts);
        }
        if (ec) {
          return ec;
        }
        if (options_.validate_utf8 && (!detail::is_valid_utf8(pattern) || !detail::is_valid_utf8(opts))) {
          return make_error_code(errc::invalid_utf8);
        }
        out = Value::regexp(std::string(pattern), std::string(opts));
        return {};
      }
      case element_type::db_pointer: {
        // 已废弃：namespace 字符串 + 12 字节 ObjectId，转换为不带 db 的 DBRef。
        std::string ns;
        auto ec = read_string(r, ns);
        if (ec) {
          return ec;
        }
        std::array<byte, kObjectIdSize> oid{};
        ec = read_fixed(r, oid);
        if (ec) {
          return ec;
        }
        out = Value::dbref(std::move(ns), Value::object_id(oid));
        return {};
      }
      case element_type::code_w_scope:
        return read_code_w_scope(r, depth, out);
      case element_type::int32: {
        std::int32_t v = 0;
        auto ec = r.read_i32(v);
        if (ec) {
          return ec;
        }
        out = options_.promote_values ? Value::number(static_cast<double>(v)) : Value::int32(v);
        return {};
      }
      case element_type::timestamp: {
        std::uint32_t increment = 0;
        std::uint32_t time = 0;
        auto ec = r.read_le_uint(increment);
        if (!ec) {
          ec = r.read_le_uint(time);
        }
        if (ec) {
          return ec;
        }
        out = Value::timestamp(increment, time);
        return {};
      }
      case element_type::int64: {
        std::int64_t v = 0;
        auto ec = r.read_i64(v);
        if (ec) {
          return ec;
        }
        // 按整数比较：2^53 + 1 转成 double 会舍入进范围内。
        constexpr auto kSafeLimit = static_cast<std::int64_t>(kJsIntMax);
        if (options_.promote_longs && v >= -kSafeLimit && v <= kSafeLimit) {
          out = Value::number(static_cast<double>(v));
        } else {
          out = Value::int64(v);
        }
        return {};
      }
      case element_type::decimal128: {
        std::array<byte, kDecimal128Size> bytes{};
        auto ec = read_fixed(r, bytes);
        if (ec) {
          return ec;
        }
        out = Value::decimal128(bytes);
        return {};
      }
      case element_type::min_key:
        out = Value::min_key();
        return {};
      case element_type::max_key:
        out = Value::max_key();
        return {};
    }
    return make_error_code(errc::invalid_element_type);
  }

 private:
  template <std::size_t N>
  static std::error_code read_fixed(SpanReader& r, std::array<byte, N>& out) noexcept {
    bytes_view raw;
    auto ec = r.read_bytes(N, raw);
    if (ec) {
      return ec;
    }
    std::copy(raw.begin(), raw.end(), out.begin());
    return {};
  }

  // int32 长度（含结尾 0x00）+ 字节 + 0x00；长度必须落在剩余输入内。
  std::error_code read_string(SpanReader& r, std::string& out) const {
    std::int32_t length = 0;
    auto ec = r.read_i32(length);
    if (ec) {
      return ec;
    }
    if (length <= 0 || static_cast<std::size_t>(length) > r.remaining()) {
      return make_error_code(errc::invalid_string_length);
    }
    bytes_view raw;
    ec = r.read_bytes(static_cast<std::size_t>(length), raw);
    if (ec) {
      return ec;
    }
    if (raw.back() != 0x00) {
      return make_error_code(errc::invalid_string_length);
    }
    const std::string_view s{reinterpret_cast<const char*>(raw.data()), raw.size() - 1};
    if (options_.validate_utf8 && !detail::is_valid_utf8(s)) {
      return make_error_code(errc::invalid_utf8);
    }
    out.assign(s);
    return {};
  }

  // 嵌入文档/数组的帧：校验长度与结尾，doc_bytes 覆盖整个子文档。
  static std::error_code read_embedded(SpanReader& r, bytes_view& doc_bytes) noexcept {
    if (r.remaining() < 4) {
      return make_error_code(errc::truncated);
    }
    const auto size = peek_i32(r.rest());
    if (size < static_cast<std::int32_t>(kMinDocumentSize)) {
      return make_error_code(errc::invalid_document_size);
    }
    if (static_cast<std::size_t>(size) > r.remaining()) {
      return make_error_code(errc::truncated);
    }
    auto ec = r.read_bytes(static_cast<std::size_t>(size), doc_bytes);
    if (ec) {
      return ec;
    }
    if (doc_bytes.back() != 0x00) {
      return make_error_code(errc::missing_terminator);
    }
    return {};
  }

  std::error_code read_binary(SpanReader& r, Value& out) const {
    std::int32_t total = 0;
    auto ec = r.read_i32(total);
    if (ec) {
      return ec;
    }
    byte subtype = 0;
    ec = r.read_u8(subtype);
    if (ec) {
      return ec;
    }
    if (total < 0 || static_cast<std::size_t>(total) > r.remaining()) {
      return make_error_code(errc::invalid_binary_length);
    }
    auto data_size = static_cast<std::size_t>(total);
    if (subtype == static_cast<byte>(binary_subtype::byte_array)) {
      std::int32_t inner = 0;
      ec = r.read_i32(inner);
      if (ec) {
        return make_error_code(errc::invalid_binary_length);
      }
      if (inner < 0 || static_cast<std::size_t>(inner) != data_size - 4) {
        return make_error_code(errc::invalid_binary_length);
      }
      data_size -= 4;
    }
    bytes_view raw;
    ec = r.read_bytes(data_size, raw);
    if (ec) {
      return ec;
    }
    out = Value::binary(std::vector<byte>(raw.begin(), raw.end()), static_cast<binary_subtype>(subtype));
    return {};
  }

  /*
   * code_w_scope：int32 总长 + string + 文档。
   * 总长至少 14（4 + 4 + 1 + 5），且必须等于 4 + 字符串字段 + 文档长度。
   */
  std::error_code read_code_w_scope(SpanReader& r, std::size_t depth, Value& out) const {
    constexpr std::int32_t kMinCodeWScopeSize = 4 + 4 + 1 + static_cast<std::int32_t>(kMinDocumentSize);
    std::int32_t total = 0;
    auto ec = r.read_i32(total);
    if (ec) {
      return ec;
    }
    if (total < kMinCodeWScopeSize || static_cast<std::size_t>(total) - 4 > r.remaining()) {
      return make_error_code(errc::invalid_code_w_scope);
    }
    const auto start = r.consumed();
    std::string code;
    ec = read_string(r, code);
    if (ec) {
      return ec;
    }
    bytes_view scope_bytes;
    Document scope;
    ec = read_embedded(r, scope_bytes);
    if (!ec) {
      ec = read_document(scope_bytes, depth + 1, scope);
    }
    if (ec) {
      return ec;
    }
    if (r.consumed() - start + 4 != static_cast<std::size_t>(total)) {
      return make_error_code(errc::invalid_code_w_scope);
    }
    out = Value::code(std::move(code), std::move(scope));
    return {};
  }

  const DeserializeOptions& options_;
};

// 顶层帧校验（长度、结尾），通过后交给 Deserializer。
std::error_code deserialize_impl(bytes_view in, Document& out, const DeserializeOptions& options) {
  if (in.size() < kMinDocumentSize) {
    return make_error_code(errc::invalid_document_size);
  }
  const auto size = peek_i32(in);
  if (size < static_cast<std::int32_t>(kMinDocumentSize)) {
    return make_error_code(errc::invalid_document_size);
  }
  const auto doc_size = static_cast<std::size_t>(size);
  if (doc_size > in.size()) {
    return make_error_code(errc::truncated);
  }
  if (doc_size < in.size() && !options.allow_object_smaller_than_buffer_size) {
    return make_error_code(errc::document_size_mismatch);
  }
  if (in[doc_size - 1] != 0x00) {
    return make_error_code(errc::missing_terminator);
  }
  return Deserializer(options).read_document(in.first(doc_size), 0, out);
}

}  // namespace

std::error_code deserialize(bytes_view in, Document& out, const DeserializeOptions& options) noexcept {
  std::error_code ec;
  try {
    ec = deserialize_impl(in, out, options);
  } catch (const std::bad_alloc&) {
    ec = bson::core::make_error_code(bson::core::errc::out_of_memory);
  }
  if (ec) {
    bson::core::detail::logger().debug("bson deserialize rejected {} byte input: {}", in.size(), ec.message());
  }
  return ec;
}

std::error_code deserialize_stream(bytes_view in,
                                   std::size_t start_index,
                                   std::size_t count,
                                   std::vector<Document>& out,
                                   std::size_t& next_index,
                                   const DeserializeOptions& options) noexcept {
  if (start_index > in.size()) {
    return make_error_code(errc::truncated);
  }
  std::vector<Document> docs;
  std::size_t index = start_index;
  for (std::size_t i = 0; i < count; ++i) {
    const auto rest = in.subspan(index);
    if (rest.size() < 4) {
      return make_error_code(errc::truncated);
    }
    const auto size = peek_i32(rest);
    if (size < static_cast<std::int32_t>(kMinDocumentSize)) {
      return make_error_code(errc::invalid_document_size);
    }
    if (static_cast<std::size_t>(size) > rest.size()) {
      return make_error_code(errc::truncated);
    }
    Document doc;
    auto ec = deserialize(rest.first(static_cast<std::size_t>(size)), doc, options);
    if (ec) {
      return ec;
    }
    try {
      docs.push_back(std::move(doc));
    } catch (const std::bad_alloc&) {
      return bson::core::make_error_code(bson::core::errc::out_of_memory);
    }
    index += static_cast<std::size_t>(size);
  }
  try {
    out.reserve(out.size() + docs.size());
  } catch (const std::bad_alloc&) {
    return bson::core::make_error_code(bson::core::errc::out_of_memory);
  }
  std::move(docs.begin(), docs.end(), std::back_inserter(out));
  next_index = index;
  return {};
}

}  // namespace bson::codec
