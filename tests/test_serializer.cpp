#include "bson/codec/calculate_size.hpp"
#include "bson/codec/error.hpp"
#include "bson/codec/serializer.hpp"
#include "bson/core/error.hpp"

#include "test_main.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <new>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using bson::codec::Array;
using bson::codec::Document;
using bson::codec::SerializeOptions;
using bson::codec::Value;
using bson::codec::binary_subtype;
using bson::codec::byte;
using bson::codec::calculate_object_size;
using bson::codec::errc;
using bson::codec::make_error_code;
using bson::codec::mutable_bytes_view;
using bson::codec::serialize;
using bson::codec::serialize_into;
using bson::codec::serialize_with_buffer_and_index;

std::vector<byte> bytes(std::initializer_list<int> values) {
  std::vector<byte> out;
  out.reserve(values.size());
  for (int v : values) {
    out.push_back(static_cast<byte>(v));
  }
  return out;
}

std::vector<byte> serialize_ok(const Document& doc, const SerializeOptions& options = {}) {
  std::vector<byte> out;
  TEST_EXPECT_OK(serialize(doc, out, options));

  std::size_t expected = 0;
  TEST_EXPECT_OK(calculate_object_size(doc, options, expected));
  TEST_EXPECT_EQ(out.size(), expected);
  return out;
}

Document nested_documents(std::size_t depth) {
  Document doc;
  for (std::size_t i = 0; i < depth; ++i) {
    Document outer;
    outer.set("d", Value::document(std::move(doc)));
    doc = std::move(outer);
  }
  return doc;
}

class ThrowingConverter final : public bson::codec::WireConvertible {
 public:
  Value to_bson() const override { throw std::runtime_error("no wire form"); }
};

class AllocationFailure final : public bson::codec::WireConvertible {
 public:
  Value to_bson() const override { throw std::bad_alloc(); }
};

class SelfReturning final : public bson::codec::WireConvertible {
 public:
  Value to_bson() const override { return Value::custom(std::make_shared<const SelfReturning>()); }
};

class Money final : public bson::codec::WireConvertible {
 public:
  explicit Money(std::int64_t cents) : cents_(cents) {}
  Value to_bson() const override { return Value::int64(cents_); }

 private:
  std::int64_t cents_;
};

void test_empty_document() {
  TEST_EXPECT_EQ(serialize_ok(Document{}), bytes({0x05, 0x00, 0x00, 0x00, 0x00}));
}

void test_string_field_bytes() {
  const auto out = serialize_ok(Document{{"a", Value::string("hello")}});
  TEST_EXPECT_EQ(out,
                 bytes({0x12, 0x00, 0x00, 0x00,                           // 总长 18
                        0x02, 'a', 0x00,                                  // string "a"
                        0x06, 0x00, 0x00, 0x00, 'h', 'e', 'l', 'l', 'o', 0x00,
                        0x00}));
}

void test_number_width_bytes() {
  auto out = serialize_ok(Document{{"n", Value::number(2147483647.0)}});
  TEST_EXPECT_EQ(out, bytes({0x0C, 0x00, 0x00, 0x00, 0x10, 'n', 0x00, 0xFF, 0xFF, 0xFF, 0x7F, 0x00}));

  out = serialize_ok(Document{{"n", Value::number(2147483648.0)}});
  TEST_EXPECT_EQ(out.size(), 4u + 1 + 2 + 8 + 1);
  TEST_EXPECT_EQ(out[4], byte{0x01});

  out = serialize_ok(Document{{"n", Value::number(3.14)}});
  TEST_EXPECT_EQ(out[4], byte{0x01});
  TEST_EXPECT_EQ(out.size(), 16u);

  out = serialize_ok(Document{{"n", Value::number(-1.0)}});
  TEST_EXPECT_EQ(out, bytes({0x0C, 0x00, 0x00, 0x00, 0x10, 'n', 0x00, 0xFF, 0xFF, 0xFF, 0xFF, 0x00}));
}

void test_fixed_width_values() {
  auto out = serialize_ok(Document{{"l", Value::int64(1)}});
  TEST_EXPECT_EQ(out, bytes({0x10, 0x00, 0x00, 0x00, 0x12, 'l', 0x00, 0x01, 0, 0, 0, 0, 0, 0, 0, 0x00}));

  out = serialize_ok(Document{{"t", Value::timestamp(1, 2)}});
  TEST_EXPECT_EQ(out, bytes({0x10, 0x00, 0x00, 0x00, 0x11, 't', 0x00, 0x01, 0, 0, 0, 0x02, 0, 0, 0, 0x00}));

  out = serialize_ok(Document{{"b", Value::boolean(true)}});
  TEST_EXPECT_EQ(out, bytes({0x09, 0x00, 0x00, 0x00, 0x08, 'b', 0x00, 0x01, 0x00}));

  out = serialize_ok(Document{{"k", Value::min_key()}, {"m", Value::max_key()}});
  TEST_EXPECT_EQ(out, bytes({0x0B, 0x00, 0x00, 0x00, 0xFF, 'k', 0x00, 0x7F, 'm', 0x00, 0x00}));
}

void test_array_uses_index_keys() {
  std::vector<byte> out;
  TEST_EXPECT_OK(serialize(Array{Value::boolean(false), Value::null()}, out));
  TEST_EXPECT_EQ(out, bytes({0x0C, 0x00, 0x00, 0x00, 0x08, '0', 0x00, 0x00, 0x0A, '1', 0x00, 0x00}));
}

void test_binary_layouts() {
  auto out = serialize_ok(Document{{"b", Value::binary(bytes({0xAA, 0xBB}))}});
  TEST_EXPECT_EQ(out, bytes({0x0F, 0x00, 0x00, 0x00, 0x05, 'b', 0x00, 0x02, 0x00, 0x00, 0x00, 0x00, 0xAA, 0xBB, 0x00}));

  // 旧格式：外层长度包含内层 int32 长度
  out = serialize_ok(Document{{"b", Value::binary(bytes({0xAA, 0xBB}), binary_subtype::byte_array)}});
  TEST_EXPECT_EQ(out,
                 bytes({0x13, 0x00, 0x00, 0x00, 0x05, 'b', 0x00, 0x06, 0x00, 0x00, 0x00, 0x02, 0x02, 0x00, 0x00,
                        0x00, 0xAA, 0xBB, 0x00}));
}

void test_undefined_handling() {
  auto out = serialize_ok(Document{{"u", Value::undefined()}});
  TEST_EXPECT_EQ(out, bytes({0x08, 0x00, 0x00, 0x00, 0x0A, 'u', 0x00, 0x00}));

  SerializeOptions options;
  options.ignore_undefined = true;
  out = serialize_ok(Document{{"u", Value::undefined()}, {"v", Value::null()}}, options);
  TEST_EXPECT_EQ(out, bytes({0x08, 0x00, 0x00, 0x00, 0x0A, 'v', 0x00, 0x00}));

  // 数组槽位保留为 null
  out = serialize_ok(Document{{"a", Value::array(Array{Value::undefined()})}}, options);
  TEST_EXPECT_EQ(out, bytes({0x10, 0x00, 0x00, 0x00, 0x04, 'a', 0x00, 0x08, 0x00, 0x00, 0x00, 0x0A, '0', 0x00, 0x00,
                             0x00}));
}

void test_regex_bytes() {
  const auto out = serialize_ok(Document{{"r", Value::regexp("a+", "mi")}});
  TEST_EXPECT_EQ(out, bytes({0x0E, 0x00, 0x00, 0x00, 0x0B, 'r', 0x00, 'a', '+', 0x00, 'i', 'm', 0x00, 0x00}));

  std::vector<byte> rejected;
  auto ec = serialize(Document{{"r", Value::regexp(std::string("a\0b", 3))}}, rejected);
  TEST_EXPECT_EQ(ec, make_error_code(errc::invalid_cstring));
  TEST_EXPECT(rejected.empty());
}

void test_code_with_and_without_scope() {
  auto out = serialize_ok(Document{{"c", Value::code("x")}});
  TEST_EXPECT_EQ(out, bytes({0x0E, 0x00, 0x00, 0x00, 0x0D, 'c', 0x00, 0x02, 0x00, 0x00, 0x00, 'x', 0x00, 0x00}));

  out = serialize_ok(Document{{"c", Value::code("x", Document{{"v", Value::boolean(true)}})}});
  TEST_EXPECT_EQ(out, bytes({0x1B, 0x00, 0x00, 0x00, 0x0F, 'c', 0x00,
                             0x13, 0x00, 0x00, 0x00,                     // code_w_scope 总长 19
                             0x02, 0x00, 0x00, 0x00, 'x', 0x00,           // 源码
                             0x09, 0x00, 0x00, 0x00, 0x08, 'v', 0x00, 0x01, 0x00,  // scope
                             0x00}));
}

void test_functions_skipped_unless_enabled() {
  const Document doc{{"f", Value::function("function(a){return a;}")}, {"n", Value::null()}};
  auto out = serialize_ok(doc);
  TEST_EXPECT_EQ(out, bytes({0x08, 0x00, 0x00, 0x00, 0x0A, 'n', 0x00, 0x00}));

  SerializeOptions options;
  options.serialize_functions = true;
  out = serialize_ok(doc, options);
  TEST_EXPECT_EQ(out[4], byte{0x0D});
  const std::string expected = "function (a){return a;}";
  const std::string written(reinterpret_cast<const char*>(out.data()) + 4 + 3 + 4, expected.size());
  TEST_EXPECT_EQ(written, expected);
}

void test_dbref_written_as_document() {
  const auto ref = Value::dbref("users", Value::int32(7), std::string("app"));
  const auto out = serialize_ok(Document{{"r", ref}});
  const auto plain = serialize_ok(Document{
    {"r", Value::document(Document{{"$ref", Value::string("users")}, {"$id", Value::int32(7)}, {"$db", Value::string("app")}})}});
  TEST_EXPECT_EQ(out, plain);

  // 附加字段位于 $id 与 $db 之间；fields 中的保留键被丢弃
  const auto extended = Value::dbref("users", Value::int32(7), std::string("app"),
                                     Document{{"$id", Value::int32(99)}, {"note", Value::boolean(true)}});
  const auto expected = serialize_ok(Document{{"r", Value::document(Document{{"$ref", Value::string("users")},
                                                                               {"$id", Value::int32(7)},
                                                                               {"note", Value::boolean(true)},
                                                                               {"$db", Value::string("app")}})}});
  TEST_EXPECT_EQ(serialize_ok(Document{{"r", extended}}), expected);
}

void test_check_keys() {
  SerializeOptions options;
  options.check_keys = true;

  std::vector<byte> out;
  TEST_EXPECT_EQ(serialize(Document{{"$set", Value::null()}}, out, options), make_error_code(errc::invalid_key));
  TEST_EXPECT_EQ(serialize(Document{{"a.b", Value::null()}}, out, options), make_error_code(errc::invalid_key));
  TEST_EXPECT(out.empty());

  // DBRef 自身的 $ 键不受限制，附加字段仍然校验
  TEST_EXPECT_OK(serialize(Document{{"r", Value::dbref("c", Value::int32(1))}}, out, options));
  out.clear();
  auto ec = serialize(Document{{"r", Value::dbref("c", Value::int32(1), std::nullopt, Document{{"$x", Value::null()}})}},
                      out, options);
  TEST_EXPECT_EQ(ec, make_error_code(errc::invalid_key));
  TEST_EXPECT(out.empty());

  // 不开启 check_keys 时允许
  out.clear();
  TEST_EXPECT_OK(serialize(Document{{"$set", Value::null()}}, out));

  // 键中的 0x00 无论如何都不合法
  out.clear();
  TEST_EXPECT_EQ(serialize(Document{{std::string("a\0b", 3), Value::null()}}, out), make_error_code(errc::invalid_key));
}

void test_custom_values() {
  const auto out = serialize_ok(Document{{"m", Value::custom(std::make_shared<const Money>(250))}});
  const auto plain = serialize_ok(Document{{"m", Value::int64(250)}});
  TEST_EXPECT_EQ(out, plain);

  std::vector<byte> rejected;
  auto ec = serialize(Document{{"x", Value::custom(std::make_shared<const ThrowingConverter>())}}, rejected);
  TEST_EXPECT_EQ(ec, make_error_code(errc::unsupported_value));
  TEST_EXPECT(rejected.empty());

  ec = serialize(Document{{"x", Value::custom(std::make_shared<const SelfReturning>())}}, rejected);
  TEST_EXPECT_EQ(ec, make_error_code(errc::unsupported_value));

  ec = serialize(Document{{"x", Value::custom(nullptr)}}, rejected);
  TEST_EXPECT_EQ(ec, make_error_code(errc::unsupported_value));

  // to_bson() 内存不足：返回 out_of_memory，输出不变
  ec = serialize(Document{{"x", Value::custom(std::make_shared<const AllocationFailure>())}}, rejected);
  TEST_EXPECT_EQ(ec, bson::core::make_error_code(bson::core::errc::out_of_memory));
  TEST_EXPECT(rejected.empty());
}

void test_serialize_appends_and_restores_on_error() {
  std::vector<byte> out = bytes({0xEE});
  TEST_EXPECT_OK(serialize(Document{}, out));
  TEST_EXPECT_EQ(out, bytes({0xEE, 0x05, 0x00, 0x00, 0x00, 0x00}));

  auto ec = serialize(Document{{"x", Value::custom(nullptr)}}, out);
  TEST_EXPECT_EQ(ec, make_error_code(errc::unsupported_value));
  TEST_EXPECT_EQ(out.size(), 6u);
}

void test_serialize_into_buffer() {
  std::array<byte, 16> buf{};
  std::size_t written = 0;
  TEST_EXPECT_OK(serialize_into(mutable_bytes_view{buf.data(), buf.size()}, Document{{"b", Value::boolean(false)}}, written));
  TEST_EXPECT_EQ(written, 9u);

  std::array<byte, 8> small{};
  auto ec = serialize_into(mutable_bytes_view{small.data(), small.size()}, Document{{"b", Value::boolean(false)}}, written);
  TEST_EXPECT_EQ(ec, make_error_code(errc::buffer_overflow));
}

void test_serialize_with_buffer_and_index() {
  std::array<byte, 32> buf{};
  std::size_t end_index = 0;
  TEST_EXPECT_OK(serialize_with_buffer_and_index(Document{}, mutable_bytes_view{buf.data(), buf.size()}, 10, end_index));
  TEST_EXPECT_EQ(end_index, 14u);
  TEST_EXPECT_EQ(buf[10], byte{0x05});
  TEST_EXPECT_EQ(buf[14], byte{0x00});

  auto ec = serialize_with_buffer_and_index(Document{}, mutable_bytes_view{buf.data(), buf.size()}, 30, end_index);
  TEST_EXPECT_EQ(ec, make_error_code(errc::buffer_overflow));
  ec = serialize_with_buffer_and_index(Document{}, mutable_bytes_view{buf.data(), buf.size()}, 33, end_index);
  TEST_EXPECT_EQ(ec, make_error_code(errc::buffer_overflow));
}

void test_depth_limit() {
  SerializeOptions options;
  options.max_depth = 2;

  std::vector<byte> out;
  TEST_EXPECT_OK(serialize(nested_documents(2), out, options));

  out.clear();
  auto ec = serialize(nested_documents(3), out, options);
  TEST_EXPECT_EQ(ec, make_error_code(errc::depth_exceeded));
  TEST_EXPECT(out.empty());
}

}  // namespace

int main() {
  test_empty_document();
  test_string_field_bytes();
  test_number_width_bytes();
  test_fixed_width_values();
  test_array_uses_index_keys();
  test_binary_layouts();
  test_undefined_handling();
  test_regex_bytes();
  test_code_with_and_without_scope();
  test_functions_skipped_unless_enabled();
  test_dbref_written_as_document();
  test_check_keys();
  test_custom_values();
  test_serialize_appends_and_restores_on_error();
  test_serialize_into_buffer();
  test_serialize_with_buffer_and_index();
  test_depth_limit();
  return ::bson::tests::run_and_report();
}
