#include "bson/codec/types.hpp"
#include "bson/codec/value.hpp"

#include "test_main.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace {

using bson::codec::Array;
using bson::codec::Document;
using bson::codec::Element;
using bson::codec::RegExp;
using bson::codec::Value;
using bson::codec::binary_subtype;
using bson::codec::element_type;
using bson::codec::element_type_from_byte;
using bson::codec::element_type_name;

void test_element_type_tags() {
  TEST_EXPECT_EQ(static_cast<std::uint8_t>(element_type::double_), 0x01u);
  TEST_EXPECT_EQ(static_cast<std::uint8_t>(element_type::string), 0x02u);
  TEST_EXPECT_EQ(static_cast<std::uint8_t>(element_type::document), 0x03u);
  TEST_EXPECT_EQ(static_cast<std::uint8_t>(element_type::array), 0x04u);
  TEST_EXPECT_EQ(static_cast<std::uint8_t>(element_type::binary), 0x05u);
  TEST_EXPECT_EQ(static_cast<std::uint8_t>(element_type::undefined), 0x06u);
  TEST_EXPECT_EQ(static_cast<std::uint8_t>(element_type::object_id), 0x07u);
  TEST_EXPECT_EQ(static_cast<std::uint8_t>(element_type::boolean), 0x08u);
  TEST_EXPECT_EQ(static_cast<std::uint8_t>(element_type::datetime), 0x09u);
  TEST_EXPECT_EQ(static_cast<std::uint8_t>(element_type::null), 0x0Au);
  TEST_EXPECT_EQ(static_cast<std::uint8_t>(element_type::regex), 0x0Bu);
  TEST_EXPECT_EQ(static_cast<std::uint8_t>(element_type::code), 0x0Du);
  TEST_EXPECT_EQ(static_cast<std::uint8_t>(element_type::symbol), 0x0Eu);
  TEST_EXPECT_EQ(static_cast<std::uint8_t>(element_type::code_w_scope), 0x0Fu);
  TEST_EXPECT_EQ(static_cast<std::uint8_t>(element_type::int32), 0x10u);
  TEST_EXPECT_EQ(static_cast<std::uint8_t>(element_type::timestamp), 0x11u);
  TEST_EXPECT_EQ(static_cast<std::uint8_t>(element_type::int64), 0x12u);
  TEST_EXPECT_EQ(static_cast<std::uint8_t>(element_type::decimal128), 0x13u);
  TEST_EXPECT_EQ(static_cast<std::uint8_t>(element_type::min_key), 0xFFu);
  TEST_EXPECT_EQ(static_cast<std::uint8_t>(element_type::max_key), 0x7Fu);

  TEST_EXPECT_EQ(static_cast<std::uint8_t>(binary_subtype::byte_array), 0x02u);
  TEST_EXPECT_EQ(static_cast<std::uint8_t>(binary_subtype::user_defined), 0x80u);
}

void test_element_type_from_byte() {
  TEST_EXPECT(element_type_from_byte(0x10) == element_type::int32);
  TEST_EXPECT(element_type_from_byte(0xFF) == element_type::min_key);
  TEST_EXPECT(element_type_from_byte(0x0C) == element_type::db_pointer);
  TEST_EXPECT(!element_type_from_byte(0x00).has_value());
  TEST_EXPECT(!element_type_from_byte(0x14).has_value());
  TEST_EXPECT(!element_type_from_byte(0x80).has_value());
}

void test_element_type_names() {
  TEST_EXPECT_EQ(element_type_name(element_type::double_), "double");
  TEST_EXPECT_EQ(element_type_name(element_type::object_id), "objectId");
  TEST_EXPECT_EQ(element_type_name(element_type::code_w_scope), "javascriptWithScope");
  TEST_EXPECT_EQ(element_type_name(element_type::int64), "long");
  TEST_EXPECT_EQ(element_type_name(element_type::max_key), "maxKey");
}

void test_document_preserves_insertion_order() {
  Document doc;
  TEST_EXPECT(doc.append("z", Value::number(1)));
  TEST_EXPECT(doc.append("a", Value::number(2)));
  TEST_EXPECT(doc.append("m", Value::number(3)));
  TEST_EXPECT_EQ(doc.size(), 3u);
  TEST_EXPECT_EQ(doc.at(0).name, "z");
  TEST_EXPECT_EQ(doc.at(1).name, "a");
  TEST_EXPECT_EQ(doc.at(2).name, "m");
}

void test_document_key_uniqueness() {
  Document doc;
  TEST_EXPECT(doc.append("k", Value::number(1)));
  TEST_EXPECT(!doc.append("k", Value::number(2)));
  TEST_EXPECT(*doc.find("k") == Value::number(1));

  doc.set("other", Value::null());
  doc.set("k", Value::string("v"));
  TEST_EXPECT_EQ(doc.size(), 2u);
  TEST_EXPECT_EQ(doc.at(0).name, "k");
  TEST_EXPECT(*doc.find("k") == Value::string("v"));

  TEST_EXPECT(doc.erase("k"));
  TEST_EXPECT(!doc.erase("k"));
  TEST_EXPECT(!doc.contains("k"));
  TEST_EXPECT(doc.contains("other"));
  TEST_EXPECT(doc.find("missing") == nullptr);
}

void test_document_initializer_list_last_wins() {
  Document doc{{"a", Value::number(1)}, {"b", Value::number(2)}, {"a", Value::number(3)}};
  TEST_EXPECT_EQ(doc.size(), 2u);
  TEST_EXPECT_EQ(doc.at(0).name, "a");
  TEST_EXPECT(doc.at(0).value == Value::number(3));
}

void test_document_from_elements() {
  Document::container_type elements;
  elements.push_back(Element{"x", Value::number(1)});
  elements.push_back(Element{"y", Value::number(2)});
  elements.push_back(Element{"x", Value::number(3)});
  elements.push_back(Element{"z", Value::number(4)});
  elements.push_back(Element{"y", Value::number(5)});

  const Document doc(std::move(elements));
  TEST_EXPECT_EQ(doc.size(), 3u);
  TEST_EXPECT_EQ(doc.at(0).name, "x");
  TEST_EXPECT_EQ(doc.at(1).name, "y");
  TEST_EXPECT_EQ(doc.at(2).name, "z");
  TEST_EXPECT(*doc.find("x") == Value::number(3));
  TEST_EXPECT(*doc.find("y") == Value::number(5));

  TEST_EXPECT(Document(Document::container_type{}).empty());
}

void test_document_equality_is_order_sensitive() {
  Document ab{{"a", Value::number(1)}, {"b", Value::number(2)}};
  Document ba{{"b", Value::number(2)}, {"a", Value::number(1)}};
  TEST_EXPECT(ab != ba);
  TEST_EXPECT(ab == (Document{{"a", Value::number(1)}, {"b", Value::number(2)}}));
}

void test_value_kinds_are_distinct() {
  TEST_EXPECT(Value() == Value::null());
  TEST_EXPECT(Value::null() != Value::undefined());
  TEST_EXPECT(Value::int32(1) != Value::int64(1));
  TEST_EXPECT(Value::int32(1) != Value::float64(1));
  TEST_EXPECT(Value::string("x") != Value::symbol("x"));
  TEST_EXPECT(Value::code("x") != Value::function("x"));
  TEST_EXPECT(Value::min_key() != Value::max_key());
  TEST_EXPECT(Value::int32(7).holds<bson::codec::Int32>());
  TEST_EXPECT(Value::int32(7).get_if<bson::codec::Int32>()->value == 7);
  TEST_EXPECT(Value::int32(7).get_if<bson::codec::Long>() == nullptr);
}

void test_number_and_double_equality() {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  TEST_EXPECT(Value::number(nan) == Value::number(nan));
  TEST_EXPECT(Value::number(0.0) == Value::number(-0.0));

  TEST_EXPECT(Value::float64(nan) == Value::float64(nan));
  TEST_EXPECT(Value::float64(0.0) != Value::float64(-0.0));
}

// Number 与 Int32/Double：写出的标签与字节一致才相等。
void test_number_matches_fixed_width_by_wire_form() {
  TEST_EXPECT(Value::number(1) == Value::int32(1));
  TEST_EXPECT(Value::int32(1) == Value::number(1));
  TEST_EXPECT(Value::number(-0.0) == Value::int32(0));
  TEST_EXPECT(Value::number(1) != Value::int32(2));
  TEST_EXPECT(Value::number(1) != Value::float64(1));
  TEST_EXPECT(Value::number(1) != Value::int64(1));

  TEST_EXPECT(Value::number(2.5) == Value::float64(2.5));
  TEST_EXPECT(Value::float64(2.5) == Value::number(2.5));
  TEST_EXPECT(Value::number(3e9) == Value::float64(3e9));
  TEST_EXPECT(Value::number(2.5) != Value::float64(-2.5));

  const double nan = std::numeric_limits<double>::quiet_NaN();
  TEST_EXPECT(Value::number(nan) == Value::float64(nan));

  TEST_EXPECT((Document{{"n", Value::int32(5)}}) == (Document{{"n", Value::number(5)}}));
  TEST_EXPECT((Array{Value::float64(0.5)}) == (Array{Value::number(0.5)}));
}

void test_regexp_options_sorted() {
  auto re = Value::regexp("^a", "smi");
  TEST_EXPECT_EQ(re.get_if<RegExp>()->options, "ims");
  TEST_EXPECT(re == Value::regexp("^a", "ims"));

  // global 写为 s
  auto flags = RegExp::from_flags("b+", true, true, false);
  TEST_EXPECT_EQ(flags.pattern, "b+");
  TEST_EXPECT_EQ(flags.options, "is");
  TEST_EXPECT_EQ(RegExp::from_flags("c", false, false, true).options, "m");
  TEST_EXPECT_EQ(RegExp::from_flags("d", true, true, true).options, "ims");
  TEST_EXPECT(RegExp::from_flags("e", false, false, false).options.empty());
}

void test_dbref_to_document() {
  auto oid = Value::object_id({});
  bson::codec::DBRef ref("users", oid, std::string("app"), Document{{"extra", Value::boolean(true)}});
  TEST_EXPECT_EQ(ref.collection(), "users");
  TEST_EXPECT(ref.id() == oid);
  TEST_EXPECT(ref.db().has_value());

  const auto doc = ref.to_document();
  TEST_EXPECT_EQ(doc.size(), 4u);
  TEST_EXPECT_EQ(doc.at(0).name, "$ref");
  TEST_EXPECT_EQ(doc.at(1).name, "$id");
  TEST_EXPECT_EQ(doc.at(2).name, "extra");
  TEST_EXPECT_EQ(doc.at(3).name, "$db");
  TEST_EXPECT(doc.at(0).value == Value::string("users"));

  bson::codec::DBRef no_db("users", Value::number(5));
  const auto short_doc = no_db.to_document();
  TEST_EXPECT_EQ(short_doc.size(), 2u);
  TEST_EXPECT(!short_doc.contains("$db"));
}

void test_dbref_drops_reserved_fields() {
  bson::codec::DBRef ref("users", Value::int32(1), std::nullopt,
                         Document{{"$ref", Value::string("other")}, {"note", Value::null()}, {"$db", Value::null()}});
  TEST_EXPECT(ref.fields() == (Document{{"note", Value::null()}}));

  const auto doc = ref.to_document();
  TEST_EXPECT_EQ(doc.size(), 3u);
  TEST_EXPECT(*doc.find("$ref") == Value::string("users"));
  TEST_EXPECT(!doc.contains("$db"));
}

void test_dbref_copies_share_id() {
  auto ref = Value::dbref("c", Value::string("id"));
  auto copy = ref;
  TEST_EXPECT(copy == ref);
  TEST_EXPECT(&copy.get_if<bson::codec::DBRef>()->id() == &ref.get_if<bson::codec::DBRef>()->id());
}

class Point final : public bson::codec::WireConvertible {
 public:
  Value to_bson() const override { return Value::document(Document{{"x", Value::number(1)}}); }
};

void test_custom_compares_by_identity() {
  auto p = std::make_shared<const Point>();
  auto a = Value::custom(p);
  auto b = Value::custom(p);
  auto c = Value::custom(std::make_shared<const Point>());
  TEST_EXPECT(a == b);
  TEST_EXPECT(a != c);
}

void test_array_basics() {
  Array arr{Value::number(1), Value::string("two")};
  arr.push_back(Value::null());
  TEST_EXPECT_EQ(arr.size(), 3u);
  TEST_EXPECT(arr.at(1) == Value::string("two"));
  TEST_EXPECT(arr == Array(arr.values()));
  TEST_EXPECT(Array{} != arr);
  TEST_EXPECT(Array{}.empty());
}

}  // namespace

int main() {
  test_element_type_tags();
  test_element_type_from_byte();
  test_element_type_names();
  test_document_preserves_insertion_order();
  test_document_key_uniqueness();
  test_document_initializer_list_last_wins();
  test_document_from_elements();
  test_document_equality_is_order_sensitive();
  test_value_kinds_are_distinct();
  test_number_and_double_equality();
  test_number_matches_fixed_width_by_wire_form();
  test_regexp_options_sorted();
  test_dbref_to_document();
  test_dbref_drops_reserved_fields();
  test_dbref_copies_share_id();
  test_custom_compares_by_identity();
  test_array_basics();
  return ::bson::tests::run_and_report();
}
