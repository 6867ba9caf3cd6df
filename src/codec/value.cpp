#include "bson/codec/value.hpp"

#include "codec/internal.hpp"

#include <algorithm>
#include <bit>
#include <cmath>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace bson::codec {
namespace {

auto find_element(const std::vector<Element>& elements, std::string_view name) noexcept {
  return std::find_if(elements.begin(), elements.end(), [&](const Element& e) { return e.name == name; });
}

// Number 与定宽数值：写出的类型标签与字节相同即相等。
bool same_wire_number(const Number& n, const Value& other) noexcept {
  if (const auto* i = other.get_if<Int32>()) {
    return detail::number_fits_int32(n.value) && static_cast<std::int32_t>(n.value) == i->value;
  }
  if (const auto* d = other.get_if<Double>()) {
    return !detail::number_fits_int32(n.value) &&
           std::bit_cast<std::uint64_t>(n.value) == std::bit_cast<std::uint64_t>(d->value);
  }
  return false;
}

}  // namespace

Document::Document(std::initializer_list<Element> elements) : Document(container_type(elements)) {}

/*
 * 两遍完成去重：
 * 1) 哈希索引记录每个键首次出现的位置，重复键的值移入该位置；
 * 2) 跳过重复项，其余元素按原顺序移入。
 * 第 1 遍只移动 value，索引中的 string_view 始终指向未被移动的 name。
 */
Document::Document(container_type elements) {
  std::unordered_map<std::string_view, std::size_t> first_index;
  first_index.reserve(elements.size());
  std::vector<bool> duplicate(elements.size(), false);
  for (std::size_t i = 0; i < elements.size(); ++i) {
    const auto [it, inserted] = first_index.emplace(elements[i].name, i);
    if (!inserted) {
      elements[it->second].value = std::move(elements[i].value);
      duplicate[i] = true;
    }
  }
  if (first_index.size() == elements.size()) {
    elements_ = std::move(elements);
    return;
  }
  elements_.reserve(first_index.size());
  for (std::size_t i = 0; i < elements.size(); ++i) {
    if (!duplicate[i]) {
      elements_.push_back(std::move(elements[i]));
    }
  }
}

std::size_t Document::size() const noexcept { return elements_.size(); }
bool Document::empty() const noexcept { return elements_.empty(); }
Document::const_iterator Document::begin() const noexcept { return elements_.begin(); }
Document::const_iterator Document::end() const noexcept { return elements_.end(); }

const Element& Document::at(std::size_t index) const {
  return elements_.at(index);
}

bool Document::append(std::string name, Value value) {
  if (find_element(elements_, name) != elements_.end()) {
    return false;
  }
  elements_.push_back(Element{std::move(name), std::move(value)});
  return true;
}

void Document::set(std::string name, Value value) {
  auto it = std::find_if(elements_.begin(), elements_.end(), [&](const Element& e) { return e.name == name; });
  if (it != elements_.end()) {
    it->value = std::move(value);
    return;
  }
  elements_.push_back(Element{std::move(name), std::move(value)});
}

bool Document::erase(std::string_view name) {
  auto it = std::find_if(elements_.begin(), elements_.end(), [&](const Element& e) { return e.name == name; });
  if (it == elements_.end()) {
    return false;
  }
  elements_.erase(it);
  return true;
}

const Value* Document::find(std::string_view name) const noexcept {
  auto it = find_element(elements_, name);
  if (it == elements_.end()) {
    return nullptr;
  }
  return &it->value;
}

bool operator==(const Document& lhs, const Document& rhs) noexcept {
  return lhs.elements_ == rhs.elements_;
}

Array::Array(std::initializer_list<Value> values) : values_(values) {}
Array::Array(std::vector<Value> values) : values_(std::move(values)) {}

std::size_t Array::size() const noexcept { return values_.size(); }
bool Array::empty() const noexcept { return values_.empty(); }
Array::const_iterator Array::begin() const noexcept { return values_.begin(); }
Array::const_iterator Array::end() const noexcept { return values_.end(); }

const Value& Array::at(std::size_t index) const {
  return values_.at(index);
}

void Array::push_back(Value value) {
  values_.push_back(std::move(value));
}

bool operator==(const Array& lhs, const Array& rhs) noexcept {
  return lhs.values_ == rhs.values_;
}

bool operator==(const Number& lhs, const Number& rhs) noexcept {
  if (std::isnan(lhs.value) && std::isnan(rhs.value)) {
    return true;
  }
  return lhs.value == rhs.value;
}

// 显式 double 按位比较：关注的是线上位模式是否一致（-0/+0、NaN payload）。
bool operator==(const Double& lhs, const Double& rhs) noexcept {
  return std::bit_cast<std::uint64_t>(lhs.value) == std::bit_cast<std::uint64_t>(rhs.value);
}

RegExp::RegExp(std::string pattern_, std::string options_)
    : pattern(std::move(pattern_)), options(std::move(options_)) {
  std::sort(options.begin(), options.end());
}

RegExp RegExp::from_flags(std::string pattern_, bool global, bool ignore_case, bool multiline) {
  std::string opts;
  if (ignore_case) {
    opts.push_back('i');
  }
  if (multiline) {
    opts.push_back('m');
  }
  if (global) {
    opts.push_back('s');
  }
  return RegExp(std::move(pattern_), std::move(opts));
}

bool operator==(const Code& lhs, const Code& rhs) noexcept {
  return lhs.code == rhs.code && lhs.scope == rhs.scope;
}

bool operator==(const Function& lhs, const Function& rhs) noexcept {
  return lhs.source == rhs.source && lhs.scope == rhs.scope;
}

DBRef::DBRef(std::string collection, Value id, std::optional<std::string> db, Document fields)
    : collection_(std::move(collection)),
      id_(std::make_shared<const Value>(std::move(id))),
      db_(std::move(db)),
      fields_(std::move(fields)) {
  for (const std::string_view key : {"$ref", "$id", "$db"}) {
    fields_.erase(key);
  }
}

Document DBRef::to_document() const {
  Document::container_type elements;
  elements.reserve(fields_.size() + 3);
  elements.push_back(Element{"$ref", Value::string(collection_)});
  elements.push_back(Element{"$id", *id_});
  elements.insert(elements.end(), fields_.begin(), fields_.end());
  if (db_) {
    elements.push_back(Element{"$db", Value::string(*db_)});
  }
  return Document(std::move(elements));
}

bool operator==(const DBRef& lhs, const DBRef& rhs) noexcept {
  return lhs.collection_ == rhs.collection_ && *lhs.id_ == *rhs.id_ && lhs.db_ == rhs.db_ &&
         lhs.fields_ == rhs.fields_;
}

Value::Value() : storage_(Null{}) {}

Value::Value(Null v) : storage_(v) {}
Value::Value(Undefined v) : storage_(v) {}
Value::Value(Boolean v) : storage_(v) {}
Value::Value(Number v) : storage_(v) {}
Value::Value(Int32 v) : storage_(v) {}
Value::Value(Long v) : storage_(v) {}
Value::Value(Double v) : storage_(v) {}
Value::Value(String v) : storage_(std::move(v)) {}
Value::Value(Document v) : storage_(std::move(v)) {}
Value::Value(Array v) : storage_(std::move(v)) {}
Value::Value(Binary v) : storage_(std::move(v)) {}
Value::Value(ObjectId v) : storage_(v) {}
Value::Value(DateTime v) : storage_(v) {}
Value::Value(RegExp v) : storage_(std::move(v)) {}
Value::Value(MinKey v) : storage_(v) {}
Value::Value(MaxKey v) : storage_(v) {}
Value::Value(Code v) : storage_(std::move(v)) {}
Value::Value(Function v) : storage_(std::move(v)) {}
Value::Value(DBRef v) : storage_(std::move(v)) {}
Value::Value(Symbol v) : storage_(std::move(v)) {}
Value::Value(Timestamp v) : storage_(v) {}
Value::Value(Decimal128 v) : storage_(v) {}
Value::Value(Custom v) : storage_(std::move(v)) {}

Value Value::null() {
  return Value(Null{});
}

Value Value::undefined() {
  return Value(Undefined{});
}

Value Value::boolean(bool value) {
  return Value(Boolean{value});
}

Value Value::number(double value) {
  return Value(Number{value});
}

Value Value::int32(std::int32_t value) {
  return Value(Int32{value});
}

Value Value::int64(std::int64_t value) {
  return Value(Long{value});
}

Value Value::float64(double value) {
  return Value(Double{value});
}

Value Value::string(std::string value) {
  return Value(String{std::move(value)});
}

Value Value::document(Document value) {
  return Value(std::move(value));
}

Value Value::array(Array value) {
  return Value(std::move(value));
}

Value Value::binary(std::vector<byte> data, binary_subtype subtype) {
  return Value(Binary{std::move(data), subtype});
}

Value Value::object_id(const std::array<byte, kObjectIdSize>& bytes) {
  return Value(ObjectId{bytes});
}

Value Value::datetime(std::int64_t millis) {
  return Value(DateTime{millis});
}

Value Value::regexp(std::string pattern, std::string options) {
  return Value(RegExp(std::move(pattern), std::move(options)));
}

Value Value::min_key() {
  return Value(MinKey{});
}

Value Value::max_key() {
  return Value(MaxKey{});
}

Value Value::code(std::string code, Document scope) {
  return Value(Code{std::move(code), std::move(scope)});
}

Value Value::function(std::string source, Document scope) {
  return Value(Function{std::move(source), std::move(scope)});
}

Value Value::dbref(std::string collection, Value id, std::optional<std::string> db, Document fields) {
  return Value(DBRef(std::move(collection), std::move(id), std::move(db), std::move(fields)));
}

Value Value::symbol(std::string value) {
  return Value(Symbol{std::move(value)});
}

Value Value::timestamp(std::uint32_t increment, std::uint32_t time) {
  return Value(Timestamp{increment, time});
}

Value Value::decimal128(const std::array<byte, kDecimal128Size>& bytes) {
  return Value(Decimal128{bytes});
}

Value Value::custom(std::shared_ptr<const WireConvertible> converter) {
  return Value(Custom{std::move(converter)});
}

bool operator==(const Value& lhs, const Value& rhs) noexcept {
  if (lhs.storage_.index() != rhs.storage_.index()) {
    if (const auto* n = lhs.get_if<Number>()) {
      return same_wire_number(*n, rhs);
    }
    if (const auto* n = rhs.get_if<Number>()) {
      return same_wire_number(*n, lhs);
    }
    return false;
  }
  return std::visit(
    [&](const auto& a) -> bool {
      using T = std::decay_t<decltype(a)>;
      const auto* b = std::get_if<T>(&rhs.storage_);
      return b != nullptr && a == *b;
    },
    lhs.storage_);
}

}  // namespace bson::codec
