#pragma once

#include "bson/codec/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace bson::codec {

class Value;
struct Element;

/**
 * @brief BSON 文档：按插入顺序保存的键值对，键在文档内唯一。
 *
 * BSON 对字段顺序敏感，编码/解码都严格保持插入顺序。
 */
class Document final {
 public:
  using container_type = std::vector<Element>;
  using const_iterator = container_type::const_iterator;

  Document() = default;
  // 同名键以后出现者为准（位置保持首次出现处）。
  Document(std::initializer_list<Element> elements);
  explicit Document(container_type elements);

  [[nodiscard]] std::size_t size() const noexcept;
  [[nodiscard]] bool empty() const noexcept;

  [[nodiscard]] const_iterator begin() const noexcept;
  [[nodiscard]] const_iterator end() const noexcept;
  [[nodiscard]] const Element& at(std::size_t index) const;

  /**
   * @brief 追加字段；键已存在时不修改并返回 false。
   */
  bool append(std::string name, Value value);

  /**
   * @brief 插入或覆盖字段；覆盖时保持原位置。
   */
  void set(std::string name, Value value);

  bool erase(std::string_view name);

  [[nodiscard]] const Value* find(std::string_view name) const noexcept;
  [[nodiscard]] bool contains(std::string_view name) const noexcept { return find(name) != nullptr; }

  friend bool operator==(const Document& lhs, const Document& rhs) noexcept;
  friend bool operator!=(const Document& lhs, const Document& rhs) noexcept { return !(lhs == rhs); }

 private:
  container_type elements_;
};

/**
 * @brief BSON 数组：编码为以 "0"、"1"... 为键的文档。
 */
class Array final {
 public:
  using container_type = std::vector<Value>;
  using const_iterator = container_type::const_iterator;

  Array() = default;
  Array(std::initializer_list<Value> values);
  explicit Array(std::vector<Value> values);

  [[nodiscard]] std::size_t size() const noexcept;
  [[nodiscard]] bool empty() const noexcept;

  [[nodiscard]] const_iterator begin() const noexcept;
  [[nodiscard]] const_iterator end() const noexcept;
  [[nodiscard]] const Value& at(std::size_t index) const;

  void push_back(Value value);

  [[nodiscard]] const container_type& values() const noexcept { return values_; }

  friend bool operator==(const Array& lhs, const Array& rhs) noexcept;
  friend bool operator!=(const Array& lhs, const Array& rhs) noexcept { return !(lhs == rhs); }

 private:
  container_type values_;
};

struct Null final {
  friend bool operator==(const Null&, const Null&) = default;
};

// 已废弃的 undefined：编码时写成 null，ignore_undefined 时从文档中丢弃。
struct Undefined final {
  friend bool operator==(const Undefined&, const Undefined&) = default;
};

struct MinKey final {
  friend bool operator==(const MinKey&, const MinKey&) = default;
};

struct MaxKey final {
  friend bool operator==(const MaxKey&, const MaxKey&) = default;
};

struct Boolean final {
  bool value{false};
  friend bool operator==(const Boolean&, const Boolean&) = default;
};

/**
 * @brief 未指定宽度的数值（双精度承载）。
 *
 * 编码宽度按值选择：整数且落在 int32 范围内写 int32（4 字节），
 * 其余（超出 int32 的整数、非整数、NaN/Inf）写 double（8 字节）。
 * 比较时两个 NaN 视为相等。
 */
struct Number final {
  double value{0.0};
  friend bool operator==(const Number& lhs, const Number& rhs) noexcept;
};

struct Int32 final {
  std::int32_t value{0};
  friend bool operator==(const Int32&, const Int32&) = default;
};

struct Long final {
  std::int64_t value{0};
  friend bool operator==(const Long&, const Long&) = default;
};

// 固定写为 double 的数值；按位比较（区分 -0/+0，NaN 按位模式）。
struct Double final {
  double value{0.0};
  friend bool operator==(const Double& lhs, const Double& rhs) noexcept;
};

struct String final {
  std::string value;
  friend bool operator==(const String&, const String&) = default;
};

struct Binary final {
  std::vector<byte> data;
  binary_subtype subtype{binary_subtype::generic};
  friend bool operator==(const Binary&, const Binary&) = default;
};

struct ObjectId final {
  std::array<byte, kObjectIdSize> bytes{};
  friend bool operator==(const ObjectId&, const ObjectId&) = default;
};

// UTC 毫秒时间戳。
struct DateTime final {
  std::int64_t millis{0};
  friend bool operator==(const DateTime&, const DateTime&) = default;
};

/**
 * @brief 正则表达式：pattern + options（选项字符按字母序保存）。
 */
struct RegExp final {
  std::string pattern;
  std::string options;

  RegExp() = default;
  RegExp(std::string pattern_, std::string options_);

  // ignore_case -> i, multiline -> m, global -> s
  [[nodiscard]] static RegExp from_flags(std::string pattern_, bool global, bool ignore_case, bool multiline);

  friend bool operator==(const RegExp&, const RegExp&) = default;
};

/**
 * @brief JavaScript 代码；scope 为空表示不带作用域（编码为 code），
 * 非空时编码为 code_w_scope。
 */
struct Code final {
  std::string code;
  Document scope;
  friend bool operator==(const Code& lhs, const Code& rhs) noexcept;
};

/**
 * @brief 函数值：默认不参与序列化；serialize_functions 打开时按 Code 写出，
 * 写出前对源码做规范化（首个 "function(" 替换为 "function ("）。
 */
struct Function final {
  std::string source;
  Document scope;
  friend bool operator==(const Function& lhs, const Function& rhs) noexcept;
};

/**
 * @brief 数据库引用：等价于文档 { $ref, $id, ...fields, [$db] }。
 *
 * fields 中名为 $ref/$id/$db 的字段在构造时被丢弃。
 */
class DBRef final {
 public:
  DBRef(std::string collection, Value id, std::optional<std::string> db = std::nullopt, Document fields = {});

  [[nodiscard]] const std::string& collection() const noexcept { return collection_; }
  [[nodiscard]] const Value& id() const noexcept { return *id_; }
  [[nodiscard]] const std::optional<std::string>& db() const noexcept { return db_; }
  [[nodiscard]] const Document& fields() const noexcept { return fields_; }

  // 展开为线上等价文档（字段顺序：$ref, $id, fields..., $db）。
  [[nodiscard]] Document to_document() const;

  friend bool operator==(const DBRef& lhs, const DBRef& rhs) noexcept;

 private:
  std::string collection_;
  // Value 在此处尚未完整定义；引用值不可变，拷贝时共享。
  std::shared_ptr<const Value> id_;
  std::optional<std::string> db_;
  Document fields_;
};

struct Symbol final {
  std::string value;
  friend bool operator==(const Symbol&, const Symbol&) = default;
};

// 线上布局：低 32 位 increment，高 32 位 time。
struct Timestamp final {
  std::uint32_t increment{0};
  std::uint32_t time{0};
  friend bool operator==(const Timestamp&, const Timestamp&) = default;
};

// IEEE 754-2008 decimal128 的 16 字节小端表示（构造与校验不在编解码器范围内）。
struct Decimal128 final {
  std::array<byte, kDecimal128Size> bytes{};
  friend bool operator==(const Decimal128&, const Decimal128&) = default;
};

/**
 * @brief 自定义类型接入点：实现 to_bson() 即可参与序列化。
 *
 * 长度计算与编码都会先调用 to_bson()，再按返回值的类别处理；
 * 只转换一次，返回值仍是 Custom 时视为不支持的值。
 */
class WireConvertible {
 public:
  virtual ~WireConvertible() = default;
  [[nodiscard]] virtual Value to_bson() const = 0;
};

// 按对象身份比较。
struct Custom final {
  std::shared_ptr<const WireConvertible> converter;
  friend bool operator==(const Custom&, const Custom&) = default;
};

/**
 * @brief BSON 值（封闭的标签联合，支持嵌套 Document/Array）。
 *
 * 默认构造为 Null。
 *
 * 相等比较按类别进行，唯一例外是 Number：它与 Int32/Double 在写出的
 * 类型标签和字节完全相同时视为相等（Number(5) == Int32(5)，
 * Number(2.5) == Double(2.5)，但 Number(5) != Double(5)）。
 */
class Value final {
 public:
  using storage_type = std::variant<Null,
                                    Undefined,
                                    Boolean,
                                    Number,
                                    Int32,
                                    Long,
                                    Double,
                                    String,
                                    Document,
                                    Array,
                                    Binary,
                                    ObjectId,
                                    DateTime,
                                    RegExp,
                                    MinKey,
                                    MaxKey,
                                    Code,
                                    Function,
                                    DBRef,
                                    Symbol,
                                    Timestamp,
                                    Decimal128,
                                    Custom>;

  Value();

  explicit Value(Null v);
  explicit Value(Undefined v);
  explicit Value(Boolean v);
  explicit Value(Number v);
  explicit Value(Int32 v);
  explicit Value(Long v);
  explicit Value(Double v);
  explicit Value(String v);
  explicit Value(Document v);
  explicit Value(Array v);
  explicit Value(Binary v);
  explicit Value(ObjectId v);
  explicit Value(DateTime v);
  explicit Value(RegExp v);
  explicit Value(MinKey v);
  explicit Value(MaxKey v);
  explicit Value(Code v);
  explicit Value(Function v);
  explicit Value(DBRef v);
  explicit Value(Symbol v);
  explicit Value(Timestamp v);
  explicit Value(Decimal128 v);
  explicit Value(Custom v);

  [[nodiscard]] const storage_type& storage() const noexcept { return storage_; }
  [[nodiscard]] storage_type& storage() noexcept { return storage_; }

  template <class T>
  [[nodiscard]] const T* get_if() const noexcept {
    return std::get_if<T>(&storage_);
  }

  template <class T>
  [[nodiscard]] T* get_if() noexcept {
    return std::get_if<T>(&storage_);
  }

  template <class T>
  [[nodiscard]] bool holds() const noexcept {
    return std::holds_alternative<T>(storage_);
  }

  static Value null();
  static Value undefined();
  static Value boolean(bool value);
  static Value number(double value);
  static Value int32(std::int32_t value);
  static Value int64(std::int64_t value);
  static Value float64(double value);
  static Value string(std::string value);
  static Value document(Document value);
  static Value array(Array value);
  static Value binary(std::vector<byte> data, binary_subtype subtype = binary_subtype::generic);
  static Value object_id(const std::array<byte, kObjectIdSize>& bytes);
  static Value datetime(std::int64_t millis);
  static Value regexp(std::string pattern, std::string options = {});
  static Value min_key();
  static Value max_key();
  static Value code(std::string code, Document scope = {});
  static Value function(std::string source, Document scope = {});
  static Value dbref(std::string collection, Value id, std::optional<std::string> db = std::nullopt, Document fields = {});
  static Value symbol(std::string value);
  static Value timestamp(std::uint32_t increment, std::uint32_t time);
  static Value decimal128(const std::array<byte, kDecimal128Size>& bytes);
  static Value custom(std::shared_ptr<const WireConvertible> converter);

  friend bool operator==(const Value& lhs, const Value& rhs) noexcept;
  friend bool operator!=(const Value& lhs, const Value& rhs) noexcept { return !(lhs == rhs); }

 private:
  storage_type storage_;
};

struct Element final {
  std::string name;
  Value value;

  friend bool operator==(const Element& lhs, const Element& rhs) noexcept {
    return lhs.name == rhs.name && lhs.value == rhs.value;
  }
};

}  // namespace bson::codec
