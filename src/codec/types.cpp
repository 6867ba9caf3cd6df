#include "bson/codec/types.hpp"

namespace bson::codec {

std::optional<element_type> element_type_from_byte(std::uint8_t b) noexcept {
  switch (static_cast<element_type>(b)) {
    case element_type::double_:
    case element_type::string:
    case element_type::document:
    case element_type::array:
    case element_type::binary:
    case element_type::undefined:
    case element_type::object_id:
    case element_type::boolean:
    case element_type::datetime:
    case element_type::null:
    case element_type::regex:
    case element_type::db_pointer:
    case element_type::code:
    case element_type::symbol:
    case element_type::code_w_scope:
    case element_type::int32:
    case element_type::timestamp:
    case element_type::int64:
    case element_type::decimal128:
    case element_type::min_key:
    case element_type::max_key:
      return static_cast<element_type>(b);
    default:
      return std::nullopt;
  }
}

std::string_view element_type_name(element_type type) noexcept {
  switch (type) {
    case element_type::double_:
      return "double";
    case element_type::string:
      return "string";
    case element_type::document:
      return "document";
    case element_type::array:
      return "array";
    case element_type::binary:
      return "binary";
    case element_type::undefined:
      return "undefined";
    case element_type::object_id:
      return "objectId";
    case element_type::boolean:
      return "bool";
    case element_type::datetime:
      return "date";
    case element_type::null:
      return "null";
    case element_type::regex:
      return "regex";
    case element_type::db_pointer:
      return "dbPointer";
    case element_type::code:
      return "javascript";
    case element_type::symbol:
      return "symbol";
    case element_type::code_w_scope:
      return "javascriptWithScope";
    case element_type::int32:
      return "int";
    case element_type::timestamp:
      return "timestamp";
    case element_type::int64:
      return "long";
    case element_type::decimal128:
      return "decimal";
    case element_type::min_key:
      return "minKey";
    case element_type::max_key:
      return "maxKey";
  }
  return "unknown";
}

}  // namespace bson::codec
