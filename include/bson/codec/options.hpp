#pragma once

#include "bson/codec/types.hpp"

#include <cstddef>

namespace bson::codec {

/**
 * @brief 序列化/长度计算选项（两者必须使用同一份选项，长度才一致）。
 */
struct SerializeOptions final {
  // 函数值按 Code 写出；关闭时函数字段被跳过（长度贡献为 0）。
  bool serialize_functions{false};
  // 文档中的 undefined 字段被丢弃；数组槽位不受影响（保持下标对齐）。
  bool ignore_undefined{false};
  // 拒绝以 '$' 开头或包含 '.' 的键（DBRef 自身的 $ref/$id/$db 除外）。
  bool check_keys{false};
  std::size_t max_depth{kDefaultMaxDepth};
};

struct DeserializeOptions final {
  // int32/double 解码为 Number；关闭时解码为 Int32/Double。
  bool promote_values{true};
  // 处于 [-2^53, 2^53] 的 int64 解码为 Number；关闭时解码为 Long。
  bool promote_longs{false};
  bool validate_utf8{true};
  // 允许声明长度小于输入缓冲区（尾部多余字节被忽略）。
  bool allow_object_smaller_than_buffer_size{false};
  std::size_t max_depth{kDefaultMaxDepth};
};

}  // namespace bson::codec
