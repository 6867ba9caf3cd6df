#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace bson::core {

using byte = std::uint8_t;
using bytes_view = std::span<const byte>;
using mutable_bytes_view = std::span<byte>;

// ByteBuffer 默认初始容量：单个小文档优先一次分配到位。
inline constexpr std::size_t kDefaultBufferCapacity = 4 * 1024;
// ByteBuffer 默认最大容量：流式读取时缓存的未解析字节上限。
inline constexpr std::size_t kDefaultBufferMaxCapacity = 64 * 1024 * 1024;  // 64MB

}  // 命名空间 bson::core
