#pragma once

#include "bson/core/common.hpp"
#include "bson/core/error.hpp"

#include <cstddef>
#include <system_error>
#include <variant>
#include <vector>

namespace bson::core {

/**
 * @brief 一段线性内存块（整块可读）。
 *
 * data 可以为 nullptr，但此时 size 必须为 0。
 */
struct MemoryBlock final {
    const byte *data{nullptr};
    std::size_t size{0};
};

/**
 * @brief 指向某个内存块内部子区间的类型化视图（offset + length）。
 */
struct TypedView final {
    MemoryBlock block{};
    std::size_t byte_offset{0};
    std::size_t byte_length{0};
};

/**
 * @brief 外部传入的字节载体。
 *
 * monostate 表示“不是字节载体”，用于承接上层无法识别的输入。
 */
using ByteSource = std::variant<std::monostate, TypedView, MemoryBlock>;

/**
 * @brief 把外部字节载体规整为编解码器使用的 bytes_view（不拷贝）。
 *
 * - TypedView：返回 [byte_offset, byte_offset + byte_length) 子区间；
 *   越界返回 errc::buffer_out_of_range
 * - MemoryBlock：返回整块
 * - 其它（monostate、data 为空但 size 非 0）：返回 errc::invalid_buffer_type
 */
std::error_code ensure_buffer(const ByteSource &source, bytes_view &out) noexcept;

/**
 * @brief 可扩容的字节缓冲区（读游标 + 追加写）。
 *
 * 用于流式场景：网络分片不断 append，解析出完整文档后 consume。
 *
 * 注意：
 * - 本类不做线程安全保证。
 * - append/reserve 超过 max_capacity 时返回 errc::buffer_overflow，
 *   已有数据保持不变。
 */
class ByteBuffer final {
public:
    explicit ByteBuffer(std::size_t initial_capacity = kDefaultBufferCapacity,
                        std::size_t max_capacity = kDefaultBufferMaxCapacity);

    ByteBuffer(ByteBuffer &&) noexcept = default;
    ByteBuffer &operator=(ByteBuffer &&) noexcept = default;

    ByteBuffer(const ByteBuffer &) = delete;
    ByteBuffer &operator=(const ByteBuffer &) = delete;

    [[nodiscard]] std::size_t capacity() const noexcept { return storage_.capacity(); }
    [[nodiscard]] std::size_t max_capacity() const noexcept { return max_capacity_; }
    [[nodiscard]] std::size_t size() const noexcept { return storage_.size() - read_pos_; }
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    [[nodiscard]] bytes_view readable_bytes() const noexcept;

    void clear() noexcept;
    void compact() noexcept;

    std::error_code append(bytes_view data) noexcept;
    std::error_code consume(std::size_t n) noexcept;
    std::error_code reserve(std::size_t new_capacity) noexcept;

private:
    std::vector<byte> storage_;
    std::size_t read_pos_{0};
    std::size_t max_capacity_{0};
};

} // namespace bson::core
