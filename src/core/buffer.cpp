#include "bson/core/buffer.hpp"

#include <algorithm>
#include <limits>
#include <new>

namespace bson::core {

std::error_code ensure_buffer(const ByteSource &source, bytes_view &out) noexcept {
    if (const auto *view = std::get_if<TypedView>(&source)) {
        const auto &block = view->block;
        if (block.data == nullptr && block.size != 0) {
            return make_error_code(errc::invalid_buffer_type);
        }
        if (view->byte_offset > block.size ||
            view->byte_length > block.size - view->byte_offset) {
            return make_error_code(errc::buffer_out_of_range);
        }
        if (view->byte_length == 0) {
            out = bytes_view{};
            return {};
        }
        out = bytes_view{block.data + view->byte_offset, view->byte_length};
        return {};
    }

    if (const auto *block = std::get_if<MemoryBlock>(&source)) {
        if (block->data == nullptr) {
            if (block->size != 0) {
                return make_error_code(errc::invalid_buffer_type);
            }
            out = bytes_view{};
            return {};
        }
        out = bytes_view{block->data, block->size};
        return {};
    }

    return make_error_code(errc::invalid_buffer_type);
}

/*
 * ByteBuffer 的实现模型：
 * - storage_ 保存 [0, size) 的已写入数据，read_pos_ 之前为已消费前缀。
 * - append 前若容量不足，先 compact() 回收前缀空洞，仍不足再扩容。
 * - 容量上限由 max_capacity_ 约束，避免异常输入导致无上限增长。
 */
ByteBuffer::ByteBuffer(std::size_t initial_capacity, std::size_t max_capacity)
    : max_capacity_(max_capacity) {
    const auto capacity = std::min(initial_capacity, max_capacity_);
    if (capacity != 0) {
        storage_.reserve(capacity);
    }
}

bytes_view ByteBuffer::readable_bytes() const noexcept {
    if (empty()) {
        return {};
    }
    return bytes_view{storage_.data() + read_pos_, size()};
}

void ByteBuffer::clear() noexcept {
    storage_.clear();
    read_pos_ = 0;
}

void ByteBuffer::compact() noexcept {
    if (read_pos_ == 0) {
        return;
    }
    storage_.erase(storage_.begin(),
                   storage_.begin() + static_cast<std::ptrdiff_t>(read_pos_));
    read_pos_ = 0;
}

std::error_code ByteBuffer::append(bytes_view data) noexcept {
    if (data.empty()) {
        return {};
    }
    if (storage_.capacity() - storage_.size() < data.size()) {
        compact();
    }
    const auto readable = size();
    if (data.size() > max_capacity_ || readable > max_capacity_ - data.size()) {
        return make_error_code(errc::buffer_overflow);
    }
    const auto required = readable + data.size();
    if (required > storage_.capacity()) {
        // 按 2 倍增长，且不超过 max_capacity_。
        std::size_t next = std::max<std::size_t>(storage_.capacity(), 1);
        while (next < required) {
            next = next > max_capacity_ / 2 ? max_capacity_ : next * 2;
        }
        auto ec = reserve(next);
        if (ec) {
            return ec;
        }
    }
    storage_.insert(storage_.end(), data.begin(), data.end());
    return {};
}

std::error_code ByteBuffer::consume(std::size_t n) noexcept {
    if (n == 0) {
        return {};
    }
    if (n > size()) {
        return make_error_code(errc::invalid_argument);
    }
    read_pos_ += n;
    if (read_pos_ == storage_.size()) {
        clear();
    }
    return {};
}

std::error_code ByteBuffer::reserve(std::size_t new_capacity) noexcept {
    if (new_capacity <= storage_.capacity()) {
        return {};
    }
    if (new_capacity > max_capacity_) {
        return make_error_code(errc::buffer_overflow);
    }
    try {
        storage_.reserve(new_capacity);
    } catch (const std::bad_alloc &) {
        return make_error_code(errc::buffer_overflow);
    }
    return {};
}

} // namespace bson::core
