#include <bson/codec/calculate_size.hpp>
#include <bson/codec/deserializer.hpp>
#include <bson/codec/serializer.hpp>
#include <bson/core/buffer.hpp>
#include <bson/core/log.hpp>

#include <iomanip>
#include <iostream>
#include <vector>

using namespace bson::codec;

int main() {
    std::cout << "=== BSON 编解码简单示例 ===\n\n";

    // 解码失败的原因会以 debug 级别输出到 stderr
    bson::core::set_log_level(bson::core::LogLevel::debug);

    // 构造文档（字段顺序即写出顺序）
    Document doc{
        {"name", Value::string("sensor-7")},
        {"reading", Value::number(21.5)},
        {"count", Value::number(3)},
        {"tags", Value::array(Array{Value::string("lab"), Value::string("north")})},
        {"owner", Value::dbref("users", Value::number(42))},
    };

    std::size_t expected = 0;
    auto ec = calculate_object_size(doc, SerializeOptions{}, expected);
    if (ec) {
        std::cerr << "长度计算失败: " << ec.message() << "\n";
        return 1;
    }

    // 编码
    std::vector<byte> encoded;
    ec = serialize(doc, encoded);
    if (ec) {
        std::cerr << "编码失败: " << ec.message() << "\n";
        return 1;
    }
    std::cout << "编码成功: " << encoded.size() << " 字节（预计算 " << expected << " 字节）\n";

    std::cout << "前 16 字节:";
    for (std::size_t i = 0; i < encoded.size() && i < 16; ++i) {
        std::cout << ' ' << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(encoded[i]);
    }
    std::cout << std::dec << "\n";

    // 外部字节载体先经 ensure_buffer 规整为 bytes_view
    bytes_view input;
    ec = bson::core::ensure_buffer(bson::core::MemoryBlock{encoded.data(), encoded.size()}, input);
    if (ec) {
        std::cerr << "输入无效: " << ec.message() << "\n";
        return 1;
    }

    // 解码
    Document decoded;
    ec = deserialize(input, decoded);
    if (ec) {
        std::cerr << "解码失败: " << ec.message() << "\n";
        return 1;
    }

    for (const auto &element : decoded) {
        std::cout << "  " << element.name << ": ";
        if (const auto *s = element.value.get_if<String>()) {
            std::cout << '"' << s->value << '"';
        } else if (const auto *n = element.value.get_if<Number>()) {
            std::cout << n->value;
        } else if (const auto *a = element.value.get_if<Array>()) {
            std::cout << "array(" << a->size() << ")";
        } else if (const auto *ref = element.value.get_if<DBRef>()) {
            std::cout << "dbref(" << ref->collection() << ")";
        } else {
            std::cout << "...";
        }
        std::cout << "\n";
    }

    std::cout << "往返一致: " << (decoded == doc ? "是" : "否") << "\n";

    // 截断输入：返回格式错误
    ec = deserialize(input.first(input.size() - 1), decoded);
    std::cout << "截断输入: " << ec.message() << "\n";
    return 0;
}
