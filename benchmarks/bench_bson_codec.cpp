#include "bench_main.hpp"

#include "bson/codec/calculate_size.hpp"
#include "bson/codec/deserializer.hpp"
#include "bson/codec/serializer.hpp"

#include <string>
#include <vector>

using namespace bson::codec;

static Document create_deep_nested(std::size_t depth) {
  Document doc{{"leaf", Value::number(42)}};
  for (std::size_t i = 0; i < depth; ++i) {
    Document outer;
    outer.set("child", Value::document(std::move(doc)));
    doc = std::move(outer);
  }
  return doc;
}

static void bench_round(std::string_view encode_name, std::string_view decode_name, const Document& doc, int iterations) {
  std::vector<byte> encoded;
  std::size_t encoded_bytes = 0;
  if (auto ec = calculate_object_size(doc, SerializeOptions{}, encoded_bytes)) {
    std::cerr << "Calculate size failed: " << ec.message() << "\n";
    return;
  }

  BENCH_RUN(encode_name, encoded_bytes, iterations, {
    encoded.clear();
    auto ec = serialize(doc, encoded);
    if (ec) {
      std::cerr << "Serialize failed: " << ec.message() << "\n";
    }
  });

  BENCH_RUN(decode_name, encoded.size(), iterations, {
    Document decoded;
    auto ec = deserialize(bytes_view{encoded.data(), encoded.size()}, decoded);
    if (ec) {
      std::cerr << "Deserialize failed: " << ec.message() << "\n";
    }
  });
}

static void bench_deep_nested() {
  // 默认深度上限之内
  bench_round("BSON: Serialize nested documents (100 levels)",
              "BSON: Deserialize nested documents (100 levels)",
              create_deep_nested(kDefaultMaxDepth - 1),
              10);
}

static void bench_wide_document() {
  Document doc;
  for (int i = 0; i < 10000; ++i) {
    doc.set("field_" + std::to_string(i), Value::number(i * 1.5));
  }
  bench_round("BSON: Serialize wide document (10000 fields)",
              "BSON: Deserialize wide document (10000 fields)",
              doc,
              5);
}

static void bench_large_array() {
  Array arr;
  for (int i = 0; i < 100000; ++i) {
    arr.push_back(Value::number(i));
  }
  bench_round("BSON: Serialize array (100000 int32)",
              "BSON: Deserialize array (100000 int32)",
              Document{{"values", Value::array(std::move(arr))}},
              5);
}

static void bench_large_string_and_binary() {
  const Document doc{{"text", Value::string(std::string(1024 * 1024, 'x'))},
                     {"blob", Value::binary(std::vector<byte>(4 * 1024 * 1024, byte{0x5A}))}};
  bench_round("BSON: Serialize 1 MB string + 4 MB binary",
              "BSON: Deserialize 1 MB string + 4 MB binary",
              doc,
              5);
}

static void bench_calculate_size() {
  Document doc;
  for (int i = 0; i < 10000; ++i) {
    doc.set("k" + std::to_string(i), Value::string("value"));
  }
  std::size_t size = 0;
  if (auto ec = calculate_object_size(doc, SerializeOptions{}, size)) {
    std::cerr << "Calculate size failed: " << ec.message() << "\n";
    return;
  }
  BENCH_RUN("BSON: Calculate size (10000 string fields)", size, 10, {
    std::size_t out = 0;
    auto ec = calculate_object_size(doc, SerializeOptions{}, out);
    if (ec) {
      std::cerr << "Calculate size failed: " << ec.message() << "\n";
    }
  });
}

int main() {
  bench_deep_nested();
  bench_wide_document();
  bench_large_array();
  bench_large_string_and_binary();
  bench_calculate_size();

  bson::benchmarks::print_results();
  return 0;
}
