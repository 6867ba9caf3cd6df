#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace bson::benchmarks {

struct BenchmarkResult {
    std::string_view name;
    std::size_t bytes_per_run;
    double avg_ms;
    double best_ms;
    double throughput_mbps;
};

inline std::vector<BenchmarkResult> &results() {
    static std::vector<BenchmarkResult> results_;
    return results_;
}

/**
 * @brief 执行 func iterations 次，记录平均与最好耗时。
 *
 * 吞吐按平均耗时计算；bytes_per_run 为 0 时不计算吞吐。
 */
template <typename Func>
inline void run_benchmark(std::string_view name,
                          std::size_t bytes_per_run,
                          int iterations,
                          Func &&func) {
    using clock = std::chrono::steady_clock;

    double total_ms = 0.0;
    double best_ms = 0.0;
    for (int i = 0; i < iterations; ++i) {
        const auto begin = clock::now();
        func();
        const auto elapsed = std::chrono::duration<double, std::milli>(clock::now() - begin).count();
        total_ms += elapsed;
        best_ms = (i == 0) ? elapsed : std::min(best_ms, elapsed);
    }

    const double avg_ms = iterations > 0 ? total_ms / iterations : 0.0;
    double throughput_mbps = 0.0;
    if (avg_ms > 0.0 && bytes_per_run != 0) {
        throughput_mbps = (static_cast<double>(bytes_per_run) / (1024.0 * 1024.0)) / (avg_ms / 1000.0);
    }
    results().push_back({name, bytes_per_run, avg_ms, best_ms, throughput_mbps});
}

inline std::string format_size(std::size_t bytes) {
    if (bytes >= 1024 * 1024) {
        return std::to_string(bytes / (1024 * 1024)) + " MB";
    }
    if (bytes >= 1024) {
        return std::to_string(bytes / 1024) + " KB";
    }
    return std::to_string(bytes) + " B";
}

inline void print_results() {
    const std::string rule(96, '=');
    std::cout << "\n" << rule << "\n";
    std::cout << std::left << std::setw(44) << "Benchmark" << std::setw(12) << "Size"
              << std::setw(14) << "Avg (ms)" << std::setw(14) << "Best (ms)" << "MB/s\n";
    std::cout << std::string(96, '-') << "\n";

    for (const auto &r : results()) {
        std::cout << std::left << std::setw(44) << r.name << std::setw(12) << format_size(r.bytes_per_run)
                  << std::fixed << std::setprecision(3) << std::setw(14) << r.avg_ms << std::setw(14)
                  << r.best_ms;
        if (r.throughput_mbps > 0.0) {
            std::cout << r.throughput_mbps;
        } else {
            std::cout << "N/A";
        }
        std::cout << "\n";
    }
    std::cout << rule << "\n\n";
}

} // namespace bson::benchmarks

#define BENCH_RUN(name, size, iterations, code)                                \
    ::bson::benchmarks::run_benchmark(name, size, iterations, [&]() { code; })
