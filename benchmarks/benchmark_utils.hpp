/**
 * @file benchmark_utils.hpp
 * @brief Timing, statistics and key generation shared by the benchmarks
 */

#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <random>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace rhmap::bench {

class timer {
    using clock = std::chrono::steady_clock;
    clock::time_point start_{clock::now()};

public:
    void reset() { start_ = clock::now(); }

    uint64_t elapsed_ns() const {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(clock::now() - start_).count();
    }

    double elapsed_ms() const { return elapsed_ns() / 1e6; }
};

/**
 * @brief Order statistics of a sample of measurements
 *
 * Percentiles use the nearest-rank rule on the sorted sample.
 */
struct stats {
    size_t count{0};
    double min{0};
    double max{0};
    double mean{0};
    double median{0};
    double p90{0};
    double p99{0};
    double stddev{0};

    void print(std::string_view label, std::string_view unit = "ns") const {
        auto row = [&](std::string_view name, double v) {
            std::cout << "  " << std::left << std::setw(8) << name << std::right
                      << std::fixed << std::setprecision(2) << v << " " << unit << "\n";
        };
        std::cout << "\n--- " << label << " (" << count << " samples) ---\n";
        row("min", min);
        row("median", median);
        row("mean", mean);
        row("stddev", stddev);
        row("p90", p90);
        row("p99", p99);
        row("max", max);
    }

    void print_csv(std::string_view label) const {
        std::cout << label << std::fixed << std::setprecision(2)
                  << "," << min << "," << median << "," << mean
                  << "," << p90 << "," << p99 << "\n";
    }
};

inline stats compute_stats(std::vector<double> sample) {
    stats s;
    if (sample.empty()) {
        return s;
    }

    std::sort(sample.begin(), sample.end());
    auto rank = [&](double q) {
        auto idx = static_cast<size_t>(std::ceil(q * sample.size()));
        return sample[std::clamp<size_t>(idx, 1, sample.size()) - 1];
    };

    s.count = sample.size();
    s.min = sample.front();
    s.max = sample.back();
    s.mean = std::accumulate(sample.begin(), sample.end(), 0.0) / s.count;
    s.median = rank(0.5);
    s.p90 = rank(0.9);
    s.p99 = rank(0.99);

    double var = 0;
    for (double v : sample) {
        var += (v - s.mean) * (v - s.mean);
    }
    s.stddev = std::sqrt(var / s.count);
    return s;
}

enum class key_format {
    hex,     // 16 lowercase hex digits of a 64-bit mix of the key number
    binary   // uniform bytes in [0x00, 0xFE]
};

/**
 * @class key_generator
 * @brief Distinct benchmark keys, none containing the reserved byte
 *
 * Hex keys fall into 16 of the 256 first-byte values, so their prefixes
 * crowd a few bucket ranges and build long displacement runs. Binary keys
 * spread evenly over the bucket range.
 */
class key_generator {
    std::vector<std::string> keys_;

    // splitmix64 finalizer; a bijection, so distinct inputs give distinct keys
    static uint64_t mix(uint64_t x) {
        x += 0x9E3779B97F4A7C15ULL;
        x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
        x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
        return x ^ (x >> 31);
    }

    static std::string to_hex(uint64_t v) {
        constexpr std::string_view digits = "0123456789abcdef";
        std::string out(16, '0');
        for (size_t i = 16; i-- > 0; v >>= 4) {
            out[i] = digits[v & 0xF];
        }
        return out;
    }

public:
    explicit key_generator(size_t key_count, key_format format = key_format::binary,
                           uint64_t seed = 42) {
        keys_.reserve(key_count);

        if (format == key_format::hex) {
            for (size_t i = 0; i < key_count; ++i) {
                keys_.push_back(to_hex(mix(seed + i)));
            }
            return;
        }

        std::mt19937_64 gen{seed};
        std::uniform_int_distribution<int> byte_dist{0x00, 0xFE};
        std::unordered_set<std::string> seen;
        seen.reserve(key_count);
        while (keys_.size() < key_count) {
            std::string key(16, '\0');
            for (auto& c : key) {
                c = static_cast<char>(byte_dist(gen));
            }
            if (seen.insert(key).second) {
                keys_.push_back(std::move(key));
            }
        }
    }

    const std::string& get(size_t index) const {
        return keys_[index % keys_.size()];
    }

    const std::vector<std::string>& all_keys() const { return keys_; }
    size_t count() const { return keys_.size(); }
};

} // namespace rhmap::bench
