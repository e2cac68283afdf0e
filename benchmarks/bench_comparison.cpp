/**
 * @file bench_comparison.cpp
 * @brief Full-cycle comparison: rhmap vs std::map (red-black tree)
 *
 * Each round inserts the whole key set and then deletes it again, so both
 * structures end every round empty. Both are ordered, which is what makes the
 * comparison fair: a plain unordered hash map does not keep keys sorted.
 *
 * Usage: bench_comparison [keys] [rounds] [hex|binary]
 */

#include "benchmark_utils.hpp"
#include <rhmap/rhmap.hpp>
#include <bit>
#include <iostream>
#include <map>
#include <string>
#include <string_view>

using namespace rhmap;
using namespace rhmap::bench;

int main(int argc, char* argv[]) {
    std::cout << "=== rhmap vs std::map Full-Cycle Comparison ===\n\n";

    // Defaults to 70% of a 2^16-slot map with hex keys
    const size_t num_keys = (argc > 1) ? std::stoull(argv[1]) : (1ULL << 16) * 7 / 10;
    const size_t rounds = (argc > 2) ? std::stoull(argv[2]) : 10;
    const std::string_view mode = (argc > 3) ? argv[3] : "hex";

    if (num_keys == 0 || rounds == 0) {
        std::cerr << "Key count and rounds must be positive\n";
        return 2;
    }
    if (mode != "hex" && mode != "binary") {
        std::cerr << "Key format must be 'hex' or 'binary'\n";
        return 2;
    }
    const auto format = mode == "hex" ? key_format::hex : key_format::binary;

    // Smallest power of two holding the keys at a load factor of at most 0.7
    const slot_count capacity{std::bit_ceil((static_cast<uint64_t>(num_keys) * 10 + 6) / 7)};

    std::cout << "Configuration:\n";
    std::cout << "  Keys:     " << num_keys << " (" << mode << ")\n";
    std::cout << "  Capacity: " << capacity.value << "\n";
    std::cout << "  Rounds:   " << rounds << "\n\n";

    std::cout << "Generating test data...\n";
    key_generator keys(num_keys, format);
    std::vector<std::string> values;
    values.reserve(num_keys);
    for (size_t i = 0; i < num_keys; ++i) {
        values.push_back(std::to_string(i));
    }

    // ===== Test 1: rhmap =====
    std::cout << "\n=== Testing rhmap ===\n";

    auto map = make_map(map_config{.capacity = capacity});
    if (!map) {
        std::cerr << "Failed to create map: " << error_message(map.error()) << "\n";
        return 1;
    }

    std::vector<double> rhmap_times;
    rhmap_times.reserve(rounds);

    for (size_t round = 0; round < rounds; ++round) {
        timer t;
        for (size_t i = 0; i < num_keys; ++i) {
            if (auto s = map->put(keys.get(i), values[i]); !s) {
                std::cerr << "Failed to insert key " << i << ": "
                          << error_message(s.error()) << "\n";
                return 1;
            }
        }
        for (size_t i = 0; i < num_keys; ++i) {
            if (auto r = map->remove(keys.get(i)); !r) {
                std::cerr << "Failed to delete key " << i << ": "
                          << error_message(r.error()) << "\n";
                return 1;
            }
        }
        double elapsed = t.elapsed_ms();
        rhmap_times.push_back(elapsed);
        std::cout << "rhmap (#" << (round + 1) << "): " << std::fixed
                  << std::setprecision(2) << elapsed << " ms\n";
    }

    if (!map->empty() || map->scan_ascending().next()) {
        std::cerr << "rhmap not empty after full cycle\n";
        return 1;
    }

    // ===== Test 2: std::map =====
    std::cout << "\n=== Testing std::map ===\n";

    std::map<std::string, std::string> tree;
    std::vector<double> tree_times;
    tree_times.reserve(rounds);

    for (size_t round = 0; round < rounds; ++round) {
        timer t;
        for (size_t i = 0; i < num_keys; ++i) {
            tree.insert_or_assign(keys.get(i), values[i]);
        }
        for (size_t i = 0; i < num_keys; ++i) {
            tree.erase(keys.get(i));
        }
        double elapsed = t.elapsed_ms();
        tree_times.push_back(elapsed);
        std::cout << "std::map (#" << (round + 1) << "): " << std::fixed
                  << std::setprecision(2) << elapsed << " ms\n";
    }

    if (!tree.empty()) {
        std::cerr << "std::map not empty after full cycle\n";
        return 1;
    }

    // ===== Results =====
    auto rhmap_stats = compute_stats(rhmap_times);
    auto tree_stats = compute_stats(tree_times);

    rhmap_stats.print("rhmap full cycle", "ms");
    tree_stats.print("std::map full cycle", "ms");

    std::cout << "\n=== Comparison Table (CSV) ===\n";
    std::cout << "System,Min,Median,Mean,p90,p99\n";
    rhmap_stats.print_csv("rhmap");
    tree_stats.print_csv("std::map");

    std::cout << "\n=== Speedup Analysis ===\n";
    std::cout << "rhmap is " << std::fixed << std::setprecision(2)
              << tree_stats.median / rhmap_stats.median << "x faster (median)\n";

    return 0;
}
