/**
 * @file bench_latency.cpp
 * @brief Single-threaded latency benchmark for rhmap point operations and scans
 */

#include "benchmark_utils.hpp"
#include <rhmap/rhmap.hpp>
#include <iostream>
#include <bit>
#include <random>

using namespace rhmap;
using namespace rhmap::bench;

int main(int argc, char* argv[]) {
    std::cout << "=== rhmap Single-Threaded Latency Benchmark ===\n\n";

    const size_t num_keys = (argc > 1) ? std::stoull(argv[1]) : 500000;
    const size_t num_queries = (argc > 2) ? std::stoull(argv[2]) : 1000000;

    // Smallest power of two keeping the load factor at or below one half
    slot_count capacity{std::bit_ceil(static_cast<uint64_t>(num_keys) * 2)};

    std::cout << "Configuration:\n";
    std::cout << "  Keys:     " << num_keys << "\n";
    std::cout << "  Queries:  " << num_queries << "\n";
    std::cout << "  Capacity: " << capacity.value << "\n\n";

    auto map = make_map(map_config{.capacity = capacity});
    if (!map) {
        std::cerr << "Failed to create map: " << error_message(map.error()) << "\n";
        return 1;
    }

    std::cout << "Generating test data...\n";
    key_generator keys(num_keys * 2);

    // Only the first half is inserted; the second half serves as misses
    std::cout << "Populating map...\n";
    timer populate_timer;
    for (size_t i = 0; i < num_keys; ++i) {
        if (auto s = map->put(keys.get(i), std::to_string(i)); !s) {
            std::cerr << "Failed to insert key " << i << ": "
                      << error_message(s.error()) << "\n";
            return 1;
        }
    }
    std::cout << "Population complete in " << populate_timer.elapsed_ms() << " ms\n";

    auto table_stats = map->statistics();
    std::cout << "Load factor:       " << table_stats.load_factor << "\n";
    std::cout << "Max displacement:  " << table_stats.max_displacement << "\n";
    std::cout << "Mean displacement: " << table_stats.mean_displacement << "\n";

    std::mt19937_64 rng(42);
    std::uniform_int_distribution<size_t> dist(0, num_keys - 1);

    // ===== Benchmark 1: hits =====
    std::cout << "\n=== Benchmark 1: Random GET Hits ===\n";
    std::vector<double> hit_latencies;
    hit_latencies.reserve(num_queries);

    for (size_t i = 0; i < num_queries; ++i) {
        const auto& key = keys.get(dist(rng));

        timer t;
        auto result = map->get(key);
        hit_latencies.push_back(static_cast<double>(t.elapsed_ns()));

        if (!result) {
            std::cerr << "Key not found at query " << i << "\n";
            return 1;
        }
    }
    auto hit_stats = compute_stats(hit_latencies);
    hit_stats.print("Random GET Hit Latency", "ns");

    // ===== Benchmark 2: misses =====
    std::cout << "\n=== Benchmark 2: Random GET Misses ===\n";
    std::vector<double> miss_latencies;
    miss_latencies.reserve(num_queries);

    for (size_t i = 0; i < num_queries; ++i) {
        const auto& key = keys.get(num_keys + dist(rng));

        timer t;
        auto result = map->get(key);
        miss_latencies.push_back(static_cast<double>(t.elapsed_ns()));

        if (result) {
            std::cerr << "Unexpected: found missing key at query " << i << "\n";
            return 1;
        }
    }
    auto miss_stats = compute_stats(miss_latencies);
    miss_stats.print("Random GET Miss Latency", "ns");

    // ===== Benchmark 3: ordered scans =====
    std::cout << "\n=== Benchmark 3: Ordered Scans ===\n";
    timer scan_timer;
    size_t visited = 0;
    for (const auto& e : map->scan_ascending()) {
        visited += e.key.size() > 0;
    }
    for (const auto& e : map->scan_descending()) {
        visited += e.key.size() > 0;
    }
    double scan_ms = scan_timer.elapsed_ms();
    std::cout << "Visited " << visited << " entries in " << std::fixed
              << std::setprecision(2) << scan_ms << " ms\n";

    std::cout << "\n=== Summary Table (CSV) ===\n";
    std::cout << "Operation,Min,Median,Mean,p90,p99\n";
    hit_stats.print_csv("GET hit");
    miss_stats.print_csv("GET miss");

    return 0;
}
