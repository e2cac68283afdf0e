/**
 * @file test_properties.cpp
 * @brief Property-based tests - random operation sequences against a std::map model
 *
 * After every operation the table must agree with the model and keep its
 * invariants:
 * - occupied keys strictly ascending in slot order
 * - no entry before its ideal bucket
 * - never more than capacity entries
 * Failed operations (map_full, overflow_exhausted) must leave the table as it was.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_template_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <rhmap/rhmap.hpp>
#include <algorithm>
#include <map>
#include <random>
#include <string>
#include <vector>

using namespace rhmap;

namespace {

// Keys with a uniform first byte and a narrow tail, so neighbouring keys
// share buckets and long displacement chains form.
std::vector<std::string> key_pool(size_t count, uint32_t seed) {
    std::mt19937 rng{seed};
    std::uniform_int_distribution<size_t> len_dist{0, 6};
    std::uniform_int_distribution<int> head_dist{0x00, 0xFE};
    std::uniform_int_distribution<int> tail_dist{'a', 'd'};

    std::vector<std::string> pool;
    pool.reserve(count);
    while (pool.size() < count) {
        std::string key(len_dist(rng), '\0');
        for (size_t i = 0; i < key.size(); ++i) {
            key[i] = static_cast<char>(i == 0 ? head_dist(rng) : tail_dist(rng));
        }
        if (std::find(pool.begin(), pool.end(), key) == pool.end()) {
            pool.push_back(std::move(key));
        }
    }
    return pool;
}

template<typename Map>
void require_matches(const Map& m, const std::map<std::string, std::string>& model) {
    REQUIRE(m.check_invariants().has_value());
    REQUIRE(m.size() == model.size());
    REQUIRE(m.size() <= m.capacity().value);

    auto it = model.begin();
    for (const auto& e : m.scan_ascending()) {
        REQUIRE(it != model.end());
        REQUIRE(e.key == it->first);
        REQUIRE(e.value == it->second);
        REQUIRE(e.index.value >= m.ideal_bucket(e.key).value);
        ++it;
    }
    REQUIRE(it == model.end());

    auto rit = model.rbegin();
    for (const auto& e : m.scan_descending()) {
        REQUIRE(rit != model.rend());
        REQUIRE(e.key == rit->first);
        ++rit;
    }
    REQUIRE(rit == model.rend());
}

} // namespace

TEMPLATE_TEST_CASE("Random operations agree with an ordered model", "[properties][model]",
                   ordered_map, wide_ordered_map) {
    auto seed = GENERATE(1u, 2u, 3u, 4u);
    auto capacity_bits = GENERATE(3u, 8u);

    const uint64_t capacity = 1ULL << capacity_bits;
    auto created = TestType::create(map_config{.capacity = slot_count{capacity}});
    REQUIRE(created.has_value());
    auto& m = *created;

    auto pool = key_pool(capacity * 3 / 2 + 1, seed);
    std::map<std::string, std::string> model;

    std::mt19937 rng{seed * 7919u};
    std::uniform_int_distribution<size_t> key_dist{0, pool.size() - 1};
    std::uniform_int_distribution<int> op_dist{0, 9};

    for (size_t step = 0; step < 2000; ++step) {
        const auto& key = pool[key_dist(rng)];
        auto op = op_dist(rng);
        bool present = model.contains(key);

        if (op < 5) {
            auto value = std::to_string(step);
            auto s = m.put(key, value);

            if (present) {
                REQUIRE(s.has_value());
                model[key] = value;
            } else if (model.size() == capacity) {
                REQUIRE(s.error() == error::map_full);
            } else if (s) {
                model[key] = value;
            } else {
                // Only a chain reaching the end of the table may refuse a new key
                REQUIRE(s.error() == error::overflow_exhausted);
            }
        } else if (op < 8) {
            auto r = m.remove(key);
            if (present) {
                REQUIRE(r.has_value());
                REQUIRE(*r == model[key]);
                model.erase(key);
            } else {
                REQUIRE(r.error() == error::key_not_found);
            }
        } else {
            auto r = m.get(key);
            if (present) {
                REQUIRE(r.value() == model[key]);
            } else {
                REQUIRE(r.error() == error::key_not_found);
            }
        }

        if (step % 50 == 0) {
            require_matches(m, model);
        } else {
            REQUIRE(m.check_invariants().has_value());
        }
    }

    require_matches(m, model);

    // Draining leaves an empty table
    for (const auto& [key, value] : model) {
        REQUIRE(m.remove(key).value() == value);
    }
    REQUIRE(m.empty());
    REQUIRE_FALSE(m.scan_ascending().next().has_value());
    REQUIRE(m.check_invariants().has_value());
}

TEST_CASE("Round-trip and overwrite properties", "[properties][roundtrip]") {
    auto m = make_map(map_config{.capacity = slot_count{1 << 10}});
    REQUIRE(m.has_value());

    auto pool = key_pool(500, 42);
    for (size_t i = 0; i < pool.size(); ++i) {
        const auto& key = pool[i];

        REQUIRE(m->put(key, "first").has_value());
        REQUIRE(m->get(key).value() == "first");

        auto len = m->size();
        REQUIRE(m->put(key, "second").has_value());
        REQUIRE(m->get(key).value() == "second");
        REQUIRE(m->size() == len);

        if (i % 3 == 0) {
            REQUIRE(m->remove(key).value() == "second");
            REQUIRE(m->get(key).error() == error::key_not_found);
            REQUIRE(m->size() == len - 1);
        }
    }
    REQUIRE(m->check_invariants().has_value());
}

TEST_CASE("Filling to capacity in random order", "[properties][capacity]") {
    auto seed = GENERATE(11u, 12u, 13u);
    constexpr uint64_t capacity = 1 << 6;

    auto m = make_map(map_config{.capacity = slot_count{capacity}});
    REQUIRE(m.has_value());

    // One key per bucket: the first byte selects bucket i, the rest is random.
    // No displacement run can form, so every key fits whatever the order.
    std::mt19937 rng{seed};
    std::uniform_int_distribution<int> low_bits{0, 2};
    std::uniform_int_distribution<int> tail{0x00, 0xFE};
    std::vector<std::string> keys;
    for (uint64_t i = 0; i < capacity; ++i) {
        std::string key(1, static_cast<char>(i * 4 + low_bits(rng)));
        key.push_back(static_cast<char>(tail(rng)));
        keys.push_back(std::move(key));
    }
    std::shuffle(keys.begin(), keys.end(), rng);

    for (const auto& key : keys) {
        REQUIRE(m->put(key, "v").has_value());
        REQUIRE(m->check_invariants().has_value());
    }
    REQUIRE(m->size() == capacity);

    auto before = m->statistics();
    auto s = m->put("\x80zz", "v");
    REQUIRE(s.error() == error::map_full);
    REQUIRE(m->size() == capacity);
    REQUIRE(m->get("\x80zz").error() == error::key_not_found);
    REQUIRE(m->statistics().max_displacement == before.max_displacement);

    // Existing keys can still be overwritten at capacity
    REQUIRE(m->put(keys.front(), "w").has_value());
    REQUIRE(m->get(keys.front()).value() == "w");

    // Freeing one slot admits exactly one new key
    REQUIRE(m->remove(keys.back()).has_value());
    REQUIRE(m->put("\x80zz", "v").has_value());
    REQUIRE(m->put(keys.back(), "v").error() == error::map_full);
}
