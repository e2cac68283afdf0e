/**
 * @file core.hpp
 * @brief Core types for rhmap - strong types, errors, entries and configuration
 */

#pragma once

#include <algorithm>
#include <bit>
#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace rhmap {

// ===== STRONG TYPES =====
// Avoid mixing slot positions, table sizes and hashes by accident

struct slot_index {
    uint64_t value;

    explicit constexpr operator uint64_t() const noexcept { return value; }
    constexpr auto operator<=>(const slot_index&) const noexcept = default;
};

struct slot_count {
    uint64_t value;

    explicit constexpr operator uint64_t() const noexcept { return value; }
    constexpr auto operator<=>(const slot_count&) const noexcept = default;
};

struct hash_value {
    uint64_t value;

    explicit constexpr operator uint64_t() const noexcept { return value; }
    constexpr auto operator<=>(const hash_value&) const noexcept = default;
};

// ===== ERROR HANDLING =====

enum class error {
    success = 0,
    key_not_found,
    map_full,
    invalid_key,
    overflow_exhausted,
    invalid_capacity,
    invalid_slot,
    corrupted
};

template<typename T>
using result = std::expected<T, error>;

using status = result<void>;

[[nodiscard]] constexpr std::string_view error_message(error e) noexcept {
    switch (e) {
        case error::success:            return "success";
        case error::key_not_found:      return "key not found";
        case error::map_full:           return "map is full";
        case error::invalid_key:        return "key contains reserved byte 0xFF";
        case error::overflow_exhausted: return "displacement chain ran past the overflow region";
        case error::invalid_capacity:   return "capacity must be a power of two supported by the hasher";
        case error::invalid_slot:       return "slot is empty or out of range";
        case error::corrupted:          return "table invariants violated";
    }
    return "unknown error";
}

// ===== KEYS AND ENTRIES =====

/**
 * @brief Key stored in empty slots
 *
 * Byte 0xFF never occurs in a legal key, so under unsigned byte-wise
 * comparison the sentinel is greater than every key a caller can store.
 * Lookups and insertions stop on it without a separate emptiness test.
 */
inline constexpr std::string_view sentinel_key{"\xFF\xFF\xFF\xFF", 4};

inline constexpr unsigned char reserved_byte = 0xFF;

[[nodiscard]] constexpr bool is_valid_key(std::string_view key) noexcept {
    return std::none_of(key.begin(), key.end(), [](char c) {
        return static_cast<unsigned char>(c) == reserved_byte;
    });
}

struct entry {
    std::string key{sentinel_key};
    std::string value;

    [[nodiscard]] bool empty() const noexcept { return key == sentinel_key; }

    void clear() {
        key.assign(sentinel_key);
        value.clear();
    }
};

// Read-only view of an occupied slot; invalidated by the next mutation
struct entry_view {
    slot_index index;
    std::string_view key;
    std::string_view value;
};

struct insert_position {
    bool existed;
    slot_index index;
};

// ===== CONFIGURATION =====

// Aggregate so callers can use designated initializers
struct map_config {
    slot_count capacity{1024};
    std::optional<std::size_t> overflow{};
};

/**
 * @brief Default number of slots appended past the nominal capacity
 *
 * Roughly a fifth of the capacity plus two slots per index bit, which lets
 * displacement chains near the top buckets finish without wrapping.
 */
[[nodiscard]] constexpr std::size_t default_overflow(slot_count capacity) noexcept {
    auto bits = static_cast<std::size_t>(std::countr_zero(capacity.value));
    return (static_cast<std::size_t>(capacity.value / 10) + bits) * 2;
}

// ===== CONCEPTS =====

/**
 * @concept hasher
 * @brief Order-preserving projection of keys onto buckets
 *
 * index_for must be non-decreasing in byte-wise key order and stay below
 * max_slots() for every key.
 */
template<typename H>
concept hasher = requires(const H h, std::string_view key) {
    { h.hash(key) } -> std::same_as<hash_value>;
    { h.index_for(key) } -> std::same_as<slot_index>;
    { h.max_slots() } -> std::same_as<slot_count>;
};

} // namespace rhmap
