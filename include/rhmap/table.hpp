/**
 * @file table.hpp
 * @brief The ordered robin-hood table - one flat array kept in ascending key order
 */

#pragma once

#include "core.hpp"
#include "hashers.hpp"
#include "scan.hpp"
#include <algorithm>
#include <bit>
#include <string>
#include <utility>
#include <vector>

namespace rhmap {

/**
 * @class ordered_table
 * @brief Fixed-capacity open-addressing map whose slots stay sorted by key
 *
 * Entries live in one vector of capacity + overflow slots. An order-preserving
 * hasher assigns each key an ideal bucket; insertion displaces larger keys one
 * slot to the right and deletion shifts followers back left, so at all times:
 *
 * - occupied keys are strictly ascending in slot order
 * - no key sits before its ideal bucket
 * - at most capacity slots are occupied
 *
 * Not thread-safe. Callers must serialize access externally.
 */
template<hasher Hasher = prefix32_hasher>
class ordered_table {
    Hasher hasher_;
    std::vector<entry> entries_;
    uint64_t capacity_;
    std::size_t len_{0};

    ordered_table(Hasher h, slot_count capacity, std::size_t overflow)
        : hasher_(std::move(h)),
          entries_(capacity.value + overflow),
          capacity_(capacity.value) {}

    // First slot at or after the ideal bucket whose key is not less than key;
    // entries_.size() if the run reaches the end of the table.
    [[nodiscard]] std::size_t locate(std::string_view key) const noexcept {
        std::size_t i = hasher_.index_for(key).value;
        while (i < entries_.size() && std::string_view{entries_[i].key} < key) {
            ++i;
        }
        return i;
    }

    [[nodiscard]] bool holds(std::size_t i, std::string_view key) const noexcept {
        return i < entries_.size() && entries_[i].key == key;
    }

public:
    using hasher_type = Hasher;
    using scan_ascending_type = scan<ordered_table, scan_order::ascending>;
    using scan_descending_type = scan<ordered_table, scan_order::descending>;

    /**
     * @brief Create an empty table
     * @return invalid_capacity unless the capacity is a power of two the hasher can project onto
     */
    [[nodiscard]] static result<ordered_table> create(const map_config& cfg = map_config{}) {
        if constexpr (requires { Hasher::supports(cfg.capacity); }) {
            if (!Hasher::supports(cfg.capacity)) {
                return std::unexpected(error::invalid_capacity);
            }
        } else if (!std::has_single_bit(cfg.capacity.value)) {
            return std::unexpected(error::invalid_capacity);
        }

        auto overflow = cfg.overflow.value_or(default_overflow(cfg.capacity));
        return ordered_table{Hasher{cfg.capacity}, cfg.capacity, overflow};
    }

    // ===== CORE OPERATIONS =====

    [[nodiscard]] slot_index ideal_bucket(std::string_view key) const noexcept {
        return hasher_.index_for(key);
    }

    /**
     * @brief Look up a key
     *
     * Probes forward from the ideal bucket and stops at the first key not less
     * than the target; the sentinel bounds the probe on empty slots.
     */
    [[nodiscard]] result<std::string_view> get(std::string_view key) const {
        if (!is_valid_key(key)) {
            return std::unexpected(error::invalid_key);
        }

        auto i = locate(key);
        if (!holds(i, key)) {
            return std::unexpected(error::key_not_found);
        }
        return std::string_view{entries_[i].value};
    }

    [[nodiscard]] bool contains(std::string_view key) const {
        return get(key).has_value();
    }

    /**
     * @brief Find the slot for a key, creating it if absent
     *
     * A new key lands on the first slot holding a greater key (or the
     * sentinel). Every entry from there up to the next empty slot is carried
     * one slot to the right, each taking the place of its successor, so
     * global order is kept and nothing moves before its ideal bucket. The
     * empty slot is found before anything moves, so a failed call leaves the
     * table untouched. The value of a created slot is empty.
     *
     * @return slot index and whether the key was already present;
     *         map_full, overflow_exhausted or invalid_key on failure
     */
    [[nodiscard]] result<insert_position> get_or_put(std::string_view key) {
        if (!is_valid_key(key)) {
            return std::unexpected(error::invalid_key);
        }

        auto i = locate(key);
        if (holds(i, key)) {
            return insert_position{true, slot_index{i}};
        }

        if (len_ >= capacity_) {
            return std::unexpected(error::map_full);
        }

        auto first = entries_.begin() + static_cast<std::ptrdiff_t>(i);
        auto gap = std::find_if(first, entries_.end(),
                                [](const entry& e) { return e.empty(); });
        if (gap == entries_.end()) {
            return std::unexpected(error::overflow_exhausted);
        }

        std::move_backward(first, gap, gap + 1);
        first->key.assign(key);
        first->value.clear();
        ++len_;

        return insert_position{false, slot_index{i}};
    }

    /**
     * @brief Insert or overwrite a key-value pair
     */
    [[nodiscard]] status put(std::string_view key, std::string_view value) {
        auto pos = get_or_put(key);
        if (!pos) {
            return std::unexpected(pos.error());
        }
        entries_[pos->index.value].value.assign(value);
        return {};
    }

    /**
     * @brief Write a value into an occupied slot located by get_or_put
     */
    [[nodiscard]] status assign(slot_index idx, std::string_view value) {
        if (idx.value >= entries_.size() || entries_[idx.value].empty()) {
            return std::unexpected(error::invalid_slot);
        }
        entries_[idx.value].value.assign(value);
        return {};
    }

    /**
     * @brief Remove a key and return its value
     *
     * Closes the gap by backward shifting: each follower moves one slot left
     * while its ideal bucket is at or before the gap. The first follower that
     * is empty or already at its ideal bucket stops the chain, and the gap
     * left behind becomes the sentinel.
     */
    [[nodiscard]] result<std::string> remove(std::string_view key) {
        if (!is_valid_key(key)) {
            return std::unexpected(error::invalid_key);
        }

        auto i = locate(key);
        if (!holds(i, key)) {
            return std::unexpected(error::key_not_found);
        }

        std::string removed = std::move(entries_[i].value);

        while (i + 1 < entries_.size()) {
            auto& next = entries_[i + 1];
            if (next.empty() || hasher_.index_for(next.key).value > i) {
                break;
            }
            entries_[i] = std::move(next);
            ++i;
        }

        entries_[i].clear();
        --len_;

        return removed;
    }

    // ===== SLOT ACCESS =====

    [[nodiscard]] result<entry_view> entry_at(slot_index idx) const noexcept {
        if (idx.value >= entries_.size() || entries_[idx.value].empty()) {
            return std::unexpected(error::invalid_slot);
        }
        const auto& e = entries_[idx.value];
        return entry_view{idx, e.key, e.value};
    }

    // ===== ITERATION =====

    [[nodiscard]] scan_ascending_type scan_ascending() const noexcept {
        return scan_ascending_type{*this};
    }

    [[nodiscard]] scan_descending_type scan_descending() const noexcept {
        return scan_descending_type{*this};
    }

    // ===== SIZE =====

    [[nodiscard]] std::size_t size() const noexcept { return len_; }
    [[nodiscard]] bool empty() const noexcept { return len_ == 0; }
    [[nodiscard]] slot_count capacity() const noexcept { return slot_count{capacity_}; }
    [[nodiscard]] slot_count table_size() const noexcept { return slot_count{entries_.size()}; }
    [[nodiscard]] const Hasher& get_hasher() const noexcept { return hasher_; }

    // ===== STATISTICS =====

    struct stats {
        slot_count capacity;
        slot_count table_slots;
        std::size_t used_slots;
        double load_factor;
        std::size_t max_displacement;
        double mean_displacement;
    };

    [[nodiscard]] stats statistics() const noexcept {
        std::size_t max_disp = 0;
        std::size_t total_disp = 0;

        for (std::size_t i = 0; i < entries_.size(); ++i) {
            if (entries_[i].empty()) {
                continue;
            }
            auto ideal = hasher_.index_for(entries_[i].key).value;
            std::size_t disp = i >= ideal ? static_cast<std::size_t>(i - ideal) : 0;
            max_disp = std::max(max_disp, disp);
            total_disp += disp;
        }

        return {
            capacity(),
            table_size(),
            len_,
            static_cast<double>(len_) / static_cast<double>(capacity_),
            max_disp,
            len_ ? static_cast<double>(total_disp) / static_cast<double>(len_) : 0.0
        };
    }

    /**
     * @brief Verify ordering, displacement and capacity invariants
     * @return corrupted on the first violation found
     */
    [[nodiscard]] status check_invariants() const {
        std::size_t occupied = 0;
        const entry* previous = nullptr;

        for (std::size_t i = 0; i < entries_.size(); ++i) {
            const auto& e = entries_[i];
            if (e.empty()) {
                continue;
            }
            if (!is_valid_key(e.key) || hasher_.index_for(e.key).value > i) {
                return std::unexpected(error::corrupted);
            }
            if (previous && !(previous->key < e.key)) {
                return std::unexpected(error::corrupted);
            }
            previous = &e;
            ++occupied;
        }

        if (occupied != len_ || len_ > capacity_) {
            return std::unexpected(error::corrupted);
        }
        return {};
    }
};

} // namespace rhmap
