/**
 * @file scan.hpp
 * @brief Lazy ordered traversal over the occupied slots of a table
 */

#pragma once

#include "core.hpp"
#include <cstddef>
#include <iterator>
#include <optional>

namespace rhmap {

enum class scan_order { ascending, descending };

/**
 * @class scan
 * @brief Restartable cursor over occupied slots in slot order
 *
 * Holds a pointer to the table and a cursor, nothing else. Since occupied
 * keys are kept in ascending order, slot order is key order. Only the
 * table's table_size() and entry_at() are used, so every step is
 * bounds-checked even if the table is mutated mid-scan (the sequence is
 * then unspecified).
 */
template<typename Table, scan_order Order>
class scan {
    const Table* table_;
    uint64_t remaining_;

    [[nodiscard]] uint64_t total() const noexcept {
        return table_->table_size().value;
    }

public:
    class iterator {
        scan* owner_{nullptr};
        std::optional<entry_view> current_;

    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = entry_view;
        using difference_type = std::ptrdiff_t;
        using pointer = const entry_view*;
        using reference = const entry_view&;

        iterator() = default;
        explicit iterator(scan* owner) : owner_(owner), current_(owner->next()) {}

        reference operator*() const noexcept { return *current_; }
        pointer operator->() const noexcept { return &*current_; }

        iterator& operator++() {
            current_ = owner_->next();
            return *this;
        }

        void operator++(int) { ++*this; }

        friend bool operator==(const iterator& it, std::default_sentinel_t) noexcept {
            return !it.current_.has_value();
        }
    };

    explicit scan(const Table& table) noexcept
        : table_(&table), remaining_(table.table_size().value) {}

    /**
     * @brief Next occupied entry, or nullopt once the table is exhausted
     */
    [[nodiscard]] std::optional<entry_view> next() {
        while (remaining_ > 0) {
            auto pos = Order == scan_order::ascending
                ? total() - remaining_
                : remaining_ - 1;
            --remaining_;

            if (auto e = table_->entry_at(slot_index{pos})) {
                return *e;
            }
        }
        return std::nullopt;
    }

    void restart() noexcept {
        remaining_ = total();
    }

    // begin() restarts, so one scan object can be iterated repeatedly
    [[nodiscard]] iterator begin() {
        restart();
        return iterator{this};
    }

    [[nodiscard]] std::default_sentinel_t end() const noexcept { return {}; }
};

} // namespace rhmap
