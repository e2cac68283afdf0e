/**
 * @file hashers.hpp
 * @brief Order-preserving prefix hashers - bucket assignment doubles as a coarse sort
 */

#pragma once

#include "core.hpp"
#include <bit>
#include <concepts>
#include <limits>

namespace rhmap {

/**
 * @class prefix_hasher
 * @brief Packs the leading bytes of a key big-endian into an unsigned word
 *
 * Keys shorter than the word are zero-padded, so for any two keys a <= b
 * (byte-wise) hash(a) <= hash(b), strictly when they differ inside the
 * prefix. The bucket is the top log2(capacity) bits of the word, which keeps
 * the projection monotonic and inside [0, capacity) for every byte value.
 */
template<std::unsigned_integral Word>
class prefix_hasher {
public:
    static constexpr unsigned prefix_bytes = sizeof(Word);
    static constexpr unsigned word_bits = prefix_bytes * 8;

private:
    slot_count slots_;
    unsigned shift_;

public:
    explicit constexpr prefix_hasher(slot_count n) noexcept
        : slots_(n),
          shift_(word_bits - static_cast<unsigned>(std::countr_zero(n.value))) {}

    /**
     * @brief Whether this hasher can project onto @p n buckets
     *
     * Requires a power of two whose index width fits in the prefix word.
     */
    [[nodiscard]] static constexpr bool supports(slot_count n) noexcept {
        return std::has_single_bit(n.value) &&
               static_cast<unsigned>(std::countr_zero(n.value)) <= word_bits;
    }

    [[nodiscard]] constexpr hash_value hash(std::string_view key) const noexcept {
        Word h = 0;
        for (unsigned i = 0; i < prefix_bytes; ++i) {
            h <<= 8;
            if (i < key.size()) {
                h |= static_cast<unsigned char>(key[i]);
            }
        }
        return hash_value{h};
    }

    [[nodiscard]] constexpr slot_index index_for(std::string_view key) const noexcept {
        // Capacity 1 shifts out the whole word; avoid the undefined full-width shift
        if (shift_ >= word_bits) {
            return slot_index{0};
        }
        return slot_index{static_cast<Word>(hash(key).value) >> shift_};
    }

    [[nodiscard]] constexpr slot_count max_slots() const noexcept {
        return slots_;
    }

    [[nodiscard]] constexpr unsigned shift() const noexcept {
        return shift_;
    }
};

using prefix32_hasher = prefix_hasher<uint32_t>;
using prefix64_hasher = prefix_hasher<uint64_t>;

} // namespace rhmap
