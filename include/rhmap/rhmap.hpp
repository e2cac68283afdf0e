/**
 * @file rhmap.hpp
 * @brief Main header for rhmap - fixed-capacity hash map kept in key order
 *
 * Brings together the hashers, the ordered table and its scans.
 */

#pragma once

#include "core.hpp"
#include "hashers.hpp"
#include "scan.hpp"
#include "table.hpp"

namespace rhmap {

// Default map: 4-byte order-preserving prefix hash
using ordered_map = ordered_table<prefix32_hasher>;

// Wide prefix: more of the key participates in bucket placement
using wide_ordered_map = ordered_table<prefix64_hasher>;

/**
 * @brief Create an in-memory ordered map
 */
[[nodiscard]] inline result<ordered_map> make_map(const map_config& cfg = map_config{}) {
    return ordered_map::create(cfg);
}

} // namespace rhmap
