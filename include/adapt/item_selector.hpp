#pragma once

#include "types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace adapt::selection {

using UsedSet = std::unordered_set<std::string>;

// Index of the unused item whose difficulty is closest to 0. Ties go to the
// earliest item in pool order. nullopt when every item is used.
std::optional<std::size_t> first_item(const std::vector<CalibratedItem>& pool,
                                      const UsedSet& used);

// Index of the unused item carrying the most information at theta, ties to
// the earliest in pool order. nullopt means the adaptive phase is over.
std::optional<std::size_t> next_item(const std::vector<CalibratedItem>& pool,
                                     const UsedSet& used,
                                     double theta);

} // namespace adapt::selection
