#pragma once

#include "types.hpp"

#include <vector>

namespace adapt::calibration {

// Rasch difficulty b for an item's tags. Larger values denote harder items;
// the table spans [-2, 2].
double difficulty(CognitiveLevel level, DifficultyLabel label) noexcept;

ItemParameters calibrate(const Item& item);

// Calibrates every item of a pool, keeping pool order. Throws
// std::invalid_argument on an empty item id or a duplicate id.
std::vector<CalibratedItem> calibrate_pool(std::vector<Item> items);

} // namespace adapt::calibration
