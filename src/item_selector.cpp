#include "adapt/item_selector.hpp"

#include "adapt/response_model.hpp"

#include <cmath>

namespace adapt::selection {

std::optional<std::size_t> first_item(const std::vector<CalibratedItem>& pool,
                                      const UsedSet& used) {
  std::optional<std::size_t> best;
  double best_distance = 0.0;
  for (std::size_t i = 0; i < pool.size(); ++i) {
    if (used.count(pool[i].params.item_id) != 0) {
      continue;
    }
    const double distance = std::abs(pool[i].params.b);
    if (!best.has_value() || distance < best_distance) {
      best = i;
      best_distance = distance;
    }
  }
  return best;
}

std::optional<std::size_t> next_item(const std::vector<CalibratedItem>& pool,
                                     const UsedSet& used,
                                     double theta) {
  std::optional<std::size_t> best;
  double best_information = 0.0;
  for (std::size_t i = 0; i < pool.size(); ++i) {
    if (used.count(pool[i].params.item_id) != 0) {
      continue;
    }
    const double info = model::information(theta, pool[i].params.b);
    if (!best.has_value() || info > best_information) {
      best = i;
      best_information = info;
    }
  }
  return best;
}

} // namespace adapt::selection
