#include "adapt/calibrator.hpp"

#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace adapt::calibration {
namespace {

double level_offset(CognitiveLevel level) noexcept {
  switch (level) {
    case CognitiveLevel::Recall: return -1.5;
    case CognitiveLevel::Comprehension: return 0.0;
    case CognitiveLevel::Application: return 1.5;
  }
  return 0.0;
}

double label_adjust(DifficultyLabel label) noexcept {
  switch (label) {
    case DifficultyLabel::Easy: return -0.5;
    case DifficultyLabel::Medium: return 0.0;
    case DifficultyLabel::Hard: return 0.5;
  }
  return 0.0;
}

} // namespace

double difficulty(CognitiveLevel level, DifficultyLabel label) noexcept {
  return level_offset(level) + label_adjust(label);
}

ItemParameters calibrate(const Item& item) {
  ItemParameters params;
  params.item_id = item.id;
  params.b = difficulty(item.cognitive_level, item.difficulty_label);
  params.cognitive_level = item.cognitive_level;
  params.difficulty_label = item.difficulty_label;
  return params;
}

std::vector<CalibratedItem> calibrate_pool(std::vector<Item> items) {
  std::vector<CalibratedItem> pool;
  pool.reserve(items.size());
  std::unordered_set<std::string> seen;
  for (auto& item : items) {
    if (item.id.empty()) {
      throw std::invalid_argument("Item id must not be empty");
    }
    if (!seen.insert(item.id).second) {
      throw std::invalid_argument("Duplicate item id in pool: " + item.id);
    }
    CalibratedItem entry;
    entry.params = calibrate(item);
    entry.item = std::move(item);
    pool.push_back(std::move(entry));
  }
  return pool;
}

} // namespace adapt::calibration
