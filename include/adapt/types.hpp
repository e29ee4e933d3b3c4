#pragma once

#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace adapt {

enum class CognitiveLevel {
  Recall = 1,
  Comprehension = 2,
  Application = 3
};

inline std::string to_string(CognitiveLevel level) {
  switch (level) {
    case CognitiveLevel::Recall: return "recall";
    case CognitiveLevel::Comprehension: return "comprehension";
    case CognitiveLevel::Application: return "application";
  }
  return "recall";
}

inline CognitiveLevel cognitive_level_from_string(const std::string& value) {
  if (value == "recall") {
    return CognitiveLevel::Recall;
  }
  if (value == "comprehension") {
    return CognitiveLevel::Comprehension;
  }
  if (value == "application") {
    return CognitiveLevel::Application;
  }
  throw std::invalid_argument("Unknown cognitive level: " + value);
}

inline CognitiveLevel cognitive_level_from_ordinal(int ordinal) {
  if (ordinal < 1 || ordinal > 3) {
    throw std::invalid_argument("Cognitive level ordinal out of range: " +
                                std::to_string(ordinal));
  }
  return static_cast<CognitiveLevel>(ordinal);
}

enum class DifficultyLabel {
  Easy,
  Medium,
  Hard
};

inline std::string to_string(DifficultyLabel label) {
  switch (label) {
    case DifficultyLabel::Easy: return "easy";
    case DifficultyLabel::Medium: return "medium";
    case DifficultyLabel::Hard: return "hard";
  }
  return "medium";
}

inline DifficultyLabel difficulty_label_from_string(const std::string& value) {
  if (value == "easy") {
    return DifficultyLabel::Easy;
  }
  if (value == "medium") {
    return DifficultyLabel::Medium;
  }
  if (value == "hard") {
    return DifficultyLabel::Hard;
  }
  throw std::invalid_argument("Unknown difficulty label: " + value);
}

enum class SessionState {
  NotStarted,
  InProgress,
  Completed
};

inline std::string to_string(SessionState state) {
  switch (state) {
    case SessionState::NotStarted: return "not_started";
    case SessionState::InProgress: return "in_progress";
    case SessionState::Completed: return "completed";
  }
  return "not_started";
}

// Qualitative reading of theta. Cut-points sit at -1.5, -0.5, 0.5 and 1.5;
// a value equal to a cut-point belongs to the upper band.
enum class AbilityBand {
  BelowAverage,
  SlightlyBelowAverage,
  Average,
  AboveAverage,
  Excellent
};

inline AbilityBand ability_band_for(double theta) {
  if (theta < -1.5) {
    return AbilityBand::BelowAverage;
  }
  if (theta < -0.5) {
    return AbilityBand::SlightlyBelowAverage;
  }
  if (theta < 0.5) {
    return AbilityBand::Average;
  }
  if (theta < 1.5) {
    return AbilityBand::AboveAverage;
  }
  return AbilityBand::Excellent;
}

inline std::string to_string(AbilityBand band) {
  switch (band) {
    case AbilityBand::BelowAverage: return "below_average";
    case AbilityBand::SlightlyBelowAverage: return "slightly_below_average";
    case AbilityBand::Average: return "average";
    case AbilityBand::AboveAverage: return "above_average";
    case AbilityBand::Excellent: return "excellent";
  }
  return "average";
}

inline std::string display_label(AbilityBand band) {
  switch (band) {
    case AbilityBand::BelowAverage: return "Below Average";
    case AbilityBand::SlightlyBelowAverage: return "Slightly Below Average";
    case AbilityBand::Average: return "Average";
    case AbilityBand::AboveAverage: return "Above Average";
    case AbilityBand::Excellent: return "Excellent";
  }
  return "Average";
}

struct Item {
  std::string id;
  CognitiveLevel cognitive_level = CognitiveLevel::Comprehension;
  DifficultyLabel difficulty_label = DifficultyLabel::Medium;
  // Presentation payload (question text, options, answer key...). Opaque to the engine.
  nlohmann::json content = nlohmann::json::object();
};

struct ItemParameters {
  std::string item_id;
  double b = 0.0;
  CognitiveLevel cognitive_level = CognitiveLevel::Comprehension;
  DifficultyLabel difficulty_label = DifficultyLabel::Medium;
};

struct CalibratedItem {
  Item item;
  ItemParameters params;
};

struct Response {
  std::string item_id;
  bool correct = false;
  double time_taken = 0.0;
  // Difficulty of the item when the response was recorded; never recomputed.
  double b = 0.0;
};

struct TagTally {
  int attempted = 0;
  int correct = 0;
};

struct SessionStatistics {
  int total_responses = 0;
  int correct = 0;
  int incorrect = 0;
  double accuracy_percent = 0.0;
  double theta = 0.0;
  AbilityBand band = AbilityBand::Average;
  double standard_error = 0.0;
  bool converged = false;
  double average_time = 0.0;
  std::map<CognitiveLevel, TagTally> by_cognitive_level;
  std::map<DifficultyLabel, TagTally> by_difficulty_label;
};

struct SessionSnapshot {
  double final_theta = 0.0;
  std::vector<double> theta_trajectory;
  double standard_error = 0.0;
  bool converged = false;
  AbilityBand band = AbilityBand::Average;
  std::vector<Response> responses;
  SessionStatistics statistics;
};

} // namespace adapt
