#include "json_bridge.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace adapt::bridge {
namespace {

template <typename Setter>
bool assign_if_present(const nlohmann::json& obj, const char* key, Setter&& setter) {
  if (!obj.contains(key)) {
    return false;
  }
  const auto& value = obj.at(key);
  if (value.is_null()) {
    return false;
  }
  setter(value);
  return true;
}

double json_to_double(const nlohmann::json& value, std::string_view key) {
  if (!value.is_number()) {
    throw std::invalid_argument("Expected number for field '" + std::string(key) + "'");
  }
  return value.get<double>();
}

std::string json_to_string(const nlohmann::json& value, std::string_view key) {
  if (!value.is_string()) {
    throw std::invalid_argument("Expected string for field '" + std::string(key) + "'");
  }
  return value.get<std::string>();
}

CognitiveLevel json_to_cognitive_level(const nlohmann::json& value, std::string_view key) {
  if (value.is_number_unsigned()) {
    const auto ordinal = value.get<std::uint64_t>();
    if (ordinal > 3) {
      throw std::invalid_argument("Cognitive level ordinal out of range for field '" +
                                  std::string(key) + "': " + value.dump());
    }
    return cognitive_level_from_ordinal(static_cast<int>(ordinal));
  }
  if (value.is_number_integer()) {
    const auto ordinal = value.get<long long>();
    if (ordinal < 1 || ordinal > 3) {
      throw std::invalid_argument("Cognitive level ordinal out of range for field '" +
                                  std::string(key) + "': " + value.dump());
    }
    return cognitive_level_from_ordinal(static_cast<int>(ordinal));
  }
  if (value.is_string()) {
    return cognitive_level_from_string(value.get<std::string>());
  }
  throw std::invalid_argument("Expected cognitive level name or ordinal for field '" +
                              std::string(key) + "'");
}

nlohmann::json tally_to_json(const TagTally& tally) {
  nlohmann::json json = nlohmann::json::object();
  json["attempted"] = tally.attempted;
  json["correct"] = tally.correct;
  return json;
}

} // namespace

nlohmann::json to_json(const Item& item) {
  nlohmann::json json = nlohmann::json::object();
  json["id"] = item.id;
  json["cognitive_level"] = to_string(item.cognitive_level);
  json["difficulty"] = to_string(item.difficulty_label);
  json["content"] = item.content;
  return json;
}

Item item_from_json(const nlohmann::json& json_item) {
  if (!json_item.is_object()) {
    throw std::invalid_argument("Item must be a JSON object");
  }
  if (!json_item.contains("id")) {
    throw std::invalid_argument("Item is missing field 'id'");
  }
  if (!json_item.contains("cognitive_level")) {
    throw std::invalid_argument("Item is missing field 'cognitive_level'");
  }
  if (!json_item.contains("difficulty")) {
    throw std::invalid_argument("Item is missing field 'difficulty'");
  }

  Item item;
  item.id = json_to_string(json_item.at("id"), "id");
  item.cognitive_level = json_to_cognitive_level(json_item.at("cognitive_level"), "cognitive_level");
  item.difficulty_label =
      difficulty_label_from_string(json_to_string(json_item.at("difficulty"), "difficulty"));

  if (json_item.contains("content")) {
    const auto& content = json_item.at("content");
    if (!content.is_null()) {
      item.content = content;
    }
  } else {
    // Authoring records carry their presentation fields inline.
    for (const auto& entry : json_item.items()) {
      if (entry.key() == "id" || entry.key() == "cognitive_level" ||
          entry.key() == "difficulty") {
        continue;
      }
      item.content[entry.key()] = entry.value();
    }
  }
  return item;
}

std::vector<Item> item_pool_from_json(const nlohmann::json& json_items) {
  if (!json_items.is_array()) {
    throw std::invalid_argument("Expected array for field 'items'");
  }
  std::vector<Item> items;
  items.reserve(json_items.size());
  for (const auto& entry : json_items) {
    items.push_back(item_from_json(entry));
  }
  return items;
}

nlohmann::json to_json(const ItemParameters& params) {
  nlohmann::json json = nlohmann::json::object();
  json["item_id"] = params.item_id;
  json["b"] = params.b;
  json["cognitive_level"] = to_string(params.cognitive_level);
  json["difficulty"] = to_string(params.difficulty_label);
  return json;
}

nlohmann::json to_json(const Response& response) {
  nlohmann::json json = nlohmann::json::object();
  json["item_id"] = response.item_id;
  json["correct"] = response.correct;
  json["time_taken"] = response.time_taken;
  json["b"] = response.b;
  return json;
}

nlohmann::json to_json(const SessionStatistics& stats) {
  nlohmann::json json = nlohmann::json::object();
  json["total_responses"] = stats.total_responses;
  json["correct"] = stats.correct;
  json["incorrect"] = stats.incorrect;
  json["accuracy_percent"] = stats.accuracy_percent;
  json["theta"] = stats.theta;
  json["band"] = to_string(stats.band);
  json["band_label"] = display_label(stats.band);
  json["standard_error"] = stats.standard_error;
  json["converged"] = stats.converged;
  json["average_time"] = stats.average_time;

  nlohmann::json levels = nlohmann::json::object();
  for (const auto& kv : stats.by_cognitive_level) {
    levels[to_string(kv.first)] = tally_to_json(kv.second);
  }
  json["by_cognitive_level"] = std::move(levels);

  nlohmann::json labels = nlohmann::json::object();
  for (const auto& kv : stats.by_difficulty_label) {
    labels[to_string(kv.first)] = tally_to_json(kv.second);
  }
  json["by_difficulty"] = std::move(labels);
  return json;
}

nlohmann::json to_json(const SessionSnapshot& snapshot) {
  nlohmann::json json = nlohmann::json::object();
  json["final_theta"] = snapshot.final_theta;
  nlohmann::json trajectory = nlohmann::json::array();
  for (double theta : snapshot.theta_trajectory) {
    trajectory.push_back(theta);
  }
  json["theta_trajectory"] = std::move(trajectory);
  json["standard_error"] = snapshot.standard_error;
  json["converged"] = snapshot.converged;
  json["band"] = to_string(snapshot.band);
  json["band_label"] = display_label(snapshot.band);

  nlohmann::json responses = nlohmann::json::array();
  for (std::size_t i = 0; i < snapshot.responses.size(); ++i) {
    auto entry = to_json(snapshot.responses[i]);
    if (i < snapshot.theta_trajectory.size()) {
      entry["theta_after"] = snapshot.theta_trajectory[i];
    }
    responses.push_back(std::move(entry));
  }
  json["responses"] = std::move(responses);
  json["statistics"] = to_json(snapshot.statistics);
  return json;
}

nlohmann::json to_json(const EngineConfig& config) {
  nlohmann::json json = nlohmann::json::object();
  json["learning_rate"] = config.learning_rate;
  json["theta_min"] = config.theta_min;
  json["theta_max"] = config.theta_max;
  json["convergence_threshold"] = config.convergence_threshold;
  return json;
}

EngineConfig engine_config_from_json(const nlohmann::json& json_config) {
  EngineConfig config;
  if (json_config.is_null()) {
    return config;
  }
  if (!json_config.is_object()) {
    throw std::invalid_argument("Engine config must be a JSON object");
  }
  assign_if_present(json_config, "learning_rate", [&](const nlohmann::json& value) {
    config.learning_rate = json_to_double(value, "learning_rate");
  });
  assign_if_present(json_config, "theta_min", [&](const nlohmann::json& value) {
    config.theta_min = json_to_double(value, "theta_min");
  });
  assign_if_present(json_config, "theta_max", [&](const nlohmann::json& value) {
    config.theta_max = json_to_double(value, "theta_max");
  });
  assign_if_present(json_config, "convergence_threshold", [&](const nlohmann::json& value) {
    config.convergence_threshold = json_to_double(value, "convergence_threshold");
  });
  config.validate();
  return config;
}

} // namespace adapt::bridge
