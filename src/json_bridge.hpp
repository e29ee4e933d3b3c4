#pragma once

#include "adapt/engine_config.hpp"
#include "adapt/types.hpp"

#include <vector>

#include <nlohmann/json.hpp>

namespace adapt::bridge {

nlohmann::json to_json(const Item& item);
Item item_from_json(const nlohmann::json& json_item);
std::vector<Item> item_pool_from_json(const nlohmann::json& json_items);

nlohmann::json to_json(const ItemParameters& params);

nlohmann::json to_json(const Response& response);

nlohmann::json to_json(const SessionStatistics& stats);

nlohmann::json to_json(const SessionSnapshot& snapshot);

nlohmann::json to_json(const EngineConfig& config);
EngineConfig engine_config_from_json(const nlohmann::json& json_config);

} // namespace adapt::bridge
