#pragma once

#include "engine_config.hpp"
#include "types.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace adapt {

// One adaptive test attempt by one test-taker. Not thread-safe; the host
// serializes access per session.
class SessionEngine {
public:
  virtual ~SessionEngine() = default;

  // NotStarted -> InProgress. Returns the item with difficulty closest to 0.
  virtual Item start() = 0;

  // Records the response with the item's stored difficulty, updates theta and
  // returns the most informative unused item, or nullopt once the pool is
  // exhausted.
  virtual std::optional<Item> record_response_and_advance(const std::string& item_id,
                                                          bool correct,
                                                          double time_taken) = 0;

  // Presents the most informative unused item at the current theta without
  // recording a response. Used by hosts that let the test-taker defer an item.
  virtual std::optional<Item> next_item() = 0;

  // InProgress -> Completed. The engine is read-only afterwards.
  virtual SessionSnapshot finish() = 0;

  virtual SessionState state() const = 0;

  virtual double theta() const = 0;

  virtual double standard_error() const = 0;

  virtual bool has_converged() const = 0;

  virtual AbilityBand ability_band() const = 0;

  virtual SessionStatistics statistics() const = 0;

  virtual const std::vector<Response>& responses() const = 0;

  virtual const std::vector<double>& theta_trajectory() const = 0;

  virtual SessionSnapshot snapshot() const = 0;

  virtual std::optional<ItemParameters> item_parameters(const std::string& item_id) const = 0;

  // Probability of a correct answer on a pool item at the current theta.
  virtual double predict_success(const std::string& item_id) const = 0;

  // Items not yet presented.
  virtual std::size_t remaining_items() const = 0;

  virtual const EngineConfig& config() const = 0;

  virtual nlohmann::json debug_state() const = 0;
};

// Calibrates the pool and builds a session. Throws std::invalid_argument on an
// empty pool, a duplicate or empty item id, or an invalid config.
std::unique_ptr<SessionEngine> make_engine(std::vector<Item> pool, EngineConfig config = {});

} // namespace adapt
