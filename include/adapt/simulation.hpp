#pragma once

#include "engine_config.hpp"
#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace adapt::simulation {

struct SimulationConfig {
  double true_theta = 0.0;
  std::uint64_t seed = 1;
  // 0 runs until the pool is exhausted.
  std::size_t max_items = 0;
  bool stop_on_convergence = false;
  double min_time = 5.0;
  double max_time = 60.0;
  EngineConfig engine{};

  void validate() const;
};

// Runs a full session against a simulated test-taker of known ability. Each
// presented item is answered correctly when a seeded uniform draw falls below
// the Rasch probability at true_theta. Deterministic for a given seed.
SessionSnapshot run(const std::vector<Item>& pool, const SimulationConfig& config);

} // namespace adapt::simulation
