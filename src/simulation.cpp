#include "adapt/simulation.hpp"

#include "adapt/calibrator.hpp"
#include "adapt/response_model.hpp"
#include "adapt/session_engine.hpp"
#include "debug_log.hpp"
#include "rng.hpp"

#include <cmath>
#include <optional>
#include <stdexcept>

namespace adapt::simulation {

void SimulationConfig::validate() const {
  if (!std::isfinite(true_theta)) {
    throw std::invalid_argument("true_theta must be finite");
  }
  if (!std::isfinite(min_time) || !std::isfinite(max_time) || min_time < 0.0 ||
      min_time > max_time) {
    throw std::invalid_argument("response time range must satisfy 0 <= min_time <= max_time");
  }
  engine.validate();
}

SessionSnapshot run(const std::vector<Item>& pool, const SimulationConfig& config) {
  config.validate();
  auto engine = make_engine(pool, config.engine);
  std::uint64_t rng_state = config.seed == 0 ? 1 : config.seed;

  std::optional<Item> current = engine->start();
  std::size_t answered = 0;
  while (current.has_value()) {
    const double b = calibration::difficulty(current->cognitive_level, current->difficulty_label);
    const double p = model::probability_correct(config.true_theta, b);
    const bool correct = rand_unit(rng_state) < p;
    const double time_taken = rand_range(rng_state, config.min_time, config.max_time);
    current = engine->record_response_and_advance(current->id, correct, time_taken);
    ++answered;

    if (config.max_items != 0 && answered >= config.max_items) {
      break;
    }
    if (config.stop_on_convergence && engine->has_converged()) {
      break;
    }
  }

  debug_log("simulation", "true_theta=" + std::to_string(config.true_theta) +
                              " answered=" + std::to_string(answered) +
                              " estimate=" + std::to_string(engine->theta()));
  return engine->finish();
}

} // namespace adapt::simulation
