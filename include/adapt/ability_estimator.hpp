#pragma once

#include "engine_config.hpp"
#include "types.hpp"

#include <vector>

namespace adapt {

// Learning-rate form of the Bayesian ability update for the Rasch model:
//   theta' = clamp(theta + alpha * (r - P(theta, b)), theta_min, theta_max)
// Precision is derived from the full response history on every request.
class AbilityEstimator {
public:
  static constexpr double kInitialTheta = 0.0;
  // Reported when the history carries no information yet.
  static constexpr double kNoInformationStandardError = 999.0;

  AbilityEstimator();
  explicit AbilityEstimator(EngineConfig config);

  const EngineConfig& config() const noexcept { return config_; }

  double update(double theta, double b, bool correct) const noexcept;

  // Re-derives theta from kInitialTheta by applying update() over the
  // history in order.
  double replay(const std::vector<Response>& history) const noexcept;

  // Theta after each response of the history, in order.
  std::vector<double> trajectory(const std::vector<Response>& history) const;

  double standard_error(double theta, const std::vector<Response>& history) const noexcept;

  bool converged(double theta, const std::vector<Response>& history) const noexcept;

  double clamp_theta(double theta) const noexcept;

private:
  EngineConfig config_{};
};

} // namespace adapt
