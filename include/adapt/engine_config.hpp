#pragma once

namespace adapt {

struct EngineConfig {
  // Step size of the ability update. Higher values converge faster but
  // overshoot more on noisy early responses.
  double learning_rate = 0.4;
  double theta_min = -3.0;
  double theta_max = 3.0;
  // Standard error below which the estimate counts as converged.
  double convergence_threshold = 0.3;

  void validate() const;
};

} // namespace adapt
