#include "adapt/engine_config.hpp"

#include <cmath>
#include <stdexcept>

namespace adapt {

void EngineConfig::validate() const {
  if (!std::isfinite(learning_rate) || learning_rate <= 0.0 || learning_rate > 1.0) {
    throw std::invalid_argument("learning_rate must be within (0, 1]");
  }
  if (!std::isfinite(theta_min) || !std::isfinite(theta_max)) {
    throw std::invalid_argument("theta_min and theta_max must be finite");
  }
  if (theta_min >= theta_max) {
    throw std::invalid_argument("theta_min must be less than theta_max");
  }
  if (theta_min > 0.0 || theta_max < 0.0) {
    throw std::invalid_argument("theta range must contain the initial ability 0");
  }
  if (!std::isfinite(convergence_threshold) || convergence_threshold <= 0.0) {
    throw std::invalid_argument("convergence_threshold must be positive");
  }
}

} // namespace adapt
