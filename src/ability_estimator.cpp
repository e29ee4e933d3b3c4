#include "adapt/ability_estimator.hpp"

#include "adapt/response_model.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace adapt {

AbilityEstimator::AbilityEstimator() {
  config_.validate();
}

AbilityEstimator::AbilityEstimator(EngineConfig config) : config_(std::move(config)) {
  config_.validate();
}

double AbilityEstimator::clamp_theta(double theta) const noexcept {
  return std::clamp(theta, config_.theta_min, config_.theta_max);
}

double AbilityEstimator::update(double theta, double b, bool correct) const noexcept {
  const double observed = correct ? 1.0 : 0.0;
  const double expected = model::probability_correct(theta, b);
  return clamp_theta(theta + config_.learning_rate * (observed - expected));
}

double AbilityEstimator::replay(const std::vector<Response>& history) const noexcept {
  double theta = kInitialTheta;
  for (const auto& response : history) {
    theta = update(theta, response.b, response.correct);
  }
  return theta;
}

std::vector<double> AbilityEstimator::trajectory(const std::vector<Response>& history) const {
  std::vector<double> thetas;
  thetas.reserve(history.size());
  double theta = kInitialTheta;
  for (const auto& response : history) {
    theta = update(theta, response.b, response.correct);
    thetas.push_back(theta);
  }
  return thetas;
}

double AbilityEstimator::standard_error(double theta,
                                        const std::vector<Response>& history) const noexcept {
  double total_information = 0.0;
  for (const auto& response : history) {
    total_information += model::information(theta, response.b);
  }
  if (total_information <= 0.0) {
    return kNoInformationStandardError;
  }
  return 1.0 / std::sqrt(total_information);
}

bool AbilityEstimator::converged(double theta,
                                 const std::vector<Response>& history) const noexcept {
  return standard_error(theta, history) < config_.convergence_threshold;
}

} // namespace adapt
