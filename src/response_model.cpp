#include "adapt/response_model.hpp"

#include <algorithm>
#include <cmath>

namespace adapt::model {
namespace {

double stable_sigmoid(double x) noexcept {
  if (x >= 0.0) {
    return 1.0 / (1.0 + std::exp(-x));
  }
  const double e = std::exp(x);
  return e / (1.0 + e);
}

} // namespace

double probability_correct(double theta, double b) noexcept {
  const double logit = std::clamp(theta - b, -kMaxLogit, kMaxLogit);
  return stable_sigmoid(logit);
}

double information(double theta, double b) noexcept {
  const double p = probability_correct(theta, b);
  return p * (1.0 - p);
}

} // namespace adapt::model
