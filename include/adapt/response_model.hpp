#pragma once

namespace adapt::model {

// Logits beyond this magnitude are clamped so that probabilities stay
// strictly inside (0, 1) in double precision.
inline constexpr double kMaxLogit = 30.0;

// Rasch probability of a correct response, sigma(theta - b).
double probability_correct(double theta, double b) noexcept;

// Fisher information p * (1 - p); peaks at 0.25 when b == theta.
double information(double theta, double b) noexcept;

} // namespace adapt::model
