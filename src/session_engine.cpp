#include "adapt/session_engine.hpp"

#include "adapt/ability_estimator.hpp"
#include "adapt/calibrator.hpp"
#include "adapt/errors.hpp"
#include "adapt/item_selector.hpp"
#include "adapt/response_model.hpp"
#include "debug_log.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace adapt {
namespace {

std::string format_theta(double value) {
  std::ostringstream oss;
  oss.setf(std::ios::fixed);
  oss.precision(3);
  oss << value;
  return oss.str();
}

SessionStatistics build_statistics(const std::vector<CalibratedItem>& pool,
                                   const std::unordered_map<std::string, std::size_t>& lookup,
                                   const std::vector<Response>& responses,
                                   double theta,
                                   double standard_error,
                                   bool converged) {
  SessionStatistics stats;
  for (auto level : {CognitiveLevel::Recall, CognitiveLevel::Comprehension,
                     CognitiveLevel::Application}) {
    stats.by_cognitive_level[level] = TagTally{};
  }
  for (auto label : {DifficultyLabel::Easy, DifficultyLabel::Medium, DifficultyLabel::Hard}) {
    stats.by_difficulty_label[label] = TagTally{};
  }

  double total_time = 0.0;
  for (const auto& response : responses) {
    if (response.correct) {
      ++stats.correct;
    }
    total_time += response.time_taken;
    const auto& params = pool[lookup.at(response.item_id)].params;
    auto& level = stats.by_cognitive_level[params.cognitive_level];
    auto& label = stats.by_difficulty_label[params.difficulty_label];
    ++level.attempted;
    ++label.attempted;
    if (response.correct) {
      ++level.correct;
      ++label.correct;
    }
  }

  stats.total_responses = static_cast<int>(responses.size());
  stats.incorrect = stats.total_responses - stats.correct;
  if (stats.total_responses > 0) {
    stats.accuracy_percent =
        100.0 * static_cast<double>(stats.correct) / static_cast<double>(stats.total_responses);
    stats.average_time = total_time / static_cast<double>(stats.total_responses);
  }
  stats.theta = theta;
  stats.band = ability_band_for(theta);
  stats.standard_error = standard_error;
  stats.converged = converged;
  return stats;
}

} // namespace

class SessionEngineImpl : public SessionEngine {
public:
  SessionEngineImpl(std::vector<Item> items, EngineConfig config)
      : estimator_(std::move(config)) {
    if (items.empty()) {
      throw std::invalid_argument("Item pool must not be empty");
    }
    pool_ = calibration::calibrate_pool(std::move(items));
    for (std::size_t i = 0; i < pool_.size(); ++i) {
      lookup_.emplace(pool_[i].params.item_id, i);
    }
    debug_log("session", "calibrated pool of " + std::to_string(pool_.size()) + " items");
  }

  Item start() override {
    if (state_ != SessionState::NotStarted) {
      throw InvalidStateError("start() requires a session that has not started (state: " +
                              to_string(state_) + ")");
    }
    auto first = selection::first_item(pool_, presented_);
    if (!first.has_value()) {
      throw std::runtime_error("Item pool has no available item");
    }
    state_ = SessionState::InProgress;
    const auto& entry = pool_[*first];
    presented_.insert(entry.params.item_id);
    debug_log("session", "start first=" + entry.params.item_id +
                             " b=" + format_theta(entry.params.b));
    return entry.item;
  }

  std::optional<Item> record_response_and_advance(const std::string& item_id,
                                                  bool correct,
                                                  double time_taken) override {
    if (state_ != SessionState::InProgress) {
      throw InvalidStateError("Cannot record a response in state " + to_string(state_));
    }
    auto it = lookup_.find(item_id);
    if (it == lookup_.end()) {
      throw UnknownItemError(item_id);
    }
    if (recorded_.count(item_id) != 0) {
      throw DuplicateResponseError(item_id);
    }
    if (!std::isfinite(time_taken) || time_taken < 0.0) {
      throw std::invalid_argument("time_taken must be a non-negative finite value");
    }

    const auto& params = pool_[it->second].params;
    Response response;
    response.item_id = item_id;
    response.correct = correct;
    response.time_taken = time_taken;
    response.b = params.b;
    responses_.push_back(response);
    recorded_.insert(item_id);
    presented_.insert(item_id);

    theta_ = estimator_.update(theta_, response.b, response.correct);
    trajectory_.push_back(theta_);

    debug_log("session", "record item=" + item_id + " correct=" + (correct ? "1" : "0") +
                             " theta=" + format_theta(theta_));
    return present_next();
  }

  std::optional<Item> next_item() override {
    if (state_ != SessionState::InProgress) {
      throw InvalidStateError("Cannot present an item in state " + to_string(state_));
    }
    return present_next();
  }

  SessionSnapshot finish() override {
    if (state_ != SessionState::InProgress) {
      throw InvalidStateError("finish() requires an in-progress session (state: " +
                              to_string(state_) + ")");
    }
    state_ = SessionState::Completed;
    debug_log("session", "finish responses=" + std::to_string(responses_.size()) +
                             " theta=" + format_theta(theta_));
    return snapshot();
  }

  SessionState state() const override { return state_; }

  double theta() const override { return theta_; }

  double standard_error() const override {
    return estimator_.standard_error(theta_, responses_);
  }

  bool has_converged() const override {
    return estimator_.converged(theta_, responses_);
  }

  AbilityBand ability_band() const override { return ability_band_for(theta_); }

  SessionStatistics statistics() const override {
    return build_statistics(pool_, lookup_, responses_, theta_, standard_error(),
                            has_converged());
  }

  const std::vector<Response>& responses() const override { return responses_; }

  const std::vector<double>& theta_trajectory() const override { return trajectory_; }

  SessionSnapshot snapshot() const override {
    SessionSnapshot snap;
    snap.final_theta = theta_;
    snap.theta_trajectory = trajectory_;
    snap.standard_error = standard_error();
    snap.converged = has_converged();
    snap.band = ability_band();
    snap.responses = responses_;
    snap.statistics = statistics();
    return snap;
  }

  std::optional<ItemParameters> item_parameters(const std::string& item_id) const override {
    auto it = lookup_.find(item_id);
    if (it == lookup_.end()) {
      return std::nullopt;
    }
    return pool_[it->second].params;
  }

  double predict_success(const std::string& item_id) const override {
    auto it = lookup_.find(item_id);
    if (it == lookup_.end()) {
      throw UnknownItemError(item_id);
    }
    return model::probability_correct(theta_, pool_[it->second].params.b);
  }

  std::size_t remaining_items() const override {
    return pool_.size() - presented_.size();
  }

  const EngineConfig& config() const override { return estimator_.config(); }

  nlohmann::json debug_state() const override {
    nlohmann::json info = nlohmann::json::object();
    info["state"] = to_string(state_);
    info["pool_size"] = static_cast<int>(pool_.size());
    info["presented"] = static_cast<int>(presented_.size());
    info["recorded"] = static_cast<int>(responses_.size());
    info["remaining"] = static_cast<int>(remaining_items());
    info["theta"] = theta_;
    info["standard_error"] = standard_error();
    info["converged"] = has_converged();
    info["band"] = to_string(ability_band());

    nlohmann::json pending = nlohmann::json::array();
    for (const auto& entry : pool_) {
      const auto& id = entry.params.item_id;
      if (presented_.count(id) != 0 && recorded_.count(id) == 0) {
        pending.push_back(id);
      }
    }
    info["awaiting_response"] = std::move(pending);

    nlohmann::json cfg = nlohmann::json::object();
    cfg["learning_rate"] = estimator_.config().learning_rate;
    cfg["theta_min"] = estimator_.config().theta_min;
    cfg["theta_max"] = estimator_.config().theta_max;
    cfg["convergence_threshold"] = estimator_.config().convergence_threshold;
    info["config"] = std::move(cfg);
    return info;
  }

private:
  std::optional<Item> present_next() {
    auto next = selection::next_item(pool_, presented_, theta_);
    if (!next.has_value()) {
      debug_log("session", "pool exhausted");
      return std::nullopt;
    }
    const auto& entry = pool_[*next];
    presented_.insert(entry.params.item_id);
    debug_log("session", "present item=" + entry.params.item_id +
                             " b=" + format_theta(entry.params.b));
    return entry.item;
  }

  AbilityEstimator estimator_;
  std::vector<CalibratedItem> pool_;
  std::unordered_map<std::string, std::size_t> lookup_;
  SessionState state_ = SessionState::NotStarted;
  double theta_ = AbilityEstimator::kInitialTheta;
  std::vector<Response> responses_;
  std::vector<double> trajectory_;
  std::unordered_set<std::string> presented_;
  std::unordered_set<std::string> recorded_;
};

std::unique_ptr<SessionEngine> make_engine(std::vector<Item> pool, EngineConfig config) {
  return std::make_unique<SessionEngineImpl>(std::move(pool), std::move(config));
}

} // namespace adapt
