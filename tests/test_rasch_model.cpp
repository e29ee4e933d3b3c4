#include "adapt/ability_estimator.hpp"
#include "adapt/calibrator.hpp"
#include "adapt/item_selector.hpp"
#include "adapt/response_model.hpp"
#include "adapt/types.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct TestSuite {
  bool ok = true;
  void require(bool condition, const std::string& message) {
    if (!condition) {
      std::cerr << "[FAIL] " << message << std::endl;
      ok = false;
    }
  }
};

bool near(double a, double b, double tol = 1e-9) {
  return std::abs(a - b) < tol;
}

adapt::Item make_item(const std::string& id, adapt::CognitiveLevel level,
                      adapt::DifficultyLabel label) {
  adapt::Item item;
  item.id = id;
  item.cognitive_level = level;
  item.difficulty_label = label;
  return item;
}

adapt::Response make_response(const std::string& id, double b, bool correct) {
  adapt::Response response;
  response.item_id = id;
  response.b = b;
  response.correct = correct;
  response.time_taken = 10.0;
  return response;
}

void test_calibrator(TestSuite& suite) {
  using adapt::CognitiveLevel;
  using adapt::DifficultyLabel;
  using adapt::calibration::difficulty;

  suite.require(near(difficulty(CognitiveLevel::Recall, DifficultyLabel::Easy), -2.0),
                "recall/easy should calibrate to -2.0");
  suite.require(near(difficulty(CognitiveLevel::Recall, DifficultyLabel::Hard), -1.0),
                "recall/hard should calibrate to -1.0");
  suite.require(near(difficulty(CognitiveLevel::Comprehension, DifficultyLabel::Medium), 0.0),
                "comprehension/medium should calibrate to 0.0");
  suite.require(near(difficulty(CognitiveLevel::Comprehension, DifficultyLabel::Easy), -0.5),
                "comprehension/easy should calibrate to -0.5");
  suite.require(near(difficulty(CognitiveLevel::Application, DifficultyLabel::Easy), 1.0),
                "application/easy should calibrate to 1.0");
  suite.require(near(difficulty(CognitiveLevel::Application, DifficultyLabel::Hard), 2.0),
                "application/hard should calibrate to 2.0");

  auto params = adapt::calibration::calibrate(
      make_item("q7", CognitiveLevel::Application, DifficultyLabel::Medium));
  suite.require(params.item_id == "q7", "calibrate should carry the item id");
  suite.require(near(params.b, 1.5), "application/medium should calibrate to 1.5");
  suite.require(params.cognitive_level == CognitiveLevel::Application,
                "calibrate should carry the cognitive level");

  auto pool = adapt::calibration::calibrate_pool(
      {make_item("a", CognitiveLevel::Recall, DifficultyLabel::Medium),
       make_item("b", CognitiveLevel::Comprehension, DifficultyLabel::Hard)});
  suite.require(pool.size() == 2, "calibrate_pool should keep every item");
  suite.require(pool[0].item.id == "a" && pool[1].item.id == "b",
                "calibrate_pool should keep pool order");
  suite.require(near(pool[1].params.b, 0.5), "calibrate_pool should compute b per item");

  bool threw = false;
  try {
    adapt::calibration::calibrate_pool(
        {make_item("dup", CognitiveLevel::Recall, DifficultyLabel::Easy),
         make_item("dup", CognitiveLevel::Recall, DifficultyLabel::Hard)});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  suite.require(threw, "calibrate_pool should reject duplicate ids");

  threw = false;
  try {
    adapt::calibration::calibrate_pool(
        {make_item("", CognitiveLevel::Recall, DifficultyLabel::Easy)});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  suite.require(threw, "calibrate_pool should reject empty ids");
}

void test_response_model(TestSuite& suite) {
  using adapt::model::information;
  using adapt::model::probability_correct;

  const std::vector<double> grid = {-1000.0, -40.0, -6.0, -3.0, -1.2, -0.3, 0.0,
                                    0.4,     1.1,   2.5,  3.0,  8.0,  45.0, 1000.0};
  for (double theta : grid) {
    suite.require(near(probability_correct(theta, theta), 0.5),
                  "P(theta, theta) should be 0.5");
    for (double b : grid) {
      const double p = probability_correct(theta, b);
      suite.require(std::isfinite(p), "probability must be finite");
      suite.require(p > 0.0 && p < 1.0, "probability must lie strictly inside (0, 1)");
      const double info = information(theta, b);
      suite.require(info > 0.0 && info <= 0.25, "information must lie in (0, 0.25]");
      suite.require(info <= information(theta, theta) + 1e-15,
                    "information should peak at b == theta");
      suite.require(near(info, information(b, theta), 1e-15),
                    "information should be symmetric around b == theta");
    }
  }

  suite.require(near(information(1.3, 1.3), 0.25), "information at b == theta should be 0.25");
  suite.require(near(probability_correct(1.0, 0.0), 1.0 / (1.0 + std::exp(-1.0)), 1e-12),
                "probability should match the logistic function");

  double previous = probability_correct(-5.0, 0.7);
  for (double theta = -4.9; theta <= 5.0; theta += 0.1) {
    const double p = probability_correct(theta, 0.7);
    suite.require(p > previous, "probability must increase strictly with theta");
    previous = p;
  }

  suite.require(information(0.0, 0.5) > information(0.0, 1.0) &&
                    information(0.0, 1.0) > information(0.0, 2.0),
                "information should fall off away from theta");
}

void test_ability_estimator(TestSuite& suite) {
  adapt::EngineConfig config;
  config.learning_rate = 0.4;
  adapt::AbilityEstimator estimator(config);

  suite.require(near(estimator.update(0.0, 0.0, false), -0.2),
                "incorrect answer at b == theta should move theta by -alpha/2");
  suite.require(near(estimator.update(0.0, 0.0, true), 0.2),
                "correct answer at b == theta should move theta by +alpha/2");
  suite.require(estimator.update(1.0, -2.0, true) > 1.0,
                "correct answers should never lower theta");
  suite.require(estimator.update(1.0, 2.0, false) < 1.0,
                "incorrect answers should always lower theta");

  double theta = 0.0;
  for (int i = 0; i < 200; ++i) {
    theta = estimator.update(theta, -2.0, true);
    suite.require(theta <= 3.0 && theta >= -3.0, "theta must stay inside the clamp range");
  }
  suite.require(theta <= 3.0, "a long streak of correct answers must not exceed theta_max");
  for (int i = 0; i < 400; ++i) {
    theta = estimator.update(theta, 2.0, false);
    suite.require(theta <= 3.0 && theta >= -3.0, "theta must stay inside the clamp range");
  }
  suite.require(near(theta, -3.0), "a long streak of incorrect answers should saturate at theta_min");

  adapt::EngineConfig narrow;
  narrow.theta_min = -1.0;
  narrow.theta_max = 1.0;
  narrow.learning_rate = 1.0;
  adapt::AbilityEstimator bounded(narrow);
  double t = 0.0;
  for (int i = 0; i < 50; ++i) {
    t = bounded.update(t, -2.0, true);
  }
  suite.require(near(t, 1.0), "theta should saturate at a configured theta_max");

  std::vector<adapt::Response> history;
  suite.require(near(estimator.standard_error(0.0, history),
                     adapt::AbilityEstimator::kNoInformationStandardError),
                "empty history should report the no-information standard error");
  suite.require(!estimator.converged(0.0, history), "empty history must not be converged");

  history.push_back(make_response("a", 0.0, true));
  suite.require(near(estimator.standard_error(0.0, history), 2.0),
                "one item at b == theta gives SE = 1/sqrt(0.25)");

  history.push_back(make_response("b", 1.0, false));
  history.push_back(make_response("c", -1.0, true));
  double expected_info = 0.0;
  for (const auto& response : history) {
    expected_info += adapt::model::information(0.3, response.b);
  }
  suite.require(near(estimator.standard_error(0.3, history), 1.0 / std::sqrt(expected_info)),
                "SE should be evaluated at the requested theta over recorded difficulties");

  const auto replayed = estimator.replay(history);
  double manual = 0.0;
  for (const auto& response : history) {
    manual = estimator.update(manual, response.b, response.correct);
  }
  suite.require(near(replayed, manual), "replay should apply updates in history order");
  const auto path = estimator.trajectory(history);
  suite.require(path.size() == history.size(), "trajectory should have one entry per response");
  suite.require(near(path.back(), replayed), "trajectory should end at the replayed theta");

  bool threw = false;
  try {
    adapt::EngineConfig bad;
    bad.learning_rate = 0.0;
    adapt::AbilityEstimator invalid(bad);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  suite.require(threw, "a zero learning rate should be rejected");

  threw = false;
  try {
    adapt::EngineConfig bad;
    bad.theta_min = 0.5;
    bad.theta_max = 2.0;
    adapt::AbilityEstimator invalid(bad);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  suite.require(threw, "a theta range excluding 0 should be rejected");
}

// Items picked exactly at theta: SE should shrink toward the threshold.
void test_convergence_trend(TestSuite& suite) {
  adapt::AbilityEstimator estimator;
  std::vector<adapt::Response> history;
  double theta = 0.0;
  std::vector<double> errors;
  for (int i = 0; i < 50; ++i) {
    const bool correct = (i % 2) == 0;
    history.push_back(make_response("m" + std::to_string(i), theta, correct));
    theta = estimator.update(theta, theta, correct);
    errors.push_back(estimator.standard_error(theta, history));
  }

  suite.require(errors[4] < errors[0], "SE should shrink after five matched items");
  suite.require(errors[19] < errors[4], "SE should keep shrinking through twenty items");
  suite.require(errors[19] < 0.46, "SE after twenty matched items should be near 2/sqrt(20)");
  suite.require(!estimator.converged(theta, std::vector<adapt::Response>(
                                                history.begin(), history.begin() + 40)),
                "forty items cannot reach SE < 0.3");
  suite.require(estimator.converged(theta, history), "fifty matched items should converge");
  suite.require(errors.back() < 0.3, "final SE should be below the convergence threshold");
}

void test_item_selector(TestSuite& suite) {
  using adapt::CognitiveLevel;
  using adapt::DifficultyLabel;

  auto pool = adapt::calibration::calibrate_pool(
      {make_item("easy", CognitiveLevel::Recall, DifficultyLabel::Easy),
       make_item("mid-a", CognitiveLevel::Comprehension, DifficultyLabel::Easy),
       make_item("mid-b", CognitiveLevel::Comprehension, DifficultyLabel::Hard),
       make_item("hard", CognitiveLevel::Application, DifficultyLabel::Hard)});
  adapt::selection::UsedSet used;

  auto first = adapt::selection::first_item(pool, used);
  suite.require(first.has_value() && pool[*first].item.id == "mid-a",
                "first_item ties (|b| = 0.5) should resolve to pool order");
  for (int i = 0; i < 5; ++i) {
    auto again = adapt::selection::first_item(pool, used);
    suite.require(again == first, "first_item must be deterministic");
  }

  used.insert("mid-a");
  auto second = adapt::selection::first_item(pool, used);
  suite.require(second.has_value() && pool[*second].item.id == "mid-b",
                "first_item should skip used items");

  auto at_two = adapt::selection::next_item(pool, used, 2.0);
  suite.require(at_two.has_value() && pool[*at_two].item.id == "hard",
                "next_item should pick the item with b closest to theta");
  auto at_minus = adapt::selection::next_item(pool, used, -1.7);
  suite.require(at_minus.has_value() && pool[*at_minus].item.id == "easy",
                "next_item should pick an easy item for a low theta");
  auto tie = adapt::selection::next_item(pool, used, 0.0);
  suite.require(tie.has_value() && pool[*tie].item.id == "mid-b",
                "next_item should pick the most informative unused item");

  adapt::selection::UsedSet exhausted = {"easy", "mid-a", "mid-b", "hard"};
  suite.require(!adapt::selection::next_item(pool, exhausted, 0.0).has_value(),
                "next_item should signal exhaustion");
  suite.require(!adapt::selection::first_item(pool, exhausted).has_value(),
                "first_item should signal exhaustion");

  auto twins = adapt::calibration::calibrate_pool(
      {make_item("twin-1", CognitiveLevel::Application, DifficultyLabel::Easy),
       make_item("twin-2", CognitiveLevel::Application, DifficultyLabel::Easy)});
  auto tied = adapt::selection::next_item(twins, {}, 0.4);
  suite.require(tied.has_value() && twins[*tied].item.id == "twin-1",
                "equal information should go to the earlier item");
}

} // namespace

int main() {
  TestSuite suite;

  test_calibrator(suite);
  test_response_model(suite);
  test_ability_estimator(suite);
  test_convergence_trend(suite);
  test_item_selector(suite);

  if (!suite.ok) {
    std::cerr << "Rasch model tests FAILED" << std::endl;
    return 1;
  }

  std::cout << "Rasch model tests passed" << std::endl;
  return 0;
}
