#include "AdaptiveTestingBridge.h"

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "adapt/session_engine.hpp"
#include "adapt/types.hpp"
#include "debug_log.hpp"
#include "json_bridge.hpp"

namespace {

// Stop rules applied by the host on top of the engine's exhaustion signal.
struct HostPolicy {
  std::optional<std::size_t> max_items;
  bool stop_on_convergence = false;
};

struct HostSession {
  std::unique_ptr<adapt::SessionEngine> engine;
  HostPolicy policy;
  std::optional<adapt::Item> pending;
  // Items deferred by the test-taker, re-presented once the adaptive pass ends.
  std::deque<adapt::Item> review_queue;
  // Item the engine already presented when a stop rule ended the session.
  std::optional<adapt::Item> withheld;
  bool review_mode = false;
  bool complete = false;
};

struct BridgeState {
  std::mutex mutex;
  std::unordered_map<std::string, HostSession> sessions;
  std::uint64_t session_counter = 0;
};

BridgeState& state() {
  static BridgeState instance;
  return instance;
}

char* copy_string(const std::string& value) {
  char* buffer = static_cast<char*>(std::malloc(value.size() + 1));
  if (!buffer) {
    return nullptr;
  }
  std::memcpy(buffer, value.c_str(), value.size());
  buffer[value.size()] = '\0';
  return buffer;
}

char* copy_json(const nlohmann::json& json) {
  return copy_string(json.dump());
}

nlohmann::json ok_envelope() {
  nlohmann::json payload = nlohmann::json::object();
  payload["status"] = "ok";
  return payload;
}

nlohmann::json error_envelope(const std::string& message) {
  nlohmann::json payload = nlohmann::json::object();
  payload["status"] = "error";
  payload["message"] = message;
  return payload;
}

HostPolicy policy_from_json(const nlohmann::json& json_policy) {
  HostPolicy policy;
  if (json_policy.is_null()) {
    return policy;
  }
  if (!json_policy.is_object()) {
    throw std::invalid_argument("Field 'policy' must be an object");
  }
  if (json_policy.contains("max_items") && !json_policy.at("max_items").is_null()) {
    const auto& value = json_policy.at("max_items");
    if (!value.is_number_integer() || value.get<long long>() <= 0) {
      throw std::invalid_argument("Field 'max_items' must be a positive integer");
    }
    policy.max_items = static_cast<std::size_t>(value.get<long long>());
  }
  if (json_policy.contains("stop_on_convergence")) {
    const auto& value = json_policy.at("stop_on_convergence");
    if (!value.is_boolean()) {
      throw std::invalid_argument("Field 'stop_on_convergence' must be a boolean");
    }
    policy.stop_on_convergence = value.get<bool>();
  }
  return policy;
}

HostSession& find_session(BridgeState& s, const char* session_id) {
  if (!session_id) {
    throw std::invalid_argument("Missing session id");
  }
  auto it = s.sessions.find(session_id);
  if (it == s.sessions.end()) {
    throw std::runtime_error(std::string("Unknown session id: ") + session_id);
  }
  return it->second;
}

bool stop_rule_reached(const HostSession& session) {
  const auto answered = session.engine->responses().size();
  if (session.policy.max_items.has_value() && answered >= *session.policy.max_items) {
    return true;
  }
  return session.policy.stop_on_convergence && session.engine->has_converged();
}

// Moves to the next adaptive item, falling back to the review queue once the
// adaptive pool is exhausted.
void advance(HostSession& session, std::optional<adapt::Item> next) {
  if (next.has_value()) {
    session.pending = std::move(next);
    return;
  }
  if (!session.review_queue.empty()) {
    session.review_mode = true;
    session.pending = session.review_queue.front();
    session.review_queue.pop_front();
    return;
  }
  session.pending.reset();
  session.complete = true;
}

nlohmann::json progress_payload(const std::string& session_id, const HostSession& session) {
  nlohmann::json payload = ok_envelope();
  payload["session_id"] = session_id;
  if (session.complete || !session.pending.has_value()) {
    payload["type"] = "complete";
  } else {
    payload["type"] = "item";
    payload["item"] = adapt::bridge::to_json(*session.pending);
  }
  payload["review_mode"] = session.review_mode;
  payload["review_remaining"] = static_cast<int>(session.review_queue.size());
  payload["answered"] = static_cast<int>(session.engine->responses().size());
  payload["theta"] = session.engine->theta();
  payload["band"] = adapt::display_label(session.engine->ability_band());
  return payload;
}

} // namespace

extern "C" {

char* adapt_start_session(const char* request_json) {
  if (!request_json) {
    return copy_json(error_envelope("Missing session request json"));
  }
  try {
    auto request = nlohmann::json::parse(request_json);
    if (!request.is_object() || !request.contains("items")) {
      throw std::invalid_argument("Session request requires field 'items'");
    }
    auto items = adapt::bridge::item_pool_from_json(request.at("items"));
    adapt::EngineConfig config;
    if (request.contains("config")) {
      config = adapt::bridge::engine_config_from_json(request.at("config"));
    }

    HostSession session;
    if (request.contains("policy")) {
      session.policy = policy_from_json(request.at("policy"));
    }
    session.engine = adapt::make_engine(std::move(items), config);
    session.pending = session.engine->start();

    auto& s = state();
    std::scoped_lock guard(s.mutex);
    std::string session_id = "sess-" + std::to_string(++s.session_counter);
    auto payload = progress_payload(session_id, session);
    s.sessions.emplace(session_id, std::move(session));
    adapt::debug_log("bridge", "start " + session_id);
    return copy_json(payload);
  } catch (const std::exception& ex) {
    return copy_json(error_envelope(ex.what()));
  }
}

char* adapt_submit_response(const char* session_id, const char* response_json) {
  auto& s = state();
  std::scoped_lock guard(s.mutex);
  try {
    auto& session = find_session(s, session_id);
    if (session.complete || !session.pending.has_value()) {
      return copy_json(error_envelope("No pending item"));
    }
    if (!response_json) {
      return copy_json(error_envelope("Missing response json"));
    }
    auto response = nlohmann::json::parse(response_json);
    if (!response.is_object() || !response.contains("correct") ||
        !response.at("correct").is_boolean()) {
      throw std::invalid_argument("Response requires boolean field 'correct'");
    }
    const std::string& pending_id = session.pending->id;
    if (response.contains("item_id")) {
      const auto& item_id = response.at("item_id");
      if (!item_id.is_string() || item_id.get<std::string>() != pending_id) {
        throw std::invalid_argument("Response is for item " + item_id.dump() +
                                    " but the pending item is " + pending_id);
      }
    }
    double time_taken = 0.0;
    if (response.contains("time_taken")) {
      if (!response.at("time_taken").is_number()) {
        throw std::invalid_argument("Field 'time_taken' must be a number");
      }
      time_taken = response.at("time_taken").get<double>();
    }

    auto next = session.engine->record_response_and_advance(
        pending_id, response.at("correct").get<bool>(), time_taken);
    if (stop_rule_reached(session)) {
      session.withheld = std::move(next);
      session.pending.reset();
      session.complete = true;
    } else {
      advance(session, std::move(next));
    }
    return copy_json(progress_payload(session_id, session));
  } catch (const std::exception& ex) {
    return copy_json(error_envelope(ex.what()));
  }
}

char* adapt_mark_for_review(const char* session_id) {
  auto& s = state();
  std::scoped_lock guard(s.mutex);
  try {
    auto& session = find_session(s, session_id);
    if (session.complete || !session.pending.has_value()) {
      return copy_json(error_envelope("No pending item"));
    }
    if (session.review_mode) {
      return copy_json(error_envelope("Deferred items must be answered"));
    }
    session.review_queue.push_back(*session.pending);
    adapt::debug_log("bridge", std::string("defer ") + session_id + " item=" +
                                   session.pending->id);
    advance(session, session.engine->next_item());
    return copy_json(progress_payload(session_id, session));
  } catch (const std::exception& ex) {
    return copy_json(error_envelope(ex.what()));
  }
}

char* adapt_session_status(const char* session_id) {
  auto& s = state();
  std::scoped_lock guard(s.mutex);
  try {
    auto& session = find_session(s, session_id);
    auto payload = progress_payload(session_id, session);
    payload["state"] = adapt::to_string(session.engine->state());
    payload["standard_error"] = session.engine->standard_error();
    payload["converged"] = session.engine->has_converged();
    payload["statistics"] = adapt::bridge::to_json(session.engine->statistics());
    nlohmann::json deferred = nlohmann::json::array();
    for (const auto& item : session.review_queue) {
      deferred.push_back(item.id);
    }
    payload["review_queue"] = std::move(deferred);
    payload["withheld"] = session.withheld.has_value() ? nlohmann::json(session.withheld->id)
                                                       : nlohmann::json();
    payload["debug"] = session.engine->debug_state();
    return copy_json(payload);
  } catch (const std::exception& ex) {
    return copy_json(error_envelope(ex.what()));
  }
}

char* adapt_finish_session(const char* session_id) {
  auto& s = state();
  std::scoped_lock guard(s.mutex);
  try {
    auto& session = find_session(s, session_id);
    auto snapshot = session.engine->finish();
    nlohmann::json payload = ok_envelope();
    payload["type"] = "snapshot";
    payload["session_id"] = session_id;
    payload["snapshot"] = adapt::bridge::to_json(snapshot);
    nlohmann::json unanswered = nlohmann::json::array();
    if (session.pending.has_value()) {
      unanswered.push_back(session.pending->id);
    }
    if (session.withheld.has_value()) {
      unanswered.push_back(session.withheld->id);
    }
    for (const auto& item : session.review_queue) {
      unanswered.push_back(item.id);
    }
    payload["unanswered"] = std::move(unanswered);
    s.sessions.erase(session_id);
    adapt::debug_log("bridge", std::string("finish ") + session_id);
    return copy_json(payload);
  } catch (const std::exception& ex) {
    return copy_json(error_envelope(ex.what()));
  }
}

int adapt_active_session_count(void) {
  auto& s = state();
  std::scoped_lock guard(s.mutex);
  return static_cast<int>(s.sessions.size());
}

void adapt_free_string(char* ptr) {
  if (ptr != nullptr) {
    std::free(ptr);
  }
}

} // extern "C"
