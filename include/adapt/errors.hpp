#pragma once

#include <stdexcept>
#include <string>

namespace adapt {

// Mutating call made in a state that does not allow it.
class InvalidStateError : public std::logic_error {
public:
  explicit InvalidStateError(const std::string& message) : std::logic_error(message) {}
};

// Item id not present in the calibrated pool.
class UnknownItemError : public std::invalid_argument {
public:
  explicit UnknownItemError(const std::string& item_id)
      : std::invalid_argument("Unknown item id: " + item_id), item_id_(item_id) {}

  const std::string& item_id() const noexcept { return item_id_; }

private:
  std::string item_id_;
};

// Second response recorded for the same item.
class DuplicateResponseError : public std::logic_error {
public:
  explicit DuplicateResponseError(const std::string& item_id)
      : std::logic_error("Response already recorded for item: " + item_id) {}
};

} // namespace adapt
