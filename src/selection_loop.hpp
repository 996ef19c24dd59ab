#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "log.hpp"
#include "offer_registry.hpp"

// Yields one console line per call, nullopt at end of input.
using LineSource = std::function<std::optional<std::string>()>;
// Returns true when the selected offer was fetched.
using SelectionHandler = std::function<bool(const OfferEntry&)>;

// Throws UserInputError unless token is a plain non-negative decimal integer.
std::int64_t parse_selection(const std::string& token);

// Reads operator selections until one fetch succeeds or input ends.
class SelectionLoop {
public:
  SelectionLoop(const OfferStore& registry, SelectionHandler handler, std::shared_ptr<Logger> logger);

  // True after the first successful fetch, false at end of input.
  bool run(const LineSource& source);
  bool handle_token(const std::string& token);

private:
  const OfferStore& registry_;
  SelectionHandler handler_;
  std::shared_ptr<Logger> logger_;
};

LineSource readline_source(std::string prompt);
