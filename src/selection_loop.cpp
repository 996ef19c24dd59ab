#include "selection_loop.hpp"

#include <charconv>
#include <cstdlib>
#include <sstream>

#include <readline/readline.h>
#include <readline/history.h>

#include "errors.hpp"

std::int64_t parse_selection(const std::string& token) {
  if(token.empty()) {
    throw UserInputError("empty selection");
  }
  if(token[0] == '-') {
    throw UserInputError("'" + token + "' is negative");
  }
  std::int64_t value = 0;
  const char* first = token.data();
  const char* last = token.data() + token.size();
  auto result = std::from_chars(first, last, value);
  if(result.ec == std::errc::result_out_of_range) {
    throw UserInputError("'" + token + "' is too large");
  }
  if(result.ec != std::errc() || result.ptr != last) {
    throw UserInputError("'" + token + "' is not a number");
  }
  return value;
}

SelectionLoop::SelectionLoop(const OfferStore& registry, SelectionHandler handler, std::shared_ptr<Logger> logger)
  : registry_(registry),
    handler_(std::move(handler)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("select")) {}

bool SelectionLoop::handle_token(const std::string& token) {
  OfferEntry entry;
  try {
    entry = registry_.get(parse_selection(token));
  } catch(const IndexOutOfRange& e) {
    logger_->error("{}", e.what());
    return false;
  } catch(const UserInputError& e) {
    logger_->error("input error: {}", e.what());
    return false;
  }
  return handler_(entry);
}

bool SelectionLoop::run(const LineSource& source) {
  while(auto line = source()) {
    std::istringstream tokens(*line);
    std::string token;
    while(tokens >> token) {
      if(handle_token(token)) return true;
    }
  }
  return false;
}

LineSource readline_source(std::string prompt) {
  return [prompt = std::move(prompt)]() -> std::optional<std::string> {
    char* line = readline(prompt.c_str());
    if(!line) return std::nullopt;
    std::string result(line);
    if(!result.empty()) add_history(result.c_str());
    free(line);
    return result;
  };
}
