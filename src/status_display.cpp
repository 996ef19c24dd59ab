#include "status_display.hpp"

#include <iostream>
#include <sstream>

#include "protocol.hpp"
#include "utils.hpp"

namespace {
const char* kClearScreen = "\033[2J\033[H";
}

std::string format_progress(const std::string& file_name, uint64_t received, uint64_t declared) {
  std::string line = file_name + " " + format_size(received);
  if(declared == 0) return line;
  auto percent = received >= declared ? 100 : (received * 100) / declared;
  return line + " / " + format_size(declared) + " (" + std::to_string(percent) + "%)";
}

StatusBoard::StatusBoard(std::string title, std::size_t capacity)
  : title_(std::move(title)), capacity_(capacity ? capacity : 1) {}

StatusBoard::~StatusBoard() {
  stop();
  detach();
}

void StatusBoard::add_line(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  lines_.push_back(line);
  while(lines_.size() > capacity_) {
    lines_.pop_front();
  }
}

std::vector<std::string> StatusBoard::recent_lines() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {lines_.begin(), lines_.end()};
}

void StatusBoard::set_data_lines(std::vector<std::string> lines) {
  std::lock_guard<std::mutex> lock(mutex_);
  data_lines_ = std::move(lines);
}

void StatusBoard::set_registry(const OfferStore* registry) {
  std::lock_guard<std::mutex> lock(mutex_);
  registry_ = registry;
}

std::string StatusBoard::render() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::ostringstream out;
  out << title_ << "\n\n";
  for(const auto& line : data_lines_) {
    out << line << "\n";
  }
  if(registry_) {
    for(const auto& entry : registry_->snapshot()) {
      out << entry.index << ": " << describe_offer(entry.offer) << "\n";
    }
  }
  if(!data_lines_.empty() || registry_) out << "\n";
  for(const auto& line : lines_) {
    out << line << "\n";
  }
  return out.str();
}

void StatusBoard::attach(Logger& logger, bool capture_console) {
  detach();
  logger_ = &logger;
  listener_ = logger.add_listener(
    [this, capture_console](LogChannel channel, const std::string&, spdlog::level::level_enum, const std::string& message){
      if(channel == LogChannel::Print || channel == LogChannel::PrintErr) return false;
      add_line(message);
      return capture_console;
    });
}

void StatusBoard::detach() {
  if(logger_ && listener_ != 0) {
    logger_->remove_listener(listener_);
  }
  logger_ = nullptr;
  listener_ = 0;
}

void StatusBoard::start(std::chrono::milliseconds interval) {
  std::lock_guard<std::mutex> lock(run_mutex_);
  if(running_) return;
  running_ = true;
  thread_ = std::thread([this, interval](){ render_loop(interval); });
}

void StatusBoard::stop() {
  {
    std::lock_guard<std::mutex> lock(run_mutex_);
    if(!running_) return;
    running_ = false;
  }
  run_cv_.notify_all();
  if(thread_.joinable()) thread_.join();
}

void StatusBoard::render_loop(std::chrono::milliseconds interval) {
  std::unique_lock<std::mutex> lock(run_mutex_);
  while(running_) {
    lock.unlock();
    std::cout << kClearScreen << render() << std::flush;
    lock.lock();
    run_cv_.wait_for(lock, interval, [this](){ return !running_; });
  }
}
