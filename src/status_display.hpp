#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "log.hpp"
#include "offer_registry.hpp"

// "report.pdf 2.0 kB / 4.1 kB (50%)". Without a declared size only the count shows.
std::string format_progress(const std::string& file_name, uint64_t received, uint64_t declared);

// Terminal status screen: a title, fixed data lines, the known offers and the
// last few log lines, redrawn on an interval.
class StatusBoard {
public:
  StatusBoard(std::string title, std::size_t capacity);
  ~StatusBoard();

  StatusBoard(const StatusBoard&) = delete;
  StatusBoard& operator=(const StatusBoard&) = delete;

  void add_line(const std::string& line);
  std::vector<std::string> recent_lines() const;
  void set_data_lines(std::vector<std::string> lines);
  void set_registry(const OfferStore* registry);

  std::string render() const;

  // Feeds log lines from logger into the board. With capture_console they no
  // longer reach the console sinks.
  void attach(Logger& logger, bool capture_console);
  void detach();

  void start(std::chrono::milliseconds interval);
  void stop();

private:
  void render_loop(std::chrono::milliseconds interval);

  std::string title_;
  std::size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<std::string> lines_;
  std::vector<std::string> data_lines_;
  const OfferStore* registry_ = nullptr;

  Logger* logger_ = nullptr;
  LogListenerHandle listener_ = 0;

  std::mutex run_mutex_;
  std::condition_variable run_cv_;
  bool running_ = false;
  std::thread thread_;
};
