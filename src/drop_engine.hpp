#pragma once

#include <asio.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

#include "lan_transport.hpp"
#include "log.hpp"
#include "offer_registry.hpp"
#include "protocol.hpp"
#include "selection_loop.hpp"

class FileServer;
class OfferAnnouncer;
class SettingsManager;
class StatusBoard;

class DropEngine {
public:
  enum class Mode { Send, Receive };

  struct Options {
    Mode mode = Mode::Receive;
    std::filesystem::path file;
    std::filesystem::path download_dir = std::filesystem::current_path();
    std::string display_name;
    std::string host_label;
    bool status_display = true;
    std::chrono::milliseconds status_interval{1000};
    std::size_t status_log_lines = 10;
    bool transfer_progress = true;
    std::size_t max_announcement_bytes = kDefaultMaxAnnouncementBytes;
    std::size_t task_threads = 4;
    LanTransportOptions transport;
  };

  // Throws UserInputError when the settings do not describe a valid run.
  static Options options_from_settings(const SettingsManager& settings);

  explicit DropEngine(Options options);
  ~DropEngine();

  DropEngine(const DropEngine&) = delete;
  DropEngine& operator=(const DropEngine&) = delete;

  // Throws IOError for an unreadable send file and TransportInitError when
  // the network side cannot start.
  void start();
  // Foreground selection; true once a file has been fetched.
  bool run_receive(const LineSource& source);
  void stop();

  // Fetches one offer, reporting on the console. True on success.
  bool fetch(const OfferEntry& entry);

  const OfferRegistry& registry() const { return registry_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  const OfferDescriptor& local_offer() const { return local_offer_; }
  const Options& options() const { return options_; }
  uint16_t listen_port() const;
  std::string local_peer_id() const;
  std::size_t connected_peer_count() const;

private:
  void build_local_offer();
  void on_peer_connected(const std::string& peer_id);
  void pause_status();
  void resume_status();

  Options options_;
  std::shared_ptr<Logger> logger_;
  OfferRegistry registry_;
  OfferDescriptor local_offer_;
  std::unique_ptr<LanTransport> transport_;
  std::unique_ptr<asio::thread_pool> tasks_;
  std::unique_ptr<OfferAnnouncer> announcer_;
  std::unique_ptr<FileServer> server_;
  std::unique_ptr<StatusBoard> board_;
  bool started_ = false;
};
