#include "drop_engine.hpp"

#include <algorithm>
#include <iostream>
#include <limits>

#include "announcer.hpp"
#include "errors.hpp"
#include "file_transfer.hpp"
#include "settings_manager.hpp"
#include "status_display.hpp"
#include "utils.hpp"

namespace {

int ranged_setting(const SettingsManager& settings, const std::string& key, int min_value, int max_value) {
  int value = settings.get<int>(key);
  if(value < min_value || value > max_value) {
    throw UserInputError("Invalid " + key + " '" + std::to_string(value) + "' (expected " +
                         std::to_string(min_value) + ".." + std::to_string(max_value) + ")");
  }
  return value;
}

} // namespace

DropEngine::Options DropEngine::options_from_settings(const SettingsManager& settings) {
  Options options;

  auto command = SettingsManager::to_lower(settings.get<std::string>("command"));
  if(command == "send") {
    options.mode = Mode::Send;
    options.file = settings.get<std::string>("file");
    if(options.file.empty()) {
      throw UserInputError("send needs a file to offer");
    }
  } else if(command == "recv") {
    options.mode = Mode::Receive;
    if(!settings.get<std::string>("file").empty()) {
      throw UserInputError("recv takes no file argument");
    }
  } else if(command.empty()) {
    throw UserInputError("Missing command (send or recv)");
  } else {
    throw UserInputError("Unknown command '" + command + "'");
  }

  auto download_dir = settings.get<std::string>("download_dir");
  if(!download_dir.empty()) options.download_dir = download_dir;
  options.display_name = settings.get<std::string>("display_name");
  options.host_label = settings.get<std::string>("host_label");
  options.status_display = settings.get<bool>("status_display");
  options.status_interval = std::chrono::milliseconds(
    ranged_setting(settings, "status_interval_ms", 50, std::numeric_limits<int>::max()));
  options.status_log_lines = static_cast<std::size_t>(ranged_setting(settings, "status_log_lines", 1, 1000));
  options.transfer_progress = settings.get<bool>("transfer_progress");
  options.max_announcement_bytes = static_cast<std::size_t>(
    ranged_setting(settings, "max_announcement_bytes", 64, std::numeric_limits<int>::max()));
  options.task_threads = static_cast<std::size_t>(ranged_setting(settings, "task_threads", 1, 256));

  auto& transport = options.transport;
  transport.peer_id = settings.get<std::string>("peer_id");
  transport.listen_ip = settings.get<std::string>("listen_ip");
  transport.listen_port = static_cast<uint16_t>(ranged_setting(settings, "listen_port", 0, 65535));
  transport.discovery = settings.get<bool>("discovery");
  transport.discovery_group = settings.get<std::string>("discovery_group");
  transport.discovery_port = static_cast<uint16_t>(ranged_setting(settings, "discovery_port", 1, 65535));
  transport.discovery_interval = std::chrono::milliseconds(
    ranged_setting(settings, "discovery_interval_ms", 100, std::numeric_limits<int>::max()));
  transport.bootstrap_peer = settings.get<std::string>("bootstrap_peer");
  transport.stream_timeout = std::chrono::milliseconds(
    ranged_setting(settings, "stream_timeout_ms", 1, std::numeric_limits<int>::max()));
  transport.worker_threads = static_cast<std::size_t>(ranged_setting(settings, "worker_threads", 1, 256));
  return options;
}

DropEngine::DropEngine(Options options)
  : options_(std::move(options)),
    logger_(std::make_shared<Logger>("engine")) {
  if(options_.download_dir.empty()) {
    options_.download_dir = std::filesystem::current_path();
  }
  if(options_.task_threads == 0) {
    options_.task_threads = 1;
  }
}

DropEngine::~DropEngine() {
  stop();
}

void DropEngine::build_local_offer() {
  local_offer_.display_name = options_.display_name.empty() ? local_user_name() : options_.display_name;
  local_offer_.host_label = options_.host_label.empty() ? local_host_name() : options_.host_label;
  if(options_.mode != Mode::Send) return;

  std::error_code ec;
  if(!std::filesystem::is_regular_file(options_.file, ec)) {
    throw IOError("cannot offer " + options_.file.string() + ": not a readable regular file");
  }
  auto size = std::filesystem::file_size(options_.file, ec);
  if(ec) {
    throw IOError("cannot offer " + options_.file.string() + ": " + ec.message());
  }
  local_offer_.file_name = options_.file.filename().string();
  local_offer_.size_bytes = size;
}

void DropEngine::start() {
  if(started_) return;

  build_local_offer();

  tasks_ = std::make_unique<asio::thread_pool>(options_.task_threads);
  transport_ = std::make_unique<LanTransport>(options_.transport, logger_);

  OfferStore* store = options_.mode == Mode::Receive ? &registry_ : nullptr;
  announcer_ = std::make_unique<OfferAnnouncer>(*transport_, local_offer_, store, logger_,
                                                options_.max_announcement_bytes);
  announcer_->install();

  if(options_.mode == Mode::Send) {
    server_ = std::make_unique<FileServer>(options_.file, logger_);
    server_->install(*transport_);
  }

  transport_->set_connection_handler([this](const std::string& peer_id){
    asio::post(*tasks_, [this, peer_id](){ on_peer_connected(peer_id); });
  });

  if(options_.status_display) {
    board_ = std::make_unique<StatusBoard>("p2pdrop", options_.status_log_lines);
    if(options_.mode == Mode::Receive) {
      board_->set_data_lines({"Select file by number:", "-------"});
      board_->set_registry(&registry_);
    }
    board_->attach(*logger_, true);
  }

  try {
    transport_->start();
  } catch(const TransportInitError&) {
    if(board_) board_->detach();
    tasks_->join();
    throw;
  }
  started_ = true;

  if(options_.mode == Mode::Send) {
    logger_->info("offering {} ({})", local_offer_.file_name, format_size(local_offer_.size_bytes));
  }
  if(board_) board_->start(options_.status_interval);
}

void DropEngine::on_peer_connected(const std::string& peer_id) {
  try {
    announcer_->send_announcement(peer_id);
  } catch(const std::exception& e) {
    logger_->error("announcing to {}: {}", short_peer_id(peer_id), e.what());
  }
}

bool DropEngine::run_receive(const LineSource& source) {
  if(!started_) start();
  SelectionLoop loop(registry_, [this](const OfferEntry& entry){ return fetch(entry); }, logger_);
  return loop.run(source);
}

bool DropEngine::fetch(const OfferEntry& entry) {
  if(!transport_) {
    throw ConnectionError("engine is not started");
  }
  pause_status();
  logger_->print("fetching {} from {}", entry.offer.file_name, entry.offer.display_name);

  FileFetcher fetcher(*transport_, options_.download_dir, logger_);
  bool showed_progress = false;
  if(options_.transfer_progress) {
    auto last_percent = std::make_shared<int>(-1);
    fetcher.set_progress_callback([&entry, &showed_progress, last_percent](uint64_t received, uint64_t declared){
      int percent = declared ? static_cast<int>(std::min<uint64_t>(100, received * 100 / declared)) : -1;
      if(declared && percent == *last_percent) return;
      *last_percent = percent;
      std::cout << "\r" << format_progress(entry.offer.file_name, received, declared) << std::flush;
      showed_progress = true;
    });
  }

  auto outcome = fetcher.fetch(entry);
  if(showed_progress) std::cout << "\n";

  if(outcome.ok()) {
    logger_->debug("{} bytes written to {}", outcome.bytes, outcome.destination.string());
    logger_->print("Success!");
    return true;
  }
  logger_->print_err("fetching {} failed ({}): {}", entry.offer.file_name,
                     transfer_state_name(outcome.state), outcome.error);
  resume_status();
  return false;
}

void DropEngine::pause_status() {
  if(!board_) return;
  board_->stop();
  board_->detach();
}

void DropEngine::resume_status() {
  if(!board_) return;
  board_->attach(*logger_, true);
  board_->start(options_.status_interval);
}

void DropEngine::stop() {
  if(!started_) return;
  started_ = false;

  if(board_) {
    board_->stop();
    board_->detach();
  }
  transport_->abort_streams();
  tasks_->join();
  transport_->stop();
}

uint16_t DropEngine::listen_port() const {
  return transport_ ? transport_->listen_port() : 0;
}

std::string DropEngine::local_peer_id() const {
  return transport_ ? transport_->local_peer_id() : std::string();
}

std::size_t DropEngine::connected_peer_count() const {
  return transport_ ? transport_->connected_peer_count() : 0;
}
