#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include "log.hpp"
#include "offer_registry.hpp"
#include "transport.hpp"

enum class TransferState { Idle, Requested, Transferring, Complete, Failed };

const char* transfer_state_name(TransferState state);

struct TransferOutcome {
  TransferState state = TransferState::Idle;
  uint64_t bytes = 0;
  std::filesystem::path destination;
  std::string error;

  bool ok() const { return state == TransferState::Complete; }
};

// Offering side of the get protocol: every inbound stream receives the whole
// file followed by end of stream. A failed read or write aborts the stream
// so the requester never mistakes a short copy for a complete one.
class FileServer {
public:
  static constexpr std::size_t kChunkSize = 64 * 1024;

  FileServer(std::filesystem::path path, std::shared_ptr<Logger> logger);

  void install(PeerTransport& transport);
  // Returns the number of bytes sent. Failures are logged.
  uint64_t serve(Stream& stream, const std::string& peer_id);

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
  std::shared_ptr<Logger> logger_;
};

// Requesting side: pulls one offer into dest_dir under the name the peer
// announced.
class FileFetcher {
public:
  using ProgressCallback = std::function<void(uint64_t received, uint64_t declared)>;

  FileFetcher(PeerTransport& transport, std::filesystem::path dest_dir, std::shared_ptr<Logger> logger);

  void set_progress_callback(ProgressCallback callback) { progress_ = std::move(callback); }

  // Never throws for transfer failures; the outcome says what happened.
  TransferOutcome fetch(const OfferEntry& entry);

private:
  PeerTransport& transport_;
  std::filesystem::path dest_dir_;
  std::shared_ptr<Logger> logger_;
  ProgressCallback progress_;
};
