#include "file_transfer.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <vector>

#include "errors.hpp"
#include "protocol.hpp"
#include "utils.hpp"

namespace {

void close_quietly(Stream& stream, Logger& logger) {
  try {
    stream.close();
  } catch(const DropError& e) {
    logger.debug("closing {} stream: {}", stream.protocol(), e.what());
  }
}

void abort_quietly(Stream& stream, Logger& logger) {
  try {
    stream.abort();
  } catch(const DropError& e) {
    logger.debug("aborting {} stream: {}", stream.protocol(), e.what());
  }
}

} // namespace

const char* transfer_state_name(TransferState state) {
  switch(state) {
    case TransferState::Idle: return "idle";
    case TransferState::Requested: return "requested";
    case TransferState::Transferring: return "transferring";
    case TransferState::Complete: return "complete";
    case TransferState::Failed: return "failed";
  }
  return "unknown";
}

FileServer::FileServer(std::filesystem::path path, std::shared_ptr<Logger> logger)
  : path_(std::move(path)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("serve")) {}

void FileServer::install(PeerTransport& transport) {
  transport.set_stream_handler(kTransferProtocol,
    [this](std::shared_ptr<Stream> stream, const std::string& peer_id){
      serve(*stream, peer_id);
    });
}

uint64_t FileServer::serve(Stream& stream, const std::string& peer_id) {
  std::ifstream in(path_, std::ios::binary);
  if(!in) {
    logger_->error("error opening file {}: {}", path_.string(), std::strerror(errno));
    abort_quietly(stream, *logger_);
    return 0;
  }

  uint64_t sent = 0;
  std::vector<char> buf(kChunkSize);
  try {
    while(in) {
      in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
      auto n = in.gcount();
      if(n <= 0) break;
      stream.write(buf.data(), static_cast<std::size_t>(n));
      sent += static_cast<uint64_t>(n);
    }
    if(in.bad()) {
      throw IOError("read " + path_.string() + " failed");
    }
  } catch(const DropError& e) {
    logger_->error("error copying file to {}: {}", short_peer_id(peer_id), e.what());
    abort_quietly(stream, *logger_);
    return sent;
  }

  close_quietly(stream, *logger_);
  logger_->debug("sent {} ({}) to {}", path_.filename().string(), format_size(sent), short_peer_id(peer_id));
  return sent;
}

FileFetcher::FileFetcher(PeerTransport& transport, std::filesystem::path dest_dir, std::shared_ptr<Logger> logger)
  : transport_(transport),
    dest_dir_(std::move(dest_dir)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("fetch")) {}

TransferOutcome FileFetcher::fetch(const OfferEntry& entry) {
  TransferOutcome outcome;
  outcome.destination = dest_dir_ / entry.offer.file_name;
  outcome.state = TransferState::Requested;

  std::shared_ptr<Stream> stream;
  try {
    stream = transport_.open_stream(entry.origin_peer, kTransferProtocol);
    stream->close_write();
  } catch(const DropError& e) {
    outcome.state = TransferState::Failed;
    outcome.error = e.what();
    logger_->error("error opening stream to {}: {}", short_peer_id(entry.origin_peer), e.what());
    if(stream) close_quietly(*stream, *logger_);
    return outcome;
  }

  logger_->debug("writing to {} as named by {}", outcome.destination.string(), short_peer_id(entry.origin_peer));
  std::ofstream out(outcome.destination, std::ios::binary | std::ios::trunc);
  if(!out) {
    outcome.state = TransferState::Failed;
    outcome.error = std::string("cannot create ") + outcome.destination.string() + ": " + std::strerror(errno);
    logger_->error("error creating file: {}", outcome.error);
    close_quietly(*stream, *logger_);
    return outcome;
  }

  outcome.state = TransferState::Transferring;
  std::vector<char> buf(FileServer::kChunkSize);
  try {
    for(;;) {
      auto n = stream->read_some(buf.data(), buf.size());
      if(n == 0) break;
      out.write(buf.data(), static_cast<std::streamsize>(n));
      if(!out) {
        throw IOError("write " + outcome.destination.string() + " failed");
      }
      outcome.bytes += n;
      if(progress_) progress_(outcome.bytes, entry.offer.size_bytes);
    }
    out.close();
    if(out.fail()) {
      throw IOError("close " + outcome.destination.string() + " failed");
    }
  } catch(const DropError& e) {
    outcome.state = TransferState::Failed;
    outcome.error = e.what();
    logger_->error("error copying {}: {}", entry.offer.file_name, e.what());
    abort_quietly(*stream, *logger_);
    return outcome;
  }

  close_quietly(*stream, *logger_);
  if(outcome.bytes != entry.offer.size_bytes) {
    logger_->warn("{}: received {} bytes, {} announced", entry.offer.file_name,
                  outcome.bytes, entry.offer.size_bytes);
  }
  outcome.state = TransferState::Complete;
  return outcome;
}
