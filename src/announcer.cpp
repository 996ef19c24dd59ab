#include "announcer.hpp"

#include <array>

#include "errors.hpp"
#include "utils.hpp"

OfferAnnouncer::OfferAnnouncer(PeerTransport& transport,
                               OfferDescriptor local_offer,
                               OfferStore* registry,
                               std::shared_ptr<Logger> logger,
                               std::size_t max_announcement_bytes)
  : transport_(transport),
    local_offer_(std::move(local_offer)),
    registry_(registry),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("hello")),
    max_bytes_(max_announcement_bytes) {}

void OfferAnnouncer::install() {
  transport_.set_stream_handler(kAnnouncementProtocol,
    [this](std::shared_ptr<Stream> stream, const std::string& peer_id){
      handle_announcement(std::move(stream), peer_id);
    });
}

void OfferAnnouncer::send_announcement(const std::string& peer_id) {
  std::shared_ptr<Stream> stream;
  try {
    stream = transport_.open_stream(peer_id, kAnnouncementProtocol);
  } catch(const DropError& e) {
    logger_->error("error opening stream to {}: {}", short_peer_id(peer_id), e.what());
    return;
  }

  try {
    stream->write(encode_offer(local_offer_));
  } catch(const DropError& e) {
    logger_->error("error writing hello to {}: {}", short_peer_id(peer_id), e.what());
  }
  close_stream(*stream, peer_id);
}

std::string OfferAnnouncer::read_payload(Stream& stream) const {
  std::string payload;
  std::array<char, 4096> buf;
  for(;;) {
    auto n = stream.read_some(buf.data(), buf.size());
    if(n == 0) break;
    payload.append(buf.data(), n);
    auto nl = payload.find('\n');
    if(nl != std::string::npos) {
      payload.resize(nl);
      break;
    }
    if(payload.size() > max_bytes_) {
      throw SerializationError("announcement exceeds " + std::to_string(max_bytes_) + " bytes");
    }
  }
  if(payload.size() > max_bytes_) {
    throw SerializationError("announcement exceeds " + std::to_string(max_bytes_) + " bytes");
  }
  return payload;
}

void OfferAnnouncer::handle_announcement(std::shared_ptr<Stream> stream, const std::string& peer_id) {
  OfferDescriptor offer;
  try {
    offer = decode_offer(read_payload(*stream));
  } catch(const DropError& e) {
    logger_->error("reading hello from {}: {}", short_peer_id(peer_id), e.what());
    close_stream(*stream, peer_id);
    return;
  }

  if(!registry_) {
    logger_->info("Found someone: {}", describe_offer(offer));
    close_stream(*stream, peer_id);
    return;
  }

  if(!offer.has_file()) {
    close_stream(*stream, peer_id);
    return;
  }

  auto index = registry_->append(offer, peer_id);
  close_stream(*stream, peer_id);
  logger_->info("{}: {}", index, describe_offer(offer));
}

void OfferAnnouncer::close_stream(Stream& stream, const std::string& peer_id) const {
  try {
    stream.close();
  } catch(const DropError& e) {
    logger_->debug("closing hello stream with {}: {}", short_peer_id(peer_id), e.what());
  }
}
