#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "log.hpp"
#include "offer_registry.hpp"
#include "protocol.hpp"
#include "transport.hpp"

// Both halves of the hello exchange. On every new connection we push our
// offer to the peer; inbound offers are logged (sender) or registered
// (receiver, when a registry is given).
class OfferAnnouncer {
public:
  OfferAnnouncer(PeerTransport& transport,
                 OfferDescriptor local_offer,
                 OfferStore* registry,
                 std::shared_ptr<Logger> logger,
                 std::size_t max_announcement_bytes = kDefaultMaxAnnouncementBytes);

  void install();

  // Opens a hello stream to peer_id and writes the local offer. Failures are
  // logged, never thrown.
  void send_announcement(const std::string& peer_id);
  void handle_announcement(std::shared_ptr<Stream> stream, const std::string& peer_id);

  const OfferDescriptor& local_offer() const { return local_offer_; }

private:
  std::string read_payload(Stream& stream) const;
  void close_stream(Stream& stream, const std::string& peer_id) const;

  PeerTransport& transport_;
  OfferDescriptor local_offer_;
  OfferStore* registry_;
  std::shared_ptr<Logger> logger_;
  std::size_t max_bytes_;
};
