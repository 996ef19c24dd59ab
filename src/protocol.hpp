#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

using json = nlohmann::json;

// protocol.hpp
inline constexpr const char* kAnnouncementProtocol = "/p2pdrop/1.0.0/hello";
inline constexpr const char* kTransferProtocol = "/p2pdrop/1.0.0/get";
// Internal to the LAN transport: first stream between two peers.
inline constexpr const char* kConnectProtocol = "/p2pdrop/transport/connect";
inline constexpr const char* kDiscoveryService = "p2pdrop";

inline constexpr std::size_t kDefaultMaxAnnouncementBytes = 64 * 1024;
inline constexpr std::size_t kMaxStreamHeaderBytes = 4 * 1024;

// What a peer says about the file it serves. file_name is empty when the
// sender only discovers.
struct OfferDescriptor {
  std::string display_name;
  std::string host_label;
  std::string file_name;
  uint64_t size_bytes = 0;

  bool has_file() const { return !file_name.empty(); }
};

json make_offer_json(const OfferDescriptor& offer);
// One JSON object terminated by '\n'.
std::string encode_offer(const OfferDescriptor& offer);
// Throws SerializationError. Unknown keys are ignored, missing ones default.
OfferDescriptor decode_offer(const std::string& payload);
// "alice@laptop - report.pdf (4.1 kB)"
std::string describe_offer(const OfferDescriptor& offer);

// First line of every logical stream the LAN transport opens. session is
// fresh per process, so a restarted peer reusing its peer_id is told apart.
struct StreamHeader {
  std::string peer_id;
  std::string protocol;
  uint16_t listen_port = 0;
  std::string session;
};

std::string encode_stream_header(const StreamHeader& header);
StreamHeader decode_stream_header(const std::string& line);

struct DiscoveryBeacon {
  std::string peer_id;
  uint16_t port = 0;
  std::string session;
};

std::string encode_beacon(const DiscoveryBeacon& beacon);
// Foreign or malformed datagrams yield nullopt.
std::optional<DiscoveryBeacon> decode_beacon(const std::string& datagram);
