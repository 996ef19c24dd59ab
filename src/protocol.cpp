#include "protocol.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <limits>

namespace {

json parse_object(const std::string& text, const char* what) {
    json j;
    try {
        j = json::parse(text);
    } catch(const json::parse_error& e) {
        throw SerializationError(std::string(what) + ": " + e.what());
    }
    if(!j.is_object()) {
        throw SerializationError(std::string(what) + ": expected a JSON object");
    }
    return j;
}

std::string string_field(const json& j, const char* key, const char* what) {
    auto it = j.find(key);
    if(it == j.end() || it->is_null()) return {};
    if(!it->is_string()) {
        throw SerializationError(std::string(what) + ": field '" + key + "' must be a string");
    }
    return it->get<std::string>();
}

uint64_t unsigned_field(const json& j, const char* key, const char* what) {
    auto it = j.find(key);
    if(it == j.end() || it->is_null()) return 0;
    if(!it->is_number_unsigned()) {
        throw SerializationError(std::string(what) + ": field '" + key + "' must be an unsigned integer");
    }
    return it->get<uint64_t>();
}

} // namespace

json make_offer_json(const OfferDescriptor& offer) {
    json j;
    j["Name"] = offer.display_name;
    j["Hostname"] = offer.host_label;
    j["File"] = offer.file_name;
    j["Size"] = offer.size_bytes;
    return j;
}

std::string encode_offer(const OfferDescriptor& offer) {
    return make_offer_json(offer).dump() + "\n";
}

OfferDescriptor decode_offer(const std::string& payload) {
    const char* what = "malformed announcement";
    auto j = parse_object(payload, what);
    OfferDescriptor offer;
    offer.display_name = string_field(j, "Name", what);
    offer.host_label = string_field(j, "Hostname", what);
    offer.file_name = string_field(j, "File", what);
    offer.size_bytes = unsigned_field(j, "Size", what);
    return offer;
}

std::string describe_offer(const OfferDescriptor& offer) {
    return offer.display_name + "@" + offer.host_label + " - " + offer.file_name +
           " (" + format_size(offer.size_bytes) + ")";
}

std::string encode_stream_header(const StreamHeader& header) {
    json j;
    j["peer_id"] = header.peer_id;
    j["protocol"] = header.protocol;
    j["listen_port"] = header.listen_port;
    if(!header.session.empty()) j["session"] = header.session;
    return j.dump() + "\n";
}

StreamHeader decode_stream_header(const std::string& line) {
    const char* what = "malformed stream header";
    auto j = parse_object(line, what);
    StreamHeader header;
    header.peer_id = string_field(j, "peer_id", what);
    header.protocol = string_field(j, "protocol", what);
    auto port = unsigned_field(j, "listen_port", what);
    if(port > std::numeric_limits<uint16_t>::max()) {
        throw SerializationError(std::string(what) + ": listen_port out of range");
    }
    header.listen_port = static_cast<uint16_t>(port);
    header.session = string_field(j, "session", what);
    if(header.peer_id.empty() || header.protocol.empty()) {
        throw SerializationError(std::string(what) + ": missing peer_id or protocol");
    }
    return header;
}

std::string encode_beacon(const DiscoveryBeacon& beacon) {
    json j;
    j["service"] = kDiscoveryService;
    j["peer_id"] = beacon.peer_id;
    j["port"] = beacon.port;
    if(!beacon.session.empty()) j["session"] = beacon.session;
    return j.dump();
}

std::optional<DiscoveryBeacon> decode_beacon(const std::string& datagram) {
    auto j = json::parse(datagram, nullptr, false);
    if(j.is_discarded() || !j.is_object()) return std::nullopt;
    auto service = j.find("service");
    if(service == j.end() || !service->is_string() ||
       service->get<std::string>() != kDiscoveryService) return std::nullopt;
    auto peer_id = j.find("peer_id");
    if(peer_id == j.end() || !peer_id->is_string()) return std::nullopt;
    auto port = j.find("port");
    if(port == j.end() || !port->is_number_unsigned()) return std::nullopt;
    auto port_value = port->get<uint64_t>();
    if(port_value == 0 || port_value > std::numeric_limits<uint16_t>::max()) return std::nullopt;
    DiscoveryBeacon beacon;
    beacon.peer_id = peer_id->get<std::string>();
    beacon.port = static_cast<uint16_t>(port_value);
    auto session = j.find("session");
    if(session != j.end()) {
        if(!session->is_string()) return std::nullopt;
        beacon.session = session->get<std::string>();
    }
    if(beacon.peer_id.empty()) return std::nullopt;
    return beacon;
}
