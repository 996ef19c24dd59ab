#pragma once
#include <cstdint>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> sha256_bytes(const std::string &data);
std::string sha256_hex(const std::string &data);

// Hex SHA-256 of 32 bytes from the OpenSSL CSPRNG.
std::string generate_peer_id();
// 16 hex chars, new for every transport start.
std::string generate_session_id();
std::string short_peer_id(const std::string& peer_id);

// SI-unit human readable size: "512 B", "4.1 kB", "15 MB".
std::string format_size(uint64_t bytes);

std::string local_user_name();
std::string local_host_name();
