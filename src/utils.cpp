#include "utils.hpp"
#include "errors.hpp"
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <pwd.h>
#include <unistd.h>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::vector<unsigned char> sha256_bytes(const std::string &data){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256((const unsigned char*)data.data(), data.size(), out.data());
    return out;
}

std::string sha256_hex(const std::string &data){
    return hex_from_bytes(sha256_bytes(data));
}

std::string generate_peer_id(){
    std::vector<unsigned char> seed(32);
    if(RAND_bytes(seed.data(), static_cast<int>(seed.size())) != 1){
        throw TransportInitError("unable to gather entropy for peer identity");
    }
    return sha256_hex(std::string(seed.begin(), seed.end()));
}

std::string generate_session_id(){
    std::vector<unsigned char> nonce(8);
    if(RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1){
        throw TransportInitError("unable to gather entropy for session id");
    }
    return hex_from_bytes(nonce);
}

std::string short_peer_id(const std::string& peer_id){
    return peer_id.size() > 12 ? peer_id.substr(0, 12) : peer_id;
}

std::string format_size(uint64_t bytes){
    if(bytes < 10) return std::to_string(bytes) + " B";

    static const char* units[] = {"B", "kB", "MB", "GB", "TB", "PB", "EB"};
    constexpr std::size_t unit_count = sizeof(units) / sizeof(units[0]);
    double value = static_cast<double>(bytes);
    std::size_t idx = 0;
    while(idx + 1 < unit_count && value >= 1000.0){
        value /= 1000.0;
        ++idx;
    }
    double rounded = std::floor(value * 10.0 + 0.5) / 10.0;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(rounded < 10.0 ? 1 : 0) << rounded << " " << units[idx];
    return oss.str();
}

std::string local_user_name(){
    if(const passwd* pw = getpwuid(geteuid())){
        if(pw->pw_name && *pw->pw_name) return pw->pw_name;
    }
    if(const char* user = std::getenv("USER")){
        if(*user) return user;
    }
    return "unknown";
}

std::string local_host_name(){
    char hostname[256] = {};
    if(gethostname(hostname, sizeof(hostname) - 1) != 0 || hostname[0] == '\0'){
        return "UnknownHost";
    }
    return hostname;
}
