#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","command"},                {"type","string"}, {"default",""},              {"description","send or recv"}, {"persistent", false}},
  {{"key","file"},                   {"type","string"}, {"default",""},              {"description","File to offer (send only)"}, {"persistent", false}},
  {{"key","listen_ip"},              {"aliases", {"li"}},           {"type","string"}, {"default","0.0.0.0"},       {"description","Interface/IP to bind"}, {"persistent", true}},
  {{"key","listen_port"},            {"aliases", {"lp"}},           {"type","int"},    {"default",0},               {"description","TCP port to listen on (0 = ephemeral)"}, {"persistent", true}},
  {{"key","peer_id"},                {"aliases", {"id"}},           {"type","string"}, {"default",""},              {"description","Explicit peer identifier"}, {"persistent", true}},
  {{"key","display_name"},           {"aliases", {"name"}},         {"type","string"}, {"default",""},              {"description","Name announced to peers (default: login user)"}, {"persistent", true}},
  {{"key","host_label"},             {"aliases", {"host"}},         {"type","string"}, {"default",""},              {"description","Host announced to peers (default: hostname)"}, {"persistent", true}},
  {{"key","discovery"},              {"aliases", {"disc"}},         {"type","bool"},   {"default",true},            {"description","Find peers with LAN multicast beacons"}, {"persistent", true}},
  {{"key","discovery_group"},        {"aliases", {"group"}},        {"type","string"}, {"default","239.255.77.77"}, {"description","Multicast group for beacons"}, {"persistent", true}},
  {{"key","discovery_port"},         {"aliases", {"dp"}},           {"type","int"},    {"default",47077},           {"description","UDP port for beacons"}, {"persistent", true}},
  {{"key","discovery_interval_ms"},  {"aliases", {"dim"}},          {"type","int"},    {"default",5000},            {"description","Milliseconds between beacons"}, {"persistent", true}},
  {{"key","bootstrap_peer"},         {"aliases", {"bootstrap"}},    {"type","string"}, {"default",""},              {"description","Peer host:port to dial at start"}, {"persistent", true}},
  {{"key","stream_timeout_ms"},      {"aliases", {"timeout"}},      {"type","int"},    {"default",30000},           {"description","Deadline for each stream operation"}, {"persistent", true}},
  {{"key","worker_threads"},         {"aliases", {"wt"}},           {"type","int"},    {"default",4},               {"description","Threads dialing peers"}, {"persistent", true}},
  {{"key","task_threads"},           {"aliases", {"tt"}},           {"type","int"},    {"default",4},               {"description","Threads sending announcements"}, {"persistent", true}},
  {{"key","max_announcement_bytes"}, {"aliases", {"mab"}},          {"type","int"},    {"default",65536},           {"description","Largest accepted announcement"}, {"persistent", true}},
  {{"key","download_dir"},           {"aliases", {"dir"}},          {"type","string"}, {"default",""},              {"description","Where received files land (default: cwd)"}, {"persistent", true}},
  {{"key","status_display"},         {"aliases", {"status"}},       {"type","bool"},   {"default",true},            {"description","Redraw a status screen instead of scrolling logs"}, {"persistent", true}},
  {{"key","status_interval_ms"},     {"aliases", {"sim"}},          {"type","int"},    {"default",1000},            {"description","Milliseconds between status redraws"}, {"persistent", true}},
  {{"key","status_log_lines"},       {"aliases", {"sll"}},          {"type","int"},    {"default",10},              {"description","Recent log lines kept on the status screen"}, {"persistent", true}},
  {{"key","transfer_progress"},      {"aliases", {"progress","tp"}},{"type","bool"},   {"default",true},            {"description","Show a progress meter while receiving"}, {"persistent", true}},
  {{"key","verbose"},                {"aliases", {"v"}},            {"type","bool"},   {"default",false},           {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},                   {"aliases", {"h","?"}},        {"type","bool"},   {"default",false},           {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                   {"aliases", {"persist"}},      {"type","bool"},   {"default",false},           {"description","Persist current settings to disk"}, {"persistent", false}}
});

class SettingsManager {
public:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string type;
    nlohmann::json default_value;
    std::string description;
    bool persistent = true;
  };

  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const {
    auto it = values_.find(key);
    if(it == values_.end()) {
      throw std::runtime_error("Unknown setting: " + key);
    }
    return it->get<T>();
  }

  bool has(const std::string& key) const { return values_.contains(key); }

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);

  bool load();
  bool save() const;

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;
  const std::vector<SettingSpec>& specs() const { return specs_; }
  std::string value_as_string(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  nlohmann::json persistent_json() const;

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  static bool is_bool_literal(const std::string& value);

private:
  const SettingSpec* find_spec(const std::string& token) const;
  bool store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);

  std::vector<SettingSpec> specs_;
  nlohmann::json values_ = nlohmann::json::object();
  std::filesystem::path settings_path_override_;
};
