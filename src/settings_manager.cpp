#include "settings_manager.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <cstdint>
#include <limits>

#include "log.hpp"

namespace {

// JSON integers wider than int are rejected rather than narrowed.
bool fits_int(const nlohmann::json& value) {
  if(value.is_number_unsigned()) {
    return value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max());
  }
  if(value.is_number_integer()) {
    auto v = value.get<int64_t>();
    return v >= std::numeric_limits<int>::min() && v <= std::numeric_limits<int>::max();
  }
  return false;
}

} // namespace

SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

SettingsManager::SettingsManager(const nlohmann::json& specification) {
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    if(entry.contains("aliases")) {
      for(auto alias : entry.at("aliases").get<std::vector<std::string>>()) {
        spec.aliases.push_back(to_lower(std::move(alias)));
      }
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    spec.description = entry.value("description", "");
    spec.persistent = entry.value("persistent", true);
    values_[spec.key] = spec.default_value;
    specs_.push_back(std::move(spec));
  }
}

const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  const std::string lowered = to_lower(token);
  for(const auto& spec : specs_) {
    if(lowered == to_lower(spec.key)) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) return spec->key;
  return std::nullopt;
}

bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "bool";
}

std::string SettingsManager::value_as_string(const std::string& key) const {
  if(!has(key)) return "<unknown>";
  const auto& value = values_.at(key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

bool SettingsManager::store(const SettingSpec& spec, const nlohmann::json& value, std::string& error) {
  if(spec.type == "bool") {
    if(value.is_boolean()) {
      values_[spec.key] = value.get<bool>();
      return true;
    }
    if(value.is_number_integer()) {
      values_[spec.key] = value.get<int64_t>() != 0;
      return true;
    }
    error = "expected boolean";
    return false;
  }
  if(spec.type == "int") {
    if(fits_int(value)) {
      values_[spec.key] = value.get<int>();
      return true;
    }
    error = value.is_number_integer() ? "integer out of range" : "expected integer";
    return false;
  }
  if(spec.type == "string") {
    if(value.is_string()) {
      values_[spec.key] = value.get<std::string>();
      return true;
    }
    error = "expected string";
    return false;
  }
  error = "unknown type '" + spec.type + "'";
  return false;
}

bool SettingsManager::set_from_string(const std::string& key,
                                      const std::string& value,
                                      std::string& error) {
  error.clear();
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  const std::string clean = trim_copy(value);
  if(spec->type == "bool") {
    const std::string v = to_lower(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return store(*spec, true, error);
    if(v == "false" || v == "0" || v == "off" || v == "no") return store(*spec, false, error);
    error = "expected boolean (true|false|on|off)";
    return false;
  }
  if(spec->type == "int") {
    std::size_t consumed = 0;
    int parsed = 0;
    try {
      parsed = std::stoi(clean, &consumed);
    } catch(const std::exception&) {
      error = "expected integer";
      return false;
    }
    if(consumed != clean.size()) {
      error = "expected integer";
      return false;
    }
    return store(*spec, parsed, error);
  }
  return store(*spec, clean, error);
}

void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_override_ = path;
}

std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_override_.empty()) return settings_path_override_;
  return std::filesystem::current_path() / ".config" / "p2pdrop.json";
}

bool SettingsManager::load() {
  const auto path = settings_path();
  std::ifstream in(path);
  if(!in) return false;
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
  if(!doc.is_object()) return false;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec || !spec->persistent) continue;
    std::string error;
    if(!store(*spec, item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
  return true;
}

bool SettingsManager::save() const {
  const auto path = settings_path();
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << persistent_json().dump(2);
  return static_cast<bool>(out);
}

nlohmann::json SettingsManager::persistent_json() const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : specs_) {
    if(spec.persistent) doc[spec.key] = values_.at(spec.key);
  }
  return doc;
}

std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string SettingsManager::trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

bool SettingsManager::is_bool_literal(const std::string& value) {
  const std::string lowered = to_lower(trim_copy(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
}
