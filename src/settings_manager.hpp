#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

namespace sendmer {

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","relay"},           {"aliases", {"relay_mode"}},          {"type","string"}, {"default","default"}, {"description","Relay mode: default, disabled or a relay URL"}},
  {{"key","default_relay"},   {"aliases", {"default_relay_url"}},   {"type","string"}, {"default","https://use1-1.relay.n0.iroh.iroh.link./"}, {"description","Relay URL advertised when relay mode is default"}},
  {{"key","ticket_type"},     {"aliases", {"tt"}},                  {"type","string"}, {"default","relay_and_addresses"}, {"description","Hints put in the ticket: id, relay, addresses, relay_and_addresses"}},
  {{"key","magic_ipv4_addr"}, {"aliases", {"ipv4","bind_v4"}},      {"type","string"}, {"default",""},        {"description","IPv4 address:port to bind"}},
  {{"key","magic_ipv6_addr"}, {"aliases", {"ipv6","bind_v6"}},      {"type","string"}, {"default",""},        {"description","[IPv6]:port to bind"}},
  {{"key","verbose"},         {"aliases", {"v"}},                   {"type","int"},    {"default",0},         {"description","Verbosity; repeat -v for more"}},
  {{"key","no_progress"},     {"aliases", {"quiet_progress"}},      {"type","bool"},   {"default",false},     {"description","Hide the progress meter"}},
  {{"key","show_secret"},     {"aliases", {"secret"}},              {"type","bool"},   {"default",false},     {"description","Print the endpoint secret key"}},
  {{"key","output_dir"},      {"aliases", {"o","out"}},             {"type","string"}, {"default",""},        {"description","Directory to write received files to"}},
  {{"key","meter_size"},      {"aliases", {"progress_meter_size"}}, {"type","int"},    {"default",40},        {"description","Number of characters used for the progress meter"}},
  {{"key","config"},          {"aliases", {"c"}},                   {"type","string"}, {"default",""},        {"description","JSON file with settings"}},
  {{"key","help"},            {"aliases", {"h","?"}},               {"type","bool"},   {"default",false},     {"description","Show command help and exit"}}
});

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  // Settings already given on the command line win over the file.
  bool load_from_file(const std::filesystem::path& path, std::string& error);

  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;
  bool is_int_setting(const std::string& key) const;
  std::string describe(const std::string& key) const;

  nlohmann::json get_json() const { return settings_; }
  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string normalized_key;
    std::string type;
    nlohmann::json default_value;
    std::string description;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);

  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();

  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  nlohmann::json settings_;
  std::vector<std::string> explicitly_set_;
  std::vector<SettingSpec> setting_specs_;
};

// ---- implementation -------------------------------------------------------

inline std::vector<SettingsManager::SettingSpec> SettingsManager::build_setting_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    spec.normalized_key = SettingsManager::to_lower(spec.key);
    if(entry.contains("aliases")) {
      spec.aliases = entry.at("aliases").get<std::vector<std::string>>();
      for(auto& alias : spec.aliases) {
        alias = SettingsManager::to_lower(alias);
      }
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    spec.description = entry.value("description", "");
    result.push_back(std::move(spec));
  }
  return result;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : setting_specs_(build_setting_specs(specification)) {
  apply_defaults();
}

inline void SettingsManager::apply_defaults() {
  settings_ = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    settings_[spec.key] = spec.default_value;
  }
}

inline const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  std::string lowered = to_lower(token);
  std::replace(lowered.begin(), lowered.end(), '-', '_');
  for(const auto& spec : setting_specs_) {
    if(lowered == spec.normalized_key) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

inline bool SettingsManager::has(const std::string& key) const {
  return settings_.contains(key);
}

inline std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  out.reserve(setting_specs_.size());
  for(const auto& spec : setting_specs_) out.push_back(spec.key);
  return out;
}

inline std::string SettingsManager::value_as_string(const std::string& key) const {
  if(!has(key)) return "<unknown>";
  const auto& value = settings_.at(key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

inline std::string SettingsManager::describe(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec ? spec->description : std::string();
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path, std::string& error) {
  error.clear();
  std::ifstream in(path);
  if(!in) {
    error = "unable to open " + path.string();
    return false;
  }
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    error = "failed to parse " + path.string() + ": " + e.what();
    return false;
  }
  if(!doc.is_object()) {
    error = path.string() + " does not hold a JSON object";
    return false;
  }
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) {
      print_err(nullptr, "Ignoring unknown setting '{}' in {}", item.key(), path.string());
      continue;
    }
    if(std::find(explicitly_set_.begin(), explicitly_set_.end(), spec->key) != explicitly_set_.end()) continue;
    std::string item_error;
    if(!convert_and_store(*spec, item.value(), item_error)) {
      error = "invalid setting '" + item.key() + "': " + item_error;
      return false;
    }
  }
  return true;
}

inline bool SettingsManager::convert_and_store(const SettingSpec& spec,
                                               const nlohmann::json& value,
                                               std::string& error) {
  if(spec.type == "bool") {
    if(value.is_boolean()) {
      settings_[spec.key] = value.get<bool>();
      return true;
    }
    if(value.is_number_integer()) {
      settings_[spec.key] = (value.get<int>() != 0);
      return true;
    }
    error = "expected boolean";
    return false;
  }
  if(spec.type == "int") {
    if(value.is_number_integer()) {
      settings_[spec.key] = value.get<int>();
      return true;
    }
    error = "expected integer";
    return false;
  }
  if(spec.type == "string") {
    if(value.is_string()) {
      settings_[spec.key] = value.get<std::string>();
      return true;
    }
    error = "expected string";
    return false;
  }
  error = "unknown type";
  return false;
}

inline nlohmann::json SettingsManager::parse_string_value(const SettingSpec& spec,
                                                          const std::string& value,
                                                          std::string& error) const {
  error.clear();
  std::string clean = trim_copy(value);
  if(spec.type == "bool") {
    std::string v = to_lower(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(spec.type == "int") {
    try {
      return std::stoi(clean);
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
  }
  if(spec.type == "string") {
    return clean;
  }
  error = "unsupported type";
  return {};
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                             const std::string& value,
                                             std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_string_value(*spec, value, error);
  if(!error.empty()) return false;
  if(!convert_and_store(*spec, parsed, error)) return false;
  explicitly_set_.push_back(spec->key);
  return true;
}

inline bool SettingsManager::set_from_json(const std::string& key,
                                           const nlohmann::json& value,
                                           std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  error.clear();
  if(!convert_and_store(*spec, value, error)) return false;
  explicitly_set_.push_back(spec->key);
  return true;
}

inline std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string SettingsManager::trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) {
    return spec->key;
  }
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "bool";
}

inline bool SettingsManager::is_int_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "int";
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}

} // namespace sendmer
