#pragma once

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "utils.hpp"

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","node_name"},               {"aliases", {"name"}},            {"type","string"}, {"default",""},               {"description","Human readable node name (defaults to host-pid)"}},
  {{"key","node_id"},                 {"aliases", {"id"}},              {"type","string"}, {"default",""},               {"description","Stable node identifier (generated when empty)"}},
  {{"key","listen_ip"},               {"aliases", {"li"}},              {"type","string"}, {"default","0.0.0.0"},        {"description","Interface/IP the TCP transport binds"}},
  {{"key","listen_port"},             {"aliases", {"lp","port"}},       {"type","int"},    {"default",9000},             {"description","TCP transport listen port (replies to discovery arrive on port+1)"}, {"min",0}, {"max",65534}},
  {{"key","discovery_port"},          {"aliases", {"dp"}},              {"type","int"},    {"default",9876},             {"description","UDP port answering DISCOVER datagrams"}, {"min",1}, {"max",65535}},
  {{"key","discovery_target_port"},   {"aliases", {"dtp"}},             {"type","int"},    {"default",0},                {"description","UDP port DISCOVER datagrams are sent to (0 = discovery_port)"}, {"min",0}, {"max",65535}},
  {{"key","broadcast_address"},       {"aliases", {"ba"}},              {"type","string"}, {"default","255.255.255.255"},{"description","Destination address for DISCOVER datagrams"}},
  {{"key","enable_tcp"},              {"aliases", {"tcp"}},             {"type","bool"},   {"default",true},             {"description","Enable the TCP/IP transport"}},
  {{"key","enable_wifi_direct"},      {"aliases", {"wifi","wd"}},       {"type","bool"},   {"default",true},             {"description","Enable the WiFi Direct transport"}},
  {{"key","enable_bluetooth"},        {"aliases", {"bt"}},              {"type","bool"},   {"default",true},             {"description","Enable the Bluetooth transport"}},
  {{"key","enable_relay"},            {"aliases", {"relay"}},           {"type","bool"},   {"default",true},             {"description","Use relay servers when direct connections fail"}},
  {{"key","relay_servers"},           {"aliases", {"rs"}},              {"type","list"},   {"default",{"relay1.bitshare.net:9100","relay2.bitshare.net:9100"}}, {"description","Relay rendezvous servers (host:port, comma separated)"}},
  {{"key","simulate_radios"},         {"aliases", {"sim"}},             {"type","bool"},   {"default",false},            {"description","Serve WiFi Direct/Bluetooth from the in-process simulated medium"}},
  {{"key","data_dir"},                {"aliases", {"dd"}},              {"type","string"}, {"default","."},              {"description","Directory for settings and received files"}},
  {{"key","scan_timeout_ms"},         {"aliases", {"sto"}},             {"type","int"},    {"default",30000},            {"description","Upper bound for one discovery scan"}, {"min",1}},
  {{"key","discovery_interval_s"},    {"aliases", {"di"}},              {"type","int"},    {"default",60},               {"description","Seconds between background discovery scans"}, {"min",1}},
  {{"key","routing_interval_s"},      {"aliases", {"ri"}},              {"type","int"},    {"default",30},               {"description","Seconds between routing table rebuilds"}, {"min",1}},
  {{"key","connectivity_interval_s"}, {"aliases", {"ci"}},              {"type","int"},    {"default",300},              {"description","Seconds between connectivity re-checks"}, {"min",1}},
  {{"key","peer_ttl_s"},              {"aliases", {"ttl"}},             {"type","int"},    {"default",1800},             {"description","Evict unconnected peers unseen for this long (0 = never)"}, {"min",0}},
  {{"key","isolation_confirmations"}, {"aliases", {"ic"}},              {"type","int"},    {"default",2},                {"description","Consecutive samples required to flip the isolation flag"}, {"min",1}},
  {{"key","idle_timeout_s"},          {"aliases", {"idle"}},            {"type","int"},    {"default",300},              {"description","Close channels silent for this long"}, {"min",1}},
  {{"key","max_frame_bytes"},         {"aliases", {"mfb"}},             {"type","int"},    {"default",104857600},        {"description","Largest accepted frame payload"}, {"min",1024}},
  {{"key","connect_timeout_ms"},      {"aliases", {"cto"}},             {"type","int"},    {"default",5000},             {"description","Timeout for one connection strategy"}, {"min",1}},
  {{"key","chunk_size"},              {"aliases", {"cs"}},              {"type","int"},    {"default",1048576},          {"description","Chunk size in bytes"}, {"min",1}},
  {{"key","parallelism"},             {"aliases", {"par"}},             {"type","int"},    {"default",5},                {"description","Concurrent outstanding chunk sends"}, {"min",1}},
  {{"key","retry_count"},             {"aliases", {"retries"}},         {"type","int"},    {"default",3},                {"description","Retries per chunk"}, {"min",0}},
  {{"key","retry_delay_ms"},          {"aliases", {"rd"}},              {"type","int"},    {"default",1000},             {"description","Delay between chunk retries"}, {"min",0}},
  {{"key","verify_checksums"},        {"aliases", {"verify"}},          {"type","bool"},   {"default",true},             {"description","Require receiver checksum confirmation per chunk"}},
  {{"key","verbose"},                 {"aliases", {"v"}},               {"type","bool"},   {"default",false},            {"description","Enable verbose logging"}},
  {{"key","log_file"},                {"aliases", {"lf"}},              {"type","string"}, {"default",""},               {"description","Also write log records to this file"}},
  {{"key","scan"},                    {"aliases", {"s"}},               {"type","bool"},   {"default",false},            {"description","Run one discovery scan, print peers and exit"}, {"persistent", false}},
  {{"key","send_to"},                 {"aliases", {"to"}},              {"type","string"}, {"default",""},               {"description","Peer ID or name to send --send_file to"}, {"persistent", false}},
  {{"key","send_file"},               {"aliases", {"file"}},            {"type","string"}, {"default",""},               {"description","File to send to --send_to and exit"}, {"persistent", false}},
  {{"key","help"},                    {"aliases", {"h","?"}},           {"type","bool"},   {"default",false},            {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                    {"aliases", {"persist"}},         {"type","bool"},   {"default",false},            {"description","Persist current settings to disk"}, {"persistent", false}}
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

  bool save() const;
  bool load();
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;
  const nlohmann::json& specification() const { return specification_; }

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  nlohmann::json get_json(bool persistent_only = true) const;

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string type;
    nlohmann::json default_value;
    std::optional<long long> min;
    std::optional<long long> max;
    bool persistent = true;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);
  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();
  void merge_from_json(const nlohmann::json& doc);

  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  nlohmann::json specification_;
  nlohmann::json settings_;
  std::vector<SettingSpec> setting_specs_;
  std::filesystem::path settings_path_override_;
};

// ---- implementation -------------------------------------------------------

inline std::vector<SettingsManager::SettingSpec> SettingsManager::build_setting_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    if(entry.contains("aliases")) {
      spec.aliases = entry.at("aliases").get<std::vector<std::string>>();
      for(auto& alias : spec.aliases) alias = to_lower(alias);
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    if(entry.contains("min")) spec.min = entry.at("min").get<long long>();
    if(entry.contains("max")) spec.max = entry.at("max").get<long long>();
    spec.persistent = entry.value("persistent", true);
    result.push_back(std::move(spec));
  }
  return result;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : specification_(specification),
    setting_specs_(build_setting_specs(specification)) {
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
  for(const auto& spec : setting_specs_) {
    if(lowered == to_lower(spec.key)) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

inline bool SettingsManager::has(const std::string& key) const {
  return settings_.contains(key);
}

inline void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_override_ = path;
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_override_.empty()) {
    return settings_path_override_;
  }
  return std::filesystem::path(get<std::string>("data_dir")) / ".config" / "settings.json";
}

inline bool SettingsManager::load() {
  return load_from_file(settings_path());
}

inline bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  try {
    nlohmann::json doc;
    in >> doc;
    merge_from_json(doc);
    return true;
  } catch(const std::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
}

inline bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << get_json(true).dump(2);
  return static_cast<bool>(out);
}

inline void SettingsManager::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) return;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) continue;
    std::string error;
    if(!convert_and_store(*spec, item.value(), error) && !error.empty()) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
}

inline nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    if(persistent_only && !spec.persistent) continue;
    if(settings_.contains(spec.key)) {
      doc[spec.key] = settings_.at(spec.key);
    }
  }
  return doc;
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
    if(!value.is_number_integer()) {
      error = "expected integer";
      return false;
    }
    auto number = value.get<long long>();
    if(spec.min && number < *spec.min) {
      error = "must be >= " + std::to_string(*spec.min);
      return false;
    }
    if(spec.max && number > *spec.max) {
      error = "must be <= " + std::to_string(*spec.max);
      return false;
    }
    settings_[spec.key] = number;
    return true;
  }
  if(spec.type == "string") {
    if(value.is_string()) {
      settings_[spec.key] = value.get<std::string>();
      return true;
    }
    error = "expected string";
    return false;
  }
  if(spec.type == "list") {
    if(!value.is_array()) {
      error = "expected list of strings";
      return false;
    }
    for(const auto& item : value) {
      if(!item.is_string()) {
        error = "expected list of strings";
        return false;
      }
    }
    settings_[spec.key] = value;
    return true;
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
      std::size_t used = 0;
      long long parsed = std::stoll(clean, &used);
      if(used != clean.size()) {
        error = "trailing characters in integer";
        return {};
      }
      return parsed;
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
  }
  if(spec.type == "string") {
    return clean;
  }
  if(spec.type == "list") {
    nlohmann::json items = nlohmann::json::array();
    std::stringstream ss(clean);
    std::string part;
    while(std::getline(ss, part, ',')) {
      part = trim_copy(part);
      if(!part.empty()) items.push_back(part);
    }
    return items;
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
  return convert_and_store(*spec, parsed, error);
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
  return convert_and_store(*spec, value, error);
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

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}
