#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Each program describes its settings with one table: key, aliases, type
// (bool|int|string), default, description and whether --save persists it.

inline const nlohmann::json REGISTRY_SETTINGS = nlohmann::json::array({
  {{"key","listen_ip"},      {"aliases", {"li","ip"}},      {"type","string"}, {"default","127.0.0.1"}, {"description","Interface/IP to bind"}, {"persistent", true}},
  {{"key","listen_port"},    {"aliases", {"lp","port"}},    {"type","int"},    {"default",9100},        {"description","TCP port to listen on"}, {"persistent", true}},
  {{"key","io_threads"},     {"aliases", {"threads"}},      {"type","int"},    {"default",2},           {"description","Threads serving connections"}, {"persistent", true}},
  {{"key","io_timeout_ms"},  {"aliases", {"timeout"}},      {"type","int"},    {"default",30000},       {"description","Drop clients that stall longer than this"}, {"persistent", true}},
  {{"key","sweep_interval"}, {"aliases", {"sweep"}},        {"type","int"},    {"default",0},           {"description","Seconds between expired-record sweeps (0 = lazy expiry only)"}, {"persistent", true}},
  {{"key","verbose"},        {"aliases", {"v"}},            {"type","bool"},   {"default",false},       {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},           {"aliases", {"h","?"}},        {"type","bool"},   {"default",false},       {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},           {"aliases", {"persist"}},      {"type","bool"},   {"default",false},       {"description","Persist current settings to disk"}, {"persistent", false}}
});

inline const nlohmann::json RECEIVER_SETTINGS = nlohmann::json::array({
  {{"key","listen_ip"},           {"aliases", {"li","bind_ip"}},    {"type","string"}, {"default","127.0.0.1"}, {"description","Interface/IP to bind"}, {"persistent", true}},
  {{"key","listen_port"},         {"aliases", {"lp","bind_port"}},  {"type","int"},    {"default",9200},        {"description","TCP port to listen on"}, {"persistent", true}},
  {{"key","registry_host"},       {"aliases", {"chsum_ip"}},        {"type","string"}, {"default","127.0.0.1"}, {"description","Checksum registry host"}, {"persistent", true}},
  {{"key","registry_port"},       {"aliases", {"chsum_port"}},      {"type","int"},    {"default",9100},        {"description","Checksum registry port"}, {"persistent", true}},
  {{"key","file_id"},             {"aliases", {"id"}},              {"type","string"}, {"default",""},          {"description","Only accept transfers announcing this id (empty = any)"}, {"persistent", false}},
  {{"key","out_path"},            {"aliases", {"out","out_file"}},  {"type","string"}, {"default","."},         {"description","Output directory, or file written by every transfer"}, {"persistent", true}},
  {{"key","once"},                {"aliases", {"single"}},          {"type","bool"},   {"default",false},       {"description","Exit after the first verdict (status 0 only for CSUM OK)"}, {"persistent", false}},
  {{"key","io_timeout_ms"},       {"aliases", {"timeout"}},         {"type","int"},    {"default",30000},       {"description","Abandon a transfer idle for this long"}, {"persistent", true}},
  {{"key","registry_timeout_ms"}, {"aliases", {"rt"}},              {"type","int"},    {"default",5000},        {"description","Connect/read budget for the registry query"}, {"persistent", true}},
  {{"key","verify_threads"},      {"aliases", {"vt"}},              {"type","int"},    {"default",2},           {"description","Threads running registry verification"}, {"persistent", true}},
  {{"key","verbose"},             {"aliases", {"v"}},               {"type","bool"},   {"default",false},       {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},                {"aliases", {"h","?"}},           {"type","bool"},   {"default",false},       {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                {"aliases", {"persist"}},         {"type","bool"},   {"default",false},       {"description","Persist current settings to disk"}, {"persistent", false}}
});

inline const nlohmann::json SENDER_SETTINGS = nlohmann::json::array({
  {{"key","server_host"},   {"aliases", {"srv_ip"}},     {"type","string"}, {"default","127.0.0.1"}, {"description","Receiver host"}, {"persistent", true}},
  {{"key","server_port"},   {"aliases", {"srv_port"}},   {"type","int"},    {"default",9200},        {"description","Receiver port"}, {"persistent", true}},
  {{"key","registry_host"}, {"aliases", {"chsum_ip"}},   {"type","string"}, {"default","127.0.0.1"}, {"description","Checksum registry host"}, {"persistent", true}},
  {{"key","registry_port"}, {"aliases", {"chsum_port"}}, {"type","int"},    {"default",9100},        {"description","Checksum registry port"}, {"persistent", true}},
  {{"key","file_id"},       {"aliases", {"id"}},         {"type","string"}, {"default",""},          {"description","Identifier the checksum is registered under"}, {"persistent", false}},
  {{"key","file_path"},     {"aliases", {"file"}},       {"type","string"}, {"default",""},          {"description","File to send"}, {"persistent", false}},
  {{"key","checksum_ttl"},  {"aliases", {"ttl"}},        {"type","int"},    {"default",60},          {"description","Seconds the registered checksum stays valid"}, {"persistent", true}},
  {{"key","io_timeout_ms"}, {"aliases", {"timeout"}},    {"type","int"},    {"default",30000},       {"description","Connect/read/write budget per network step"}, {"persistent", true}},
  {{"key","verbose"},       {"aliases", {"v"}},          {"type","bool"},   {"default",false},       {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},          {"aliases", {"h","?"}},      {"type","bool"},   {"default",false},       {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},          {"aliases", {"persist"}},    {"type","bool"},   {"default",false},       {"description","Persist current settings to disk"}, {"persistent", false}}
});

class SettingsManager {
public:
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);

  bool save() const;
  bool load();
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const { return settings_path_; }
  void set_settings_path(const std::filesystem::path& path) { settings_path_ = path; }

  nlohmann::json get_json(bool persistent_only = true) const;

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  static bool is_bool_literal(const std::string& value);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases; // lower-cased
    std::string type;
    nlohmann::json default_value;
    bool persistent = true;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);
  const SettingSpec* find_spec(const std::string& token) const;

  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  nlohmann::json settings_;
  std::vector<SettingSpec> setting_specs_;
  std::filesystem::path settings_path_;
};

// Reads an int setting as a TCP port. Throws std::runtime_error when out of
// range (0 is accepted only with allow_zero).
uint16_t port_setting(const SettingsManager& settings, const std::string& key, bool allow_zero = false);

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}
