#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","server_url"},              {"aliases", {"server","url","s"}},       {"type","string"}, {"default","http://localhost:3001"}, {"description","Base URL of the chunk store"}, {"persistent", true}},
  {{"key","chunk_size_bytes"},        {"aliases", {"chunk_size","cs"}},        {"type","uint64"}, {"default",2097152},     {"description","Bytes per chunk"}, {"persistent", true}},
  {{"key","max_concurrent_chunks"},   {"aliases", {"chunks","mcc"}},           {"type","int"},    {"default",6},           {"description","Chunk uploads in flight per file"}, {"persistent", true}},
  {{"key","max_concurrent_files"},    {"aliases", {"files","mcf"}},            {"type","int"},    {"default",3},           {"description","Files uploading at the same time"}, {"persistent", true}},
  {{"key","max_retry_count"},         {"aliases", {"retries","r"}},            {"type","int"},    {"default",3},           {"description","Attempts per chunk before it fails"}, {"persistent", true}},
  {{"key","retry_delay_ms"},          {"aliases", {"retry_delay","rd"}},       {"type","int"},    {"default",1000},        {"description","Milliseconds to wait between chunk attempts"}, {"persistent", true}},
  {{"key","retry_backoff"},           {"aliases", {"backoff"}},                {"type","string"}, {"default","fixed"},     {"description","Retry delay growth (fixed|exponential)"}, {"persistent", true}},
  {{"key","retry_max_delay_ms"},      {"aliases", {"max_delay"}},              {"type","int"},    {"default",30000},       {"description","Upper bound for exponential retry delay"}, {"persistent", true}},
  {{"key","max_file_size_bytes"},     {"aliases", {"max_size","mfs"}},         {"type","uint64"}, {"default",10737418240ULL}, {"description","Files larger than this are rejected"}, {"persistent", true}},
  {{"key","hash_window_bytes"},       {"aliases", {"hash_window","hw"}},       {"type","uint64"}, {"default",4194304},     {"description","Read size used while fingerprinting"}, {"persistent", true}},
  {{"key","hash_algorithm"},          {"aliases", {"hash","ha"}},              {"type","string"}, {"default","md5"},       {"description","Fingerprint digest (md5|sha256)"}, {"persistent", true}},
  {{"key","request_timeout_seconds"}, {"aliases", {"timeout","t"}},            {"type","int"},    {"default",0},           {"description","Per-request timeout in seconds (0 = none)"}, {"persistent", true}},
  {{"key","verbose"},                 {"aliases", {"v"}},                      {"type","bool"},   {"default",false},       {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","log_file"},                {"aliases", {"log"}},                    {"type","string"}, {"default",""},          {"description","Also write logs to this rotating file"}, {"persistent", true}},
  {{"key","transfer_progress"},       {"aliases", {"progress","tp"}},          {"type","bool"},   {"default",true},        {"description","Show ASCII progress meter during uploads"}, {"persistent", true}},
  {{"key","progress_meter_size"},     {"aliases", {"meter","meter_size","pms"}}, {"type","int"}, {"default",40},          {"description","Number of characters used for the chunk meter"}, {"persistent", true}},
  {{"key","progress_interval_ms"},    {"aliases", {"progress_interval","pim"}}, {"type","int"},  {"default",250},         {"description","Milliseconds between progress redraws"}, {"persistent", true}},
  {{"key","check_server"},            {"aliases", {"ping"}},                   {"type","bool"},   {"default",true},        {"description","Probe the store before uploading"}, {"persistent", true}},
  {{"key","help"},                    {"aliases", {"h","?"}},                  {"type","bool"},   {"default",false},       {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                    {"aliases", {"persist"}},                {"type","bool"},   {"default",false},       {"description","Persist current settings to disk"}, {"persistent", false}}
});

enum class SettingType { Bool, Int, UInt64, String };

// Typed key/value settings described by a JSON specification table. Values
// come from the defaults, then .config/settings.json, then the command line.
class SettingsManager {
public:
  struct Setting {
    std::string key;
    std::vector<std::string> aliases; // lower-cased
    SettingType type = SettingType::String;
    nlohmann::json default_value;
    std::string description;
    bool persistent = true;
  };

  SettingsManager() : SettingsManager(SETTINGS_SPECIFICATION) {}
  explicit SettingsManager(const nlohmann::json& specification);

  // Throws std::runtime_error for a key missing from the specification.
  template<typename T>
  T get(const std::string& key) const {
    auto it = values_.find(key);
    if(it == values_.end()) {
      throw std::runtime_error("Unknown setting: " + key);
    }
    return it->get<T>();
  }

  // Parses `text` according to the setting's type. On failure `error` says why
  // and the stored value is unchanged.
  bool set_from_string(const std::string& key, const std::string& text, std::string& error);

  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;
  static bool is_bool_literal(const std::string& value);

  bool help_requested() const { return get<bool>("help"); }
  bool save_requested() const { return get<bool>("save"); }

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path) { path_override_ = path; }

  // Missing file is not an error; unreadable JSON and bad values are reported
  // and skipped.
  bool load();
  bool save() const;

  const std::vector<Setting>& settings() const { return settings_; }

private:
  const Setting* find(const std::string& token) const;
  std::optional<nlohmann::json> coerce(const Setting& setting,
                                       const nlohmann::json& value,
                                       std::string& error) const;

  static std::string lowered(std::string value);
  static std::string trimmed(const std::string& value);

  std::vector<Setting> settings_;
  nlohmann::json values_ = nlohmann::json::object();
  std::filesystem::path path_override_;
};

inline SettingType setting_type_from_name(const std::string& name) {
  if(name == "bool") return SettingType::Bool;
  if(name == "int") return SettingType::Int;
  if(name == "uint64") return SettingType::UInt64;
  if(name == "string") return SettingType::String;
  throw std::invalid_argument("unknown setting type '" + name + "'");
}

inline SettingsManager::SettingsManager(const nlohmann::json& specification) {
  for(const auto& entry : specification) {
    Setting setting;
    setting.key = entry.at("key").get<std::string>();
    for(const auto& alias : entry.value("aliases", std::vector<std::string>{})) {
      setting.aliases.push_back(lowered(alias));
    }
    setting.type = setting_type_from_name(entry.at("type").get<std::string>());
    setting.default_value = entry.at("default");
    setting.description = entry.value("description", "");
    setting.persistent = entry.value("persistent", true);
    values_[setting.key] = setting.default_value;
    settings_.push_back(std::move(setting));
  }
}

inline std::string SettingsManager::lowered(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string SettingsManager::trimmed(const std::string& value) {
  auto first = std::find_if_not(value.begin(), value.end(),
                                [](unsigned char ch){ return std::isspace(ch); });
  auto last = std::find_if_not(value.rbegin(), value.rend(),
                               [](unsigned char ch){ return std::isspace(ch); }).base();
  return first < last ? std::string(first, last) : std::string();
}

inline const SettingsManager::Setting* SettingsManager::find(const std::string& token) const {
  auto needle = lowered(token);
  for(const auto& setting : settings_) {
    if(lowered(setting.key) == needle) return &setting;
    if(std::find(setting.aliases.begin(), setting.aliases.end(), needle) != setting.aliases.end()) {
      return &setting;
    }
  }
  return nullptr;
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* setting = find(token)) return setting->key;
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* setting = find(key);
  return setting && setting->type == SettingType::Bool;
}

inline bool SettingsManager::is_bool_literal(const std::string& value) {
  static const char* const kLiterals[] = {"true", "false", "on", "off", "1", "0", "yes", "no"};
  auto v = lowered(trimmed(value));
  return std::any_of(std::begin(kLiterals), std::end(kLiterals),
                     [&](const char* literal){ return v == literal; });
}

// Accepts the JSON form of a value (from settings.json or an already parsed
// command line token) and returns it in the setting's storage type.
inline std::optional<nlohmann::json> SettingsManager::coerce(const Setting& setting,
                                                             const nlohmann::json& value,
                                                             std::string& error) const {
  switch(setting.type) {
    case SettingType::Bool:
      if(value.is_boolean()) return value;
      if(value.is_number_integer()) return nlohmann::json(value.get<int64_t>() != 0);
      error = "expected boolean";
      return std::nullopt;
    case SettingType::Int:
      if(value.is_number_integer() &&
         value.get<int64_t>() >= std::numeric_limits<int>::min() &&
         value.get<int64_t>() <= std::numeric_limits<int>::max()) {
        return nlohmann::json(value.get<int>());
      }
      error = "expected integer";
      return std::nullopt;
    case SettingType::UInt64:
      if(value.is_number_unsigned()) return value;
      if(value.is_number_integer() && value.get<int64_t>() >= 0) {
        return nlohmann::json(static_cast<uint64_t>(value.get<int64_t>()));
      }
      error = "expected non-negative integer";
      return std::nullopt;
    case SettingType::String:
      if(value.is_string()) return value;
      error = "expected string";
      return std::nullopt;
  }
  error = "unsupported type";
  return std::nullopt;
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                             const std::string& text,
                                             std::string& error) {
  error.clear();
  const auto* setting = find(key);
  if(!setting) {
    error = "unknown setting";
    return false;
  }
  auto clean = trimmed(text);
  nlohmann::json parsed;
  switch(setting->type) {
    case SettingType::Bool: {
      if(!is_bool_literal(clean)) {
        error = "expected boolean (true|false|on|off)";
        return false;
      }
      auto v = lowered(clean);
      parsed = (v == "true" || v == "on" || v == "1" || v == "yes");
      break;
    }
    case SettingType::Int:
    case SettingType::UInt64: {
      const bool is_unsigned = setting->type == SettingType::UInt64;
      if(clean.empty() || (is_unsigned && clean[0] == '-')) {
        error = is_unsigned ? "expected non-negative integer" : "expected integer";
        return false;
      }
      try {
        std::size_t consumed = 0;
        if(is_unsigned) {
          parsed = static_cast<uint64_t>(std::stoull(clean, &consumed));
        } else {
          parsed = static_cast<int64_t>(std::stoll(clean, &consumed));
        }
        if(consumed != clean.size()) {
          error = "trailing characters in '" + clean + "'";
          return false;
        }
      } catch(const std::exception& e) {
        error = e.what();
        return false;
      }
      break;
    }
    case SettingType::String:
      parsed = clean;
      break;
  }
  auto value = coerce(*setting, parsed, error);
  if(!value) return false;
  values_[setting->key] = *value;
  return true;
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!path_override_.empty()) return path_override_;
  return std::filesystem::current_path() / ".config" / "settings.json";
}

inline bool SettingsManager::load() {
  auto path = settings_path();
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
    const auto* setting = find(item.key());
    if(!setting) continue;
    std::string error;
    if(auto value = coerce(*setting, item.value(), error)) {
      values_[setting->key] = *value;
    } else {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
  return true;
}

inline bool SettingsManager::save() const {
  auto path = settings_path();
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& setting : settings_) {
    if(setting.persistent) doc[setting.key] = values_.at(setting.key);
  }
  out << doc.dump(2);
  return static_cast<bool>(out);
}
