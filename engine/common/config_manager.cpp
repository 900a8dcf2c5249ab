#include "config_manager.hpp"
#include <spdlog/spdlog.h>
#include <fstream>

namespace voxguard {
namespace engine {
namespace common {

ConfigManager::ConfigManager() {
}

bool ConfigManager::LoadFromFile(const std::string& config_path) {
  try {
    std::ifstream file(config_path);
    if (!file.is_open()) {
      SPDLOG_WARN("Failed to open config file: {}", config_path);
      return false;
    }

    nlohmann::json root;
    file >> root;
    return SetRoot(std::move(root), config_path);
  } catch (const std::exception& e) {
    SPDLOG_WARN("Failed to load config from {}: {}", config_path, e.what());
    return false;
  }
}

bool ConfigManager::LoadFromString(const std::string& json_text) {
  try {
    return SetRoot(nlohmann::json::parse(json_text), "<string>");
  } catch (const std::exception& e) {
    SPDLOG_WARN("Failed to parse config: {}", e.what());
    return false;
  }
}

bool ConfigManager::SetRoot(nlohmann::json root, const std::string& source) {
  if (!root.is_object()) {
    SPDLOG_WARN("Config from {} loaded but root is not an object", source);
    return false;
  }
  config_root_ = std::move(root);
  SPDLOG_INFO("Loaded config from: {} (has {} top-level keys)", source, config_root_.size());
  std::string keys;
  for (auto it = config_root_.begin(); it != config_root_.end(); ++it) {
    if (!keys.empty()) keys += ", ";
    keys += it.key();
  }
  SPDLOG_TRACE("Config top-level keys: {}", keys);
  return true;
}

int ConfigManager::ApplyEnvironment(const std::vector<EnvBinding>& bindings) {
  int applied = 0;
  for (const auto& binding : bindings) {
    const char* env = std::getenv(binding.env_var.c_str());
    if (env == nullptr || *env == '\0') {
      continue;
    }
    std::string value(env);
    if (binding.offset != 0) {
      try {
        value = std::to_string(std::stoi(value) + binding.offset);
      } catch (const std::exception& e) {
        SPDLOG_WARN("Ignoring {}='{}': not an integer ({})", binding.env_var, value, e.what());
        continue;
      }
    }
    overrides_[binding.key] = value;
    applied++;
    SPDLOG_DEBUG("Config override {} <- ${}", binding.key, binding.env_var);
  }
  return applied;
}

std::vector<EnvBinding> ConfigManager::DefaultEnvBindings() {
  return {
    {"VOXGUARD_API_KEY", "api.key", 0},
    {"VOXGUARD_API_URL", "api.url", 0},
    {"CONCURRENT_REQUESTS", "resilience.concurrency", 0},
    {"MAX_RETRIES", "resilience.max_attempts", 1},
    {"LOG_LEVEL", "app.log.level", 0},
  };
}

void ConfigManager::PrintAllConfig() const {
  SPDLOG_INFO("Printing all config");
  nlohmann::json printable = config_root_;
  // Never log credentials
  if (printable.contains("api") && printable["api"].is_object() && printable["api"].contains("key")) {
    printable["api"]["key"] = "***";
  }
  SPDLOG_INFO("\n{}", printable.dump(2));
}

std::string ConfigManager::GetConfigDir() {
  const char* env = std::getenv("VOXGUARD_CONFIG_DIR");
  return env ? std::string(env) : "config";
}

bool ConfigManager::Has(const std::string& key) const {
  return overrides_.count(key) > 0 || !GetNode(key).is_null();
}

std::string ConfigManager::GetString(const std::string& key, const std::string& default_value) const {
  // Check overrides first
  auto it = overrides_.find(key);
  if (it != overrides_.end()) {
    SPDLOG_TRACE("GetString('{}'): found in overrides", key);
    return it->second;
  }

  nlohmann::json node = GetNode(key);
  if (node.is_string()) {
    SPDLOG_TRACE("GetString('{}'): found in config", key);
    return node.get<std::string>();
  }

  SPDLOG_TRACE("GetString('{}'): not found, using default", key);
  return default_value;
}

int ConfigManager::GetInt(const std::string& key, int default_value) const {
  auto it = overrides_.find(key);
  if (it != overrides_.end()) {
    try {
      int value = std::stoi(it->second);
      SPDLOG_TRACE("GetInt('{}'): found in overrides: {}", key, value);
      return value;
    } catch (const std::exception& e) {
      SPDLOG_WARN("GetInt('{}'): override '{}' is not an integer, using default {}", key, it->second, default_value);
      return default_value;
    }
  }

  nlohmann::json node = GetNode(key);
  if (node.is_null() || !node.is_number()) {
    SPDLOG_TRACE("GetInt('{}'): node not a number, using default {}", key, default_value);
    return default_value;
  }

  int value = node.get<int>();
  SPDLOG_TRACE("GetInt('{}'): found value {}", key, value);
  return value;
}

double ConfigManager::GetDouble(const std::string& key, double default_value) const {
  auto it = overrides_.find(key);
  if (it != overrides_.end()) {
    try {
      return std::stod(it->second);
    } catch (const std::exception& e) {
      SPDLOG_WARN("GetDouble('{}'): override '{}' is not a number, using default {}", key, it->second, default_value);
      return default_value;
    }
  }

  nlohmann::json node = GetNode(key);
  if (node.is_null() || !node.is_number()) {
    return default_value;
  }
  return node.get<double>();
}

bool ConfigManager::GetBool(const std::string& key, bool default_value) const {
  auto it = overrides_.find(key);
  if (it != overrides_.end()) {
    const std::string& val = it->second;
    if (val == "true" || val == "1" || val == "yes") return true;
    if (val == "false" || val == "0" || val == "no") return false;
    return default_value;
  }

  nlohmann::json node = GetNode(key);
  if (node.is_null() || !node.is_boolean()) {
    return default_value;
  }
  return node.get<bool>();
}

nlohmann::json ConfigManager::GetNodeValue(const std::string& key) const {
  return GetNode(key);
}

std::vector<std::string> ConfigManager::GetStringArray(const std::string& key) const {
  std::vector<std::string> result;
  nlohmann::json node = GetNode(key);
  if (!node.is_array()) {
    SPDLOG_DEBUG("GetStringArray('{}'): node is not an array", key);
    return result;
  }
  for (const auto& item : node) {
    // Skip non-string items
    if (item.is_string()) {
      result.push_back(item.get<std::string>());
    }
  }
  return result;
}

void ConfigManager::SetString(const std::string& key, const std::string& value) {
  overrides_[key] = value;
}

void ConfigManager::SetInt(const std::string& key, int value) {
  overrides_[key] = std::to_string(value);
}

void ConfigManager::SetDouble(const std::string& key, double value) {
  overrides_[key] = std::to_string(value);
}

void ConfigManager::SetBool(const std::string& key, bool value) {
  overrides_[key] = value ? "true" : "false";
}

nlohmann::json ConfigManager::GetNode(const std::string& key) const {
  // Support dot notation: "resilience.max_attempts"
  std::vector<std::string> parts;
  std::string current;
  for (char c : key) {
    if (c == '.') {
      if (!current.empty()) {
        parts.push_back(current);
        current.clear();
      }
    } else {
      current += c;
    }
  }
  if (!current.empty()) {
    parts.push_back(current);
  }

  const nlohmann::json* node = &config_root_;
  if (node->is_null()) {
    return nlohmann::json();  // Config not loaded
  }

  for (const auto& part : parts) {
    if (!node->is_object()) {
      SPDLOG_DEBUG("GetNode('{}'): node is not an object at part '{}'", key, part);
      return nlohmann::json();
    }
    auto it = node->find(part);
    if (it == node->end()) {
      SPDLOG_DEBUG("GetNode('{}'): key '{}' not found", key, part);
      return nlohmann::json();
    }
    node = &(*it);
  }

  return *node;
}

}  // namespace common
}  // namespace engine
}  // namespace voxguard
