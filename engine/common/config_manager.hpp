#pragma once

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <string>
#include <unordered_map>
#include <vector>

namespace voxguard {
namespace engine {
namespace common {

// Environment variable bound to a config key. `offset` is added to integer
// values (MAX_RETRIES counts retries, the config key counts attempts).
struct EnvBinding {
  std::string env_var;
  std::string key;
  int offset = 0;
};

// Unified configuration manager
class ConfigManager {
 public:
  ConfigManager();
  ~ConfigManager() = default;

  // Load configuration from JSON file
  bool LoadFromFile(const std::string& config_path);

  // Load configuration from a JSON document held in memory
  bool LoadFromString(const std::string& json_text);

  // Copy set environment variables into the overrides. Returns the number applied.
  int ApplyEnvironment(const std::vector<EnvBinding>& bindings);

  // Bindings shared by the VoxGuard applications
  static std::vector<EnvBinding> DefaultEnvBindings();

  // Print all config
  void PrintAllConfig() const;

  // Get config directory
  static std::string GetConfigDir();

  // True if the key is overridden or present in the loaded document
  bool Has(const std::string& key) const;

  // Get string value
  std::string GetString(const std::string& key, const std::string& default_value = "") const;

  // Get int value
  int GetInt(const std::string& key, int default_value = 0) const;

  // Get double value
  double GetDouble(const std::string& key, double default_value = 0.0) const;

  // Get bool value
  bool GetBool(const std::string& key, bool default_value = false) const;

  // Get any node (object, array, string, number, etc.)
  nlohmann::json GetNodeValue(const std::string& key) const;

  // Get string array
  std::vector<std::string> GetStringArray(const std::string& key) const;

  // Set value (for command-line and environment overrides)
  void SetString(const std::string& key, const std::string& value);
  void SetInt(const std::string& key, int value);
  void SetDouble(const std::string& key, double value);
  void SetBool(const std::string& key, bool value);

 private:
  nlohmann::json config_root_;
  std::unordered_map<std::string, std::string> overrides_;

  bool SetRoot(nlohmann::json root, const std::string& source);
  nlohmann::json GetNode(const std::string& key) const;
};

}  // namespace common
}  // namespace engine
}  // namespace voxguard
