#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "config_manager.hpp"

using namespace voxguard::engine::common;

class ConfigManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_config_path_ = std::filesystem::temp_directory_path() / "voxguard_test_config.json";

    nlohmann::json config = {
      {"app", {
        {"log", {
          {"file", "test.log"},
          {"level", "debug"}
        }},
        {"rest_port", 9090}
      }},
      {"api", {
        {"url", "http://localhost:8000"},
        {"key", "secret_key"},
        {"tls_verify", true}
      }},
      {"resilience", {
        {"rate_per_second", 2.5},
        {"max_attempts", 4},
        {"admission_mode", "wait"}
      }},
      {"batch", {
        {"inputs", {"/data/a", "/data/b", 7}}
      }},
      {"test_bool", true},
      {"test_int", 42},
      {"test_double", 3.14},
      {"test_string", "hello"}
    };

    std::ofstream file(test_config_path_);
    file << config.dump(2);
    file.close();

    for (const auto& binding : ConfigManager::DefaultEnvBindings()) {
      unsetenv(binding.env_var.c_str());
    }
  }

  void TearDown() override {
    if (std::filesystem::exists(test_config_path_)) {
      std::filesystem::remove(test_config_path_);
    }
    for (const auto& binding : ConfigManager::DefaultEnvBindings()) {
      unsetenv(binding.env_var.c_str());
    }
  }

  std::filesystem::path test_config_path_;
};

TEST_F(ConfigManagerTest, LoadFromFile_Success) {
  ConfigManager config;
  EXPECT_TRUE(config.LoadFromFile(test_config_path_.string()));
}

TEST_F(ConfigManagerTest, LoadFromFile_NonExistent) {
  ConfigManager config;
  EXPECT_FALSE(config.LoadFromFile("/nonexistent/file.json"));
}

TEST_F(ConfigManagerTest, LoadFromString_Invalid) {
  ConfigManager config;
  EXPECT_FALSE(config.LoadFromString("{not json"));
  EXPECT_FALSE(config.LoadFromString("[1, 2, 3]"));
  EXPECT_TRUE(config.LoadFromString(R"({"a": {"b": 1}})"));
  EXPECT_EQ(config.GetInt("a.b"), 1);
}

TEST_F(ConfigManagerTest, GetString_ExistingKey) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  EXPECT_EQ(config.GetString("test_string"), "hello");
  EXPECT_EQ(config.GetString("app.log.file"), "test.log");
  EXPECT_EQ(config.GetString("api.url"), "http://localhost:8000");
}

TEST_F(ConfigManagerTest, GetString_NonExistentKey) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  EXPECT_EQ(config.GetString("nonexistent"), "");
  EXPECT_EQ(config.GetString("nonexistent", "default"), "default");
  EXPECT_EQ(config.GetString("app.log.file.deeper", "default"), "default");
}

TEST_F(ConfigManagerTest, GetInt_ExistingKey) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  EXPECT_EQ(config.GetInt("test_int"), 42);
  EXPECT_EQ(config.GetInt("app.rest_port"), 9090);
  EXPECT_EQ(config.GetInt("resilience.max_attempts"), 4);
}

TEST_F(ConfigManagerTest, GetInt_NonExistentKey) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  EXPECT_EQ(config.GetInt("nonexistent"), 0);
  EXPECT_EQ(config.GetInt("nonexistent", 99), 99);
  EXPECT_EQ(config.GetInt("test_string", 5), 5);
}

TEST_F(ConfigManagerTest, GetDouble_ExistingKey) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  EXPECT_DOUBLE_EQ(config.GetDouble("test_double"), 3.14);
  EXPECT_DOUBLE_EQ(config.GetDouble("resilience.rate_per_second"), 2.5);
  EXPECT_DOUBLE_EQ(config.GetDouble("nonexistent", 9.9), 9.9);
}

TEST_F(ConfigManagerTest, GetBool) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  EXPECT_TRUE(config.GetBool("test_bool"));
  EXPECT_TRUE(config.GetBool("api.tls_verify"));
  EXPECT_FALSE(config.GetBool("nonexistent"));
  EXPECT_TRUE(config.GetBool("nonexistent", true));
}

TEST_F(ConfigManagerTest, GetStringArray_SkipsNonStrings) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  auto arr = config.GetStringArray("batch.inputs");
  ASSERT_EQ(arr.size(), 2u);
  EXPECT_EQ(arr[0], "/data/a");
  EXPECT_EQ(arr[1], "/data/b");
  EXPECT_TRUE(config.GetStringArray("test_string").empty());
}

TEST_F(ConfigManagerTest, GetNodeValue_ExistingKey) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  auto node = config.GetNodeValue("resilience");
  EXPECT_TRUE(node.is_object());
  EXPECT_TRUE(node.contains("admission_mode"));
  EXPECT_TRUE(config.GetNodeValue("nonexistent").is_null());
}

TEST_F(ConfigManagerTest, Has) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  EXPECT_TRUE(config.Has("api.key"));
  EXPECT_FALSE(config.Has("api.client_id"));
  config.SetString("api.client_id", "bank-01");
  EXPECT_TRUE(config.Has("api.client_id"));
}

TEST_F(ConfigManagerTest, Set_Overrides) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  config.SetString("test_string", "overridden");
  config.SetInt("test_int", 999);
  config.SetDouble("test_double", 99.9);
  config.SetBool("test_bool", false);

  EXPECT_EQ(config.GetString("test_string"), "overridden");
  EXPECT_EQ(config.GetInt("test_int"), 999);
  EXPECT_DOUBLE_EQ(config.GetDouble("test_double"), 99.9);
  EXPECT_FALSE(config.GetBool("test_bool"));
}

TEST_F(ConfigManagerTest, ApplyEnvironment_DefaultBindings) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  setenv("VOXGUARD_API_KEY", "env_key", 1);
  setenv("CONCURRENT_REQUESTS", "12", 1);
  setenv("MAX_RETRIES", "5", 1);
  setenv("LOG_LEVEL", "", 1);

  EXPECT_EQ(config.ApplyEnvironment(ConfigManager::DefaultEnvBindings()), 3);
  EXPECT_EQ(config.GetString("api.key"), "env_key");
  EXPECT_EQ(config.GetInt("resilience.concurrency"), 12);
  // Retries plus the first attempt
  EXPECT_EQ(config.GetInt("resilience.max_attempts"), 6);
  // Empty value leaves the file setting
  EXPECT_EQ(config.GetString("app.log.level"), "debug");
}

TEST_F(ConfigManagerTest, ApplyEnvironment_NonIntegerOffsetSkipped) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  setenv("MAX_RETRIES", "many", 1);
  EXPECT_EQ(config.ApplyEnvironment(ConfigManager::DefaultEnvBindings()), 0);
  EXPECT_EQ(config.GetInt("resilience.max_attempts"), 4);
}

TEST_F(ConfigManagerTest, GetConfigDir) {
  unsetenv("VOXGUARD_CONFIG_DIR");
  EXPECT_EQ(ConfigManager::GetConfigDir(), "config");
  setenv("VOXGUARD_CONFIG_DIR", "/etc/voxguard", 1);
  EXPECT_EQ(ConfigManager::GetConfigDir(), "/etc/voxguard");
  unsetenv("VOXGUARD_CONFIG_DIR");
}

TEST_F(ConfigManagerTest, PrintAllConfig) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromFile(test_config_path_.string()));

  // Should not throw
  config.PrintAllConfig();
}
