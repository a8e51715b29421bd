#pragma once
#include <string>
#include <unordered_map>
#include <optional>
#include <shared_mutex>
#include <vector>

// Key/value settings from a .env file, falling back to the process environment.
class ConfigManager {
public:
  static void Initialize(const std::string& env_path = ".env");
  static std::optional<std::string> Get(const std::string& key);
  static std::string GetOrThrow(const std::string& key);
  static int GetIntOr(const std::string& key, int default_value);
  static double GetDoubleOr(const std::string& key, double default_value);
  static bool GetBoolOr(const std::string& key, bool default_value);
  // Comma-separated list; empty items are dropped and whitespace trimmed.
  static std::vector<std::string> GetCsv(const std::string& key);
  static void Set(const std::string& key, const std::string& value);
  static void Clear();
private:
  static std::unordered_map<std::string, std::string> cache_;
  static std::shared_mutex mutex_;
  static void LoadEnvFile(const std::string& env_path);
};
