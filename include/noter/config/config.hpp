#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "noter/common.hpp"

namespace noter::config {

// Configuration for noter
//
// The same keys are read from the user file ($XDG_CONFIG_HOME/noter/config.toml)
// and from a collection's root marker (.noter.toml); later loads only
// override the keys they contain.
class Config {
 public:
  // Built-in defaults, no file access
  Config() = default;

  // Notes root; empty means "discover"
  std::filesystem::path notes_root;

  // Logging
  std::string log_level = "info";
  bool log_to_file = true;

  // Note file naming and content
  struct NoteSettings {
    std::string extension = "md";
    std::string untitled_prefix = "untitled";
    int untitled_start = 1;
    bool front_matter = true;   // YAML front matter at the top of new notes
    bool date_prefix = false;   // Prefix file names with the creation date
  };
  NoteSettings notes;

  // Load configuration from file, overriding the keys it defines
  Result<void> load(const std::filesystem::path& config_path);

  // Save configuration to file
  Result<void> save(const std::filesystem::path& config_path = {}) const;

  // Get/set configuration values using dot notation
  Result<std::string> get(const std::string& key) const;
  Result<void> set(const std::string& key, const std::string& value);

  // All keys with their current values, in file order
  std::vector<std::pair<std::string, std::string>> entries() const;

  // Validate configuration
  Result<void> validate() const;

  // Path of the last file loaded, empty if none
  const std::filesystem::path& configPath() const { return config_path_; }

  // Get default configuration file path
  static std::filesystem::path defaultConfigPath();

 private:
  std::filesystem::path config_path_;

  static Result<bool> parseBool(const std::string& key, const std::string& value);
  static Result<int> parseInt(const std::string& key, const std::string& value);
};

}  // namespace noter::config
