#pragma once

#include <filesystem>
#include <string>

namespace noter::util {

// XDG Base Directory Specification utilities
class Xdg {
 public:
  // Get XDG data home directory (~/.local/share/noter)
  static std::filesystem::path dataHome();

  // Get XDG config home directory (~/.config/noter)
  static std::filesystem::path configHome();

  // Get config file path
  static std::filesystem::path configFile();

  // Get log directory
  static std::filesystem::path logDir();

  // Get environment variable with default
  static std::string getEnvVar(const std::string& name, const std::string& default_value);
};

}  // namespace noter::util
