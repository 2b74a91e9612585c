#include "noter/config/config.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>

#include <toml++/toml.hpp>

#include "noter/util/filesystem.hpp"
#include "noter/util/xdg.hpp"

namespace noter::config {

namespace {

constexpr std::array<std::string_view, 7> kLogLevels = {
  "trace", "debug", "info", "warn", "error", "critical", "off"
};

constexpr int kMaxUntitledStart = 1000000;

std::filesystem::path expandPath(const std::string& value, const std::filesystem::path& base) {
  std::filesystem::path path = value;
  auto home = noter::util::Xdg::getEnvVar("HOME", "");
  if (!home.empty() && value == "~") {
    path = home;
  } else if (!home.empty() && value.starts_with("~/")) {
    path = std::filesystem::path(home) / value.substr(2);
  }
  if (path.is_relative() && !base.empty()) {
    path = base / path;
  }
  return path.lexically_normal();
}

std::string boolToString(bool value) {
  return value ? "true" : "false";
}

}  // namespace

Result<void> Config::load(const std::filesystem::path& config_path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(config_path, ec)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config file not found: " + config_path.string()));
  }

  try {
    auto config_data = toml::parse_file(config_path.string());
    // Applied to a copy so a bad file leaves this config untouched
    Config loaded = *this;

    if (auto value = config_data["notes_root"].value<std::string>()) {
      loaded.notes_root = expandPath(*value, config_path.parent_path());
    }

    // Logging
    if (auto value = config_data["log_level"].value<std::string>()) {
      loaded.log_level = *value;
    }
    if (auto value = config_data["log_to_file"].value<bool>()) {
      loaded.log_to_file = *value;
    }

    // Note settings
    if (auto notes_table = config_data["notes"].as_table()) {
      if (auto value = (*notes_table)["extension"].value<std::string>()) {
        loaded.notes.extension = *value;
      }
      if (auto value = (*notes_table)["untitled_prefix"].value<std::string>()) {
        loaded.notes.untitled_prefix = *value;
      }
      if (auto value = (*notes_table)["untitled_start"].value<int64_t>()) {
        if (*value < 0 || *value > kMaxUntitledStart) {
          return std::unexpected(makeError(ErrorCode::kConfigError,
                                           "notes.untitled_start out of range in " + config_path.string()));
        }
        loaded.notes.untitled_start = static_cast<int>(*value);
      }
      if (auto value = (*notes_table)["front_matter"].value<bool>()) {
        loaded.notes.front_matter = *value;
      }
      if (auto value = (*notes_table)["date_prefix"].value<bool>()) {
        loaded.notes.date_prefix = *value;
      }
    }

    auto validation = loaded.validate();
    if (!validation.has_value()) {
      return validation;
    }

    loaded.config_path_ = config_path;
    *this = std::move(loaded);
    return {};

  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "TOML parse error in " + config_path.string() + ": " +
                                     std::string(e.description())));
  }
}

Result<void> Config::save(const std::filesystem::path& config_path) const {
  std::filesystem::path save_path = config_path.empty() ? config_path_ : config_path;

  if (save_path.empty()) {
    save_path = defaultConfigPath();
  }

  try {
    toml::table config_data;

    if (!notes_root.empty()) config_data.insert_or_assign("notes_root", notes_root.string());
    config_data.insert_or_assign("log_level", log_level);
    config_data.insert_or_assign("log_to_file", log_to_file);

    auto notes_table = toml::table{};
    notes_table.insert_or_assign("extension", notes.extension);
    notes_table.insert_or_assign("untitled_prefix", notes.untitled_prefix);
    notes_table.insert_or_assign("untitled_start", static_cast<int64_t>(notes.untitled_start));
    notes_table.insert_or_assign("front_matter", notes.front_matter);
    notes_table.insert_or_assign("date_prefix", notes.date_prefix);
    config_data.insert_or_assign("notes", notes_table);

    std::stringstream ss;
    ss << config_data << "\n";
    auto write_result = noter::util::FileSystem::writeFileAtomic(save_path, ss.str());
    if (!write_result.has_value()) {
      return std::unexpected(makeError(ErrorCode::kConfigError,
                                       "Cannot write config file: " + write_result.error().message()));
    }

    return {};

  } catch (const std::exception& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config save error: " + std::string(e.what())));
  }
}

Result<std::string> Config::get(const std::string& key) const {
  for (const auto& [name, value] : entries()) {
    if (name == key) {
      return value;
    }
  }
  return std::unexpected(makeError(ErrorCode::kConfigError, "Unknown config key: " + key));
}

Result<void> Config::set(const std::string& key, const std::string& value) {
  Config updated = *this;

  if (key == "notes_root") {
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    updated.notes_root = value.empty() ? std::filesystem::path{} : expandPath(value, cwd);
  } else if (key == "log_level") {
    updated.log_level = value;
  } else if (key == "log_to_file") {
    auto parsed = parseBool(key, value);
    if (!parsed.has_value()) return std::unexpected(parsed.error());
    updated.log_to_file = *parsed;
  } else if (key == "notes.extension") {
    updated.notes.extension = value;
  } else if (key == "notes.untitled_prefix") {
    updated.notes.untitled_prefix = value;
  } else if (key == "notes.untitled_start") {
    auto parsed = parseInt(key, value);
    if (!parsed.has_value()) return std::unexpected(parsed.error());
    updated.notes.untitled_start = *parsed;
  } else if (key == "notes.front_matter") {
    auto parsed = parseBool(key, value);
    if (!parsed.has_value()) return std::unexpected(parsed.error());
    updated.notes.front_matter = *parsed;
  } else if (key == "notes.date_prefix") {
    auto parsed = parseBool(key, value);
    if (!parsed.has_value()) return std::unexpected(parsed.error());
    updated.notes.date_prefix = *parsed;
  } else {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Unknown config key: " + key));
  }

  auto validation = updated.validate();
  if (!validation.has_value()) {
    return validation;
  }

  *this = std::move(updated);
  return {};
}

std::vector<std::pair<std::string, std::string>> Config::entries() const {
  return {
    {"notes_root", notes_root.string()},
    {"log_level", log_level},
    {"log_to_file", boolToString(log_to_file)},
    {"notes.extension", notes.extension},
    {"notes.untitled_prefix", notes.untitled_prefix},
    {"notes.untitled_start", std::to_string(notes.untitled_start)},
    {"notes.front_matter", boolToString(notes.front_matter)},
    {"notes.date_prefix", boolToString(notes.date_prefix)},
  };
}

Result<void> Config::validate() const {
  if (std::find(kLogLevels.begin(), kLogLevels.end(), log_level) == kLogLevels.end()) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Invalid log_level: " + log_level));
  }

  auto is_alnum = [](unsigned char c) { return std::isalnum(c) != 0; };
  if (notes.extension.empty() || notes.extension.size() > 16 ||
      !std::all_of(notes.extension.begin(), notes.extension.end(), is_alnum)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Invalid notes.extension: '" + notes.extension + "'"));
  }

  // The prefix must already be in slug form so untitled names never need escaping
  auto is_prefix_char = [](unsigned char c) {
    return (std::islower(c) != 0) || (std::isdigit(c) != 0) || c == '-' || c == '_';
  };
  if (notes.untitled_prefix.empty() || notes.untitled_prefix.size() > 32 ||
      notes.untitled_prefix.front() == '-' || notes.untitled_prefix.back() == '-' ||
      !std::all_of(notes.untitled_prefix.begin(), notes.untitled_prefix.end(), is_prefix_char)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Invalid notes.untitled_prefix: '" + notes.untitled_prefix + "'"));
  }

  if (notes.untitled_start < 0 || notes.untitled_start > kMaxUntitledStart) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "notes.untitled_start must be between 0 and " +
                                     std::to_string(kMaxUntitledStart)));
  }

  return {};
}

std::filesystem::path Config::defaultConfigPath() {
  return noter::util::Xdg::configFile();
}

Result<bool> Config::parseBool(const std::string& key, const std::string& value) {
  if (value == "true" || value == "yes" || value == "1") return true;
  if (value == "false" || value == "no" || value == "0") return false;
  return std::unexpected(makeError(ErrorCode::kConfigError,
                                   "Expected a boolean for " + key + ", got '" + value + "'"));
}

Result<int> Config::parseInt(const std::string& key, const std::string& value) {
  try {
    size_t consumed = 0;
    int parsed = std::stoi(value, &consumed);
    if (consumed == value.size()) {
      return parsed;
    }
  } catch (const std::logic_error&) {
    // Falls through to the error below
  }
  return std::unexpected(makeError(ErrorCode::kConfigError,
                                   "Expected an integer for " + key + ", got '" + value + "'"));
}

}  // namespace noter::config
