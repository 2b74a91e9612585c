#include "noter/cli/commands/config_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace noter::cli {

ConfigCommand::ConfigCommand(Application& app) : app_(app) {}

void ConfigCommand::setupCommand(CLI::App* cmd) {
  auto get_cmd = cmd->add_subcommand("get", "Print a configuration value");
  get_cmd->add_option("key", key_, "Key in dot notation, e.g. notes.extension")->required();
  get_cmd->callback([this]() { sub_command_ = SubCommand::Get; });

  auto set_cmd = cmd->add_subcommand("set", "Change a configuration value");
  set_cmd->add_option("key", key_, "Key in dot notation, e.g. notes.extension")->required();
  set_cmd->add_option("value", value_, "New value")->required();
  set_cmd->callback([this]() { sub_command_ = SubCommand::Set; });

  auto list_cmd = cmd->add_subcommand("list", "Print all configuration values");
  list_cmd->callback([this]() { sub_command_ = SubCommand::List; });

  auto path_cmd = cmd->add_subcommand("path", "Print the configuration file path");
  path_cmd->callback([this]() { sub_command_ = SubCommand::Path; });

  // Require exactly one subcommand
  cmd->require_subcommand(1, 1);
}

Result<int> ConfigCommand::execute(const GlobalOptions& options) {
  switch (sub_command_) {
    case SubCommand::Get:
      return executeGet(options);
    case SubCommand::Set:
      return executeSet(options);
    case SubCommand::List:
      return executeList(options);
    case SubCommand::Path:
      return executePath(options);
  }
  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Invalid subcommand"));
}

Result<int> ConfigCommand::executeGet(const GlobalOptions& options) {
  auto value = app_.config().get(key_);
  if (!value.has_value()) {
    return std::unexpected(value.error());
  }

  if (options.json) {
    nlohmann::json result;
    result["key"] = key_;
    result["value"] = *value;
    std::cout << result.dump(2) << std::endl;
  } else {
    std::cout << *value << std::endl;
  }
  return 0;
}

Result<int> ConfigCommand::executeSet(const GlobalOptions& options) {
  auto& config = app_.config();
  auto set_result = config.set(key_, value_);
  if (!set_result.has_value()) {
    return std::unexpected(set_result.error());
  }

  auto path = app_.configFilePath();
  auto save_result = config.save(path);
  if (!save_result.has_value()) {
    return std::unexpected(save_result.error());
  }
  spdlog::info("Set {} in {}", key_, path.string());

  auto stored = config.get(key_);
  if (!stored.has_value()) {
    return std::unexpected(stored.error());
  }

  if (options.json) {
    nlohmann::json result;
    result["key"] = key_;
    result["value"] = *stored;
    result["path"] = path.string();
    result["success"] = true;
    std::cout << result.dump(2) << std::endl;
  } else if (!options.quiet) {
    std::cout << "Set " << key_ << " = " << *stored << std::endl;
  }
  return 0;
}

Result<int> ConfigCommand::executeList(const GlobalOptions& options) {
  auto entries = app_.config().entries();

  if (options.json) {
    nlohmann::json result = nlohmann::json::object();
    for (const auto& [key, value] : entries) {
      result[key] = value;
    }
    std::cout << result.dump(2) << std::endl;
  } else {
    for (const auto& [key, value] : entries) {
      std::cout << key << " = " << value << std::endl;
    }
  }
  return 0;
}

Result<int> ConfigCommand::executePath(const GlobalOptions& options) {
  auto path = app_.configFilePath();

  if (options.json) {
    nlohmann::json result;
    result["path"] = path.string();
    std::cout << result.dump(2) << std::endl;
  } else {
    std::cout << path.string() << std::endl;
  }
  return 0;
}

} // namespace noter::cli
