#pragma once

#include <string>

#include "noter/cli/application.hpp"
#include "noter/common.hpp"

namespace noter::cli {

/**
 * @brief Configuration management command
 *
 * Supports subcommands:
 * - get: Print one value
 * - set: Change one value and save the user config file
 * - list: Print every key
 * - path: Print the user config file location
 */
class ConfigCommand : public Command {
public:
  explicit ConfigCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "config"; }
  std::string description() const override { return "Show or change configuration"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  enum class SubCommand {
    Get,
    Set,
    List,
    Path
  };

  SubCommand sub_command_ = SubCommand::List;

  std::string key_;
  std::string value_;

  Result<int> executeGet(const GlobalOptions& options);
  Result<int> executeSet(const GlobalOptions& options);
  Result<int> executeList(const GlobalOptions& options);
  Result<int> executePath(const GlobalOptions& options);
};

} // namespace noter::cli
