#pragma once

#include <string>

#include <CLI/CLI.hpp>
#include "noter/cli/application.hpp"

namespace noter::cli {

/**
 * @brief Mark a directory as the notes root
 * Usage: noter init [dir]
 */
class InitCommand : public Command {
public:
  explicit InitCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "init"; }
  std::string description() const override {
    return "Mark a directory as the notes root by writing .noter.toml";
  }

  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  std::string directory_ = ".";
};

} // namespace noter::cli
