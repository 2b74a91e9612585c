#pragma once

#include <string>

#include <CLI/CLI.hpp>
#include "noter/cli/application.hpp"

namespace noter::cli {

/**
 * @brief Create the folder for a course
 * Usage: noter course <code> <title>
 */
class CourseCommand : public Command {
public:
  explicit CourseCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "course"; }
  std::string description() const override {
    return "Create a folder for a course\n\n"
           "EXAMPLES:\n"
           "  noter course EAS103 \"Premodern East Asia\"   # -> EAS103-premodern-east-asia/\n"
           "  noter course CSC263 \"Data Structures\" -v    # Also print the full path";
  }

  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  // Command options
  std::string code_;
  std::string title_;
};

} // namespace noter::cli
