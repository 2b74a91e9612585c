#pragma once

#include <string>

#include <CLI/CLI.hpp>
#include "noter/cli/application.hpp"

namespace noter::cli {

/**
 * @brief Create a new note inside a course folder
 * Usage: noter new <code> [title]
 */
class NewCommand : public Command {
public:
  explicit NewCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "new"; }
  std::string description() const override {
    return "Create a new note in a course folder\n\n"
           "EXAMPLES:\n"
           "  noter new CSC263 \"Binomial Heaps\"     # -> binomial-heaps.md\n"
           "  noter new EAS330                      # -> untitled-1.md, untitled-2.md, ...\n\n"
           "WORKFLOWS:\n"
           "  Open right away:  $EDITOR \"$(noter new CSC263 --print-path)\"";
  }

  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  // Command options
  std::string code_;
  std::string title_;
  bool print_path_ = false;
};

} // namespace noter::cli
