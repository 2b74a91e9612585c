#pragma once

#include <iostream>
#include <string>

#include "noter/cli/application.hpp"
#include "noter/util/error_handler.hpp"

namespace noter::cli {

// Command-specific error handler that formats errors for CLI output
class CommandErrorHandler {
public:
  explicit CommandErrorHandler(const GlobalOptions& options) : options_(options) {}

  // Display a contextual error and return the process exit code
  int handleCommandError(const util::ContextualError& error);

  // Display a plain error raised by the given operation, optionally on a file
  int handleError(const Error& error, const std::string& operation = "", const std::string& file = "");

  // Attach operation context and severity to a plain error
  util::ContextualError toContextualError(const Error& error, const std::string& operation = "",
                                          const std::string& file = "") const;

private:
  const GlobalOptions& options_;
};

} // namespace noter::cli
