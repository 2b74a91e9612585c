#include "noter/cli/command_error_handler.hpp"

namespace noter::cli {

int CommandErrorHandler::handleCommandError(const util::ContextualError& error) {
  auto& handler = util::ErrorHandler::instance();

  // Log the error for debugging
  handler.report(error);

  // JSON consumers read stdout only
  std::string formatted_error = handler.formatUserError(error, options_.json);
  if (options_.json) {
    std::cout << formatted_error << std::endl;
  } else {
    std::cerr << formatted_error << std::endl;
  }

  switch (error.severity()) {
    case util::ErrorSeverity::kInfo:
    case util::ErrorSeverity::kWarning:
    case util::ErrorSeverity::kError:
      return 1;
    case util::ErrorSeverity::kCritical:
      return 2;
  }

  return 1;
}

int CommandErrorHandler::handleError(const Error& error, const std::string& operation,
                                     const std::string& file) {
  return handleCommandError(toContextualError(error, operation, file));
}

util::ContextualError CommandErrorHandler::toContextualError(const Error& error,
                                                             const std::string& operation,
                                                             const std::string& file) const {
  util::ErrorContext context;
  if (!operation.empty()) {
    context.withOperation(operation);
  }
  if (!file.empty()) {
    context.withFile(file);
  }
  return util::ContextualError(error.code(), error.message(), context, util::severityFor(error.code()));
}

} // namespace noter::cli
