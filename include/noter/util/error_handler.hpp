#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>

#include "noter/common.hpp"

namespace noter::util {

// Error severity levels
enum class ErrorSeverity {
  kInfo,     // Informational messages
  kWarning,  // User mistakes (bad argument, missing course)
  kError,    // Operation failed
  kCritical  // Environment refuses the operation (permissions)
};

// Error context for providing additional debugging information
struct ErrorContext {
  std::string file_path;          // File being operated on
  std::string operation;          // Operation being performed
  std::chrono::system_clock::time_point timestamp;

  ErrorContext() : timestamp(std::chrono::system_clock::now()) {}

  ErrorContext& withFile(const std::string& path) {
    file_path = path;
    return *this;
  }

  ErrorContext& withOperation(const std::string& op) {
    operation = op;
    return *this;
  }
};

// Error with context and severity
class ContextualError {
public:
  ContextualError(ErrorCode code, std::string message, ErrorSeverity severity = ErrorSeverity::kError)
    : code_(code), message_(std::move(message)), severity_(severity) {}

  ContextualError(ErrorCode code, std::string message, ErrorContext context, ErrorSeverity severity = ErrorSeverity::kError)
    : code_(code), message_(std::move(message)), context_(std::move(context)), severity_(severity) {}

  ErrorCode code() const { return code_; }
  const std::string& message() const { return message_; }
  const std::optional<ErrorContext>& context() const { return context_; }
  ErrorSeverity severity() const { return severity_; }

  // Get full error description with context
  std::string fullDescription() const;

private:
  ErrorCode code_;
  std::string message_;
  std::optional<ErrorContext> context_;
  ErrorSeverity severity_;
};

// Severity the CLI assigns to a plain error code
ErrorSeverity severityFor(ErrorCode code);

// Error handler for formatting and logging errors
class ErrorHandler {
public:
  static ErrorHandler& instance();

  // Forward an error to the registered logger, if any
  void report(const ContextualError& error) const;

  // Set error logging callback
  void setErrorLogger(std::function<void(const ContextualError&)> logger);

  // Format error for user display
  std::string formatUserError(const ContextualError& error, bool json_format = false) const;

  // Format error for internal logging
  std::string formatLogError(const ContextualError& error) const;

private:
  ErrorHandler() = default;
  std::function<void(const ContextualError&)> error_logger_;
};

// Logging setup, see error_logger.cpp
struct LoggingOptions {
  std::string console_level = "off";  // stderr sink, raised by -v / -vv
  std::string file_level = "info";    // $XDG_DATA_HOME/noter/logs/noter.log
  bool file_sink = true;
};

// Install the default "noter" logger and hook it into ErrorHandler
void setupLogging(const LoggingOptions& options);

} // namespace noter::util
