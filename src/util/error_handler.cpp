#include "noter/util/error_handler.hpp"

#include <sstream>
#include <nlohmann/json.hpp>

#include "noter/util/time.hpp"

namespace noter::util {

std::string ContextualError::fullDescription() const {
  std::ostringstream oss;
  oss << errorCodeToString(code_) << ": " << message_;

  if (context_) {
    if (!context_->operation.empty()) {
      oss << " (during " << context_->operation << ")";
    }
    if (!context_->file_path.empty()) {
      oss << " [file: " << context_->file_path << "]";
    }
  }

  return oss.str();
}

ErrorSeverity severityFor(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return ErrorSeverity::kInfo;
    case ErrorCode::kInvalidArgument:
    case ErrorCode::kAlreadyExists:
    case ErrorCode::kCourseNotFound:
    case ErrorCode::kAmbiguousCourse:
      return ErrorSeverity::kWarning;
    case ErrorCode::kFilePermissionDenied:
      return ErrorSeverity::kCritical;
    case ErrorCode::kIoError:
    case ErrorCode::kConfigError:
    case ErrorCode::kParseError:
    case ErrorCode::kUnknownError:
      return ErrorSeverity::kError;
  }
  return ErrorSeverity::kError;
}

ErrorHandler& ErrorHandler::instance() {
  static ErrorHandler instance_;
  return instance_;
}

void ErrorHandler::report(const ContextualError& error) const {
  if (error_logger_) {
    error_logger_(error);
  }
}

void ErrorHandler::setErrorLogger(std::function<void(const ContextualError&)> logger) {
  error_logger_ = std::move(logger);
}

std::string ErrorHandler::formatUserError(const ContextualError& error, bool json_format) const {
  if (json_format) {
    nlohmann::json error_json;
    error_json["error"] = true;
    error_json["code"] = static_cast<int>(error.code());
    error_json["kind"] = std::string(errorCodeToString(error.code()));
    error_json["message"] = error.message();

    if (error.context()) {
      const auto& ctx = *error.context();
      if (!ctx.file_path.empty()) {
        error_json["file"] = ctx.file_path;
      }
      if (!ctx.operation.empty()) {
        error_json["operation"] = ctx.operation;
      }
    }

    return error_json.dump();
  }

  return "Error: " + error.message();
}

std::string ErrorHandler::formatLogError(const ContextualError& error) const {
  std::ostringstream oss;
  if (error.context()) {
    oss << "[" << Time::toRfc3339(error.context()->timestamp) << "] ";
  }
  oss << error.fullDescription();
  return oss.str();
}

} // namespace noter::util
