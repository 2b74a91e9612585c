#include "noter/common.hpp"

#include <sstream>

namespace noter {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kAlreadyExists:
      return "Already exists";
    case ErrorCode::kCourseNotFound:
      return "Course not found";
    case ErrorCode::kAmbiguousCourse:
      return "Ambiguous course";
    case ErrorCode::kIoError:
      return "I/O error";
    case ErrorCode::kFilePermissionDenied:
      return "Permission denied";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kParseError:
      return "Parse error";
    case ErrorCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
}

ErrorCode errorCodeFromSystem(const std::error_code& ec) {
  if (ec == std::errc::file_exists) {
    return ErrorCode::kAlreadyExists;
  }
  if (ec == std::errc::permission_denied ||
      ec == std::errc::operation_not_permitted ||
      ec == std::errc::read_only_file_system) {
    return ErrorCode::kFilePermissionDenied;
  }
  return ErrorCode::kIoError;
}

std::string Version::toString() const {
  std::ostringstream oss;
  oss << major << "." << minor << "." << patch;
  if (!build.empty()) {
    oss << "+" << build;
  }
  return oss.str();
}

Version getVersion() {
#ifdef NOTER_VERSION_BUILD
  return Version{NOTER_VERSION_MAJOR, NOTER_VERSION_MINOR, NOTER_VERSION_PATCH,
                 NOTER_VERSION_BUILD};
#else
  return Version{0, 2, 0, ""};
#endif
}

}  // namespace noter
