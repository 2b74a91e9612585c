#include "noter/util/error_handler.hpp"

#include <algorithm>
#include <filesystem>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "noter/util/xdg.hpp"

namespace noter::util {

namespace {

constexpr size_t kMaxLogFileBytes = 1024 * 1024 * 5;
constexpr size_t kMaxLogFiles = 3;

void logContextualError(const ContextualError& error) {
  std::string message = ErrorHandler::instance().formatLogError(error);

  switch (error.severity()) {
    case ErrorSeverity::kInfo:
      spdlog::info(message);
      break;
    case ErrorSeverity::kWarning:
      // User mistakes are not failures of the tool itself
      spdlog::info(message);
      break;
    case ErrorSeverity::kError:
      spdlog::error(message);
      break;
    case ErrorSeverity::kCritical:
      spdlog::critical(message);
      break;
  }
}

}  // namespace

void setupLogging(const LoggingOptions& options) {
  auto console_level = spdlog::level::from_str(options.console_level);
  auto file_level = spdlog::level::from_str(options.file_level);

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_sink->set_level(console_level);
  console_sink->set_pattern("[%^%l%$] %v");

  std::vector<spdlog::sink_ptr> sinks = {console_sink};
  std::string file_sink_failure;
  auto logger_level = console_level;

  if (options.file_sink && file_level != spdlog::level::off) {
    try {
      auto log_dir = Xdg::logDir();
      std::filesystem::create_directories(log_dir);

      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          (log_dir / "noter.log").string(), kMaxLogFileBytes, kMaxLogFiles);
      file_sink->set_level(file_level);
      file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
      sinks.push_back(file_sink);
      logger_level = std::min(console_level, file_level);
    } catch (const std::exception& e) {
      // Console-only logging if the log directory is unusable
      file_sink_failure = e.what();
    }
  }

  auto logger = std::make_shared<spdlog::logger>("noter", sinks.begin(), sinks.end());
  logger->set_level(logger_level);
  spdlog::set_default_logger(logger);

  if (!file_sink_failure.empty()) {
    spdlog::warn("Failed to setup file logging: {}", file_sink_failure);
  }

  ErrorHandler::instance().setErrorLogger(logContextualError);
}

} // namespace noter::util
