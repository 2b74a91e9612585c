#include "noter/cli/application.hpp"

#include <iostream>
#include <filesystem>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "noter/cli/command_error_handler.hpp"
#include "noter/util/error_handler.hpp"
#include "noter/util/xdg.hpp"

// Command includes
#include "noter/cli/commands/course_command.hpp"
#include "noter/cli/commands/new_command.hpp"
#include "noter/cli/commands/init_command.hpp"
#include "noter/cli/commands/config_command.hpp"

namespace noter::cli {

Application::Application()
    : app_("noter", "Organize course notes into folders")
    , config_injected_(false)
    , services_initialized_(false) {

  app_.set_version_flag("--version", noter::getVersion().toString());
  app_.require_subcommand(1);

  setupGlobalOptions();
  setupCommands();
  setupHelp();
}

Application::Application(config::Config config)
    : app_("noter", "Organize course notes into folders")
    , config_(std::move(config))
    , config_injected_(true)
    , services_initialized_(false) {

  app_.set_version_flag("--version", noter::getVersion().toString());
  app_.require_subcommand(1);

  setupGlobalOptions();
  setupCommands();
  setupHelp();
}

int Application::run(int argc, char* argv[]) {
  try {
    app_.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app_.exit(e);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  // The command has already been executed by CLI11's callback system
  return 0;
}

void Application::setupGlobalOptions() {
  app_.add_flag("--json", global_options_.json, "Output in JSON format");
  app_.add_flag("-v,--verbose", global_options_.verbose, "Verbose output (-vv for trace logging)");
  app_.add_flag("-q,--quiet", global_options_.quiet, "Suppress normal output");
  app_.add_option("--config", global_options_.config_file, "Path to config file");
  app_.add_option("--root", global_options_.notes_root, "Notes root (overrides $NOTER_ROOT and config)");
}

void Application::setupCommands() {
  registerCommand(std::make_unique<CourseCommand>(*this));
  registerCommand(std::make_unique<NewCommand>(*this));
  registerCommand(std::make_unique<InitCommand>(*this));
  registerCommand(std::make_unique<ConfigCommand>(*this));
}

void Application::setupHelp() {
  app_.get_formatter()->column_width(40);

  app_.footer(R"(Examples:
  noter init                                # Mark the current directory as the notes root
  noter course EAS103 "Premodern East Asia" # -> EAS103-premodern-east-asia/
  noter new CSC263 "Binomial Heaps"         # -> CSC263-*/binomial-heaps.md
  noter new EAS330                          # -> EAS330-*/untitled-1.md

The notes root is taken from --root, $NOTER_ROOT, notes_root in the config
file, the nearest parent directory holding .noter.toml, or the current
directory, in that order.)");
}

void Application::registerCommand(std::unique_ptr<Command> command) {
  auto* cmd_ptr = command.get();

  // Create CLI11 subcommand
  auto* sub = app_.add_subcommand(cmd_ptr->name(), cmd_ptr->description());

  // Let the command setup its specific options
  cmd_ptr->setupCommand(sub);

  // Set callback to execute the command
  sub->callback([this, cmd_ptr]() {
    CommandErrorHandler error_handler(global_options_);

    auto init_result = initializeServices();
    if (!init_result.has_value()) {
      throw CLI::RuntimeError(error_handler.handleError(init_result.error(), "load config",
                                                        configFilePath().string()));
    }

    auto result = cmd_ptr->execute(global_options_);
    if (!result.has_value()) {
      throw CLI::RuntimeError(error_handler.handleError(result.error(), cmd_ptr->name()));
    }
    if (*result != 0) {
      throw CLI::RuntimeError(*result);
    }
  });

  // Store the command
  commands_.push_back(std::move(command));
}

Result<void> Application::initializeServices() {
  if (services_initialized_) {
    return {};
  }

  if (!config_injected_) {
    config::Config config;
    auto path = configFilePath();

    // A missing file means defaults; `config set` creates it
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
      auto loaded = config.load(path);
      if (!loaded.has_value()) {
        return std::unexpected(loaded.error());
      }
    }
    config_ = std::move(config);
  }

  setupLoggingFromOptions();
  spdlog::debug("noter {} starting", noter::getVersion().toString());

  services_initialized_ = true;
  return {};
}

void Application::setupLoggingFromOptions() {
  util::LoggingOptions logging;
  logging.file_level = config_->log_level;
  logging.file_sink = config_->log_to_file;
  if (global_options_.verbose > 1) {
    logging.console_level = "trace";
  } else if (global_options_.verbose == 1) {
    logging.console_level = "debug";
  }
  util::setupLogging(logging);
}

// Getters for services (to be used by commands)
const GlobalOptions& Application::globalOptions() const {
  return global_options_;
}

config::Config& Application::config() {
  if (!services_initialized_) {
    throw std::runtime_error("Services not initialized");
  }
  return *config_;
}

std::filesystem::path Application::configFilePath() const {
  if (!global_options_.config_file.empty()) {
    return global_options_.config_file;
  }
  return config::Config::defaultConfigPath();
}

Result<store::NotesRoot> Application::notesRoot() {
  if (notes_root_.has_value()) {
    return *notes_root_;
  }

  auto init_result = initializeServices();
  if (!init_result.has_value()) {
    return std::unexpected(init_result.error());
  }

  store::NotesRootLocator::Options options;
  options.command_line = global_options_.notes_root;
  options.environment = util::Xdg::getEnvVar(std::string(store::NotesRootLocator::kRootEnvVar), "");
  options.configured = config_->notes_root;

  std::error_code ec;
  options.start_dir = std::filesystem::current_path(ec);
  if (ec) {
    return makeErrorResult<store::NotesRoot>(ErrorCode::kIoError,
                                             "Cannot determine working directory: " + ec.message());
  }

  auto root = store::NotesRootLocator::locate(options);
  if (!root.has_value()) {
    return std::unexpected(root.error());
  }

  // Collection settings from the marker win over the user config
  if (!root->marker_file.empty()) {
    auto overlay = config_->load(root->marker_file);
    if (!overlay.has_value()) {
      return std::unexpected(overlay.error());
    }
    // The marker may change log_level or log_to_file
    setupLoggingFromOptions();
  }

  spdlog::debug("Using notes root {} ({})", root->path.string(),
                store::rootSourceToString(root->source));
  notes_root_ = *root;
  return *notes_root_;
}

Result<store::PathResolver*> Application::pathResolver() {
  if (path_resolver_) {
    return path_resolver_.get();
  }

  auto root = notesRoot();
  if (!root.has_value()) {
    return std::unexpected(root.error());
  }

  path_resolver_ = std::make_unique<store::PathResolver>(
      store::PathResolver::optionsFromConfig(*config_, root->path));
  return path_resolver_.get();
}

} // namespace noter::cli
