#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "noter/common.hpp"
#include "noter/config/config.hpp"
#include "noter/store/notes_root.hpp"
#include "noter/store/path_resolver.hpp"

namespace noter::cli {

/**
 * @brief Global CLI options that are available to all commands
 */
struct GlobalOptions {
  bool json = false;           // --json: Output in JSON format
  int verbose = 0;             // --verbose: Verbose output level (can be repeated: -v, -vv)
  bool quiet = false;          // --quiet: Suppress normal output
  std::string config_file;     // --config: Path to config file
  std::string notes_root;      // --root: Override notes root
};

/**
 * @brief Base class for all CLI commands
 */
class Command {
public:
  virtual ~Command() = default;

  /**
   * @brief Execute the command with the given arguments
   * @param options Global CLI options
   * @return Result with exit code (0 = success)
   */
  virtual Result<int> execute(const GlobalOptions& options) = 0;

  virtual std::string name() const = 0;

  virtual std::string description() const = 0;

  /**
   * @brief Setup command-specific CLI options (optional override)
   */
  virtual void setupCommand(CLI::App* cmd) { (void)cmd; }
};

/**
 * @brief Main CLI application
 */
class Application {
public:
  Application();

  // Use a ready-made configuration instead of reading the user config file
  explicit Application(config::Config config);

  ~Application() = default;

  /**
   * @brief Run the application with command line arguments
   * @return Exit code (0 = success)
   */
  int run(int argc, char* argv[]);

  // Service accessors for commands
  const GlobalOptions& globalOptions() const;
  config::Config& config();

  // Path of the user config file commands should write to
  std::filesystem::path configFilePath() const;

  // Notes root, located on first use
  Result<store::NotesRoot> notesRoot();

  // Path resolver bound to the notes root, created on first use
  Result<store::PathResolver*> pathResolver();

private:
  // Setup methods
  void setupGlobalOptions();
  void setupCommands();
  void setupHelp();

  // Command registration
  void registerCommand(std::unique_ptr<Command> command);

  // Initialization
  Result<void> initializeServices();
  void setupLoggingFromOptions();

  // CLI framework
  CLI::App app_;
  GlobalOptions global_options_;

  std::optional<config::Config> config_;
  bool config_injected_;
  bool services_initialized_;
  std::optional<store::NotesRoot> notes_root_;
  std::unique_ptr<store::PathResolver> path_resolver_;

  // Registered commands
  std::vector<std::unique_ptr<Command>> commands_;
};

} // namespace noter::cli
