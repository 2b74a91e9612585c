#include "noter/cli/commands/init_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "noter/store/notes_root.hpp"

namespace noter::cli {

InitCommand::InitCommand(Application& app) : app_(app) {
}

void InitCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("dir", directory_, "Directory to mark (default: current directory)");
}

Result<int> InitCommand::execute(const GlobalOptions& options) {
  auto marker = store::NotesRootLocator::initialize(directory_);
  if (!marker.has_value()) {
    return std::unexpected(marker.error());
  }

  auto root = marker->parent_path();
  if (options.json) {
    nlohmann::json result;
    result["root"] = root.string();
    result["marker"] = marker->string();
    result["success"] = true;

    std::cout << result.dump(2) << std::endl;
  } else if (!options.quiet) {
    std::cout << "Initialized notes root in " << root.string() << std::endl;
    if (options.verbose && !app_.config().notes_root.empty()) {
      std::cout << "  Note: notes_root in the config file (" << app_.config().notes_root.string()
                << ") takes precedence over this marker" << std::endl;
    }
  }

  return 0;
}

} // namespace noter::cli
