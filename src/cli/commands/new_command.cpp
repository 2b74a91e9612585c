#include "noter/cli/commands/new_command.hpp"

#include <iostream>
#include <optional>
#include <nlohmann/json.hpp>

namespace noter::cli {

NewCommand::NewCommand(Application& app) : app_(app) {
}

void NewCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("code", code_, "Course code of an existing course folder")->required();
  cmd->add_option("title", title_, "Note title (optional)");
  cmd->add_flag("--print-path,-p", print_path_, "Print only the path of the new note");
}

Result<int> NewCommand::execute(const GlobalOptions& options) {
  auto resolver = app_.pathResolver();
  if (!resolver.has_value()) {
    return std::unexpected(resolver.error());
  }

  // An empty title is the same as none
  std::optional<std::string> title;
  if (!title_.empty()) {
    title = title_;
  }

  auto note = (*resolver)->createNote(code_, title);
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }

  if (options.json) {
    nlohmann::json result;
    result["course"] = note->course_code;
    if (note->title.has_value()) {
      result["title"] = *note->title;
    } else {
      result["title"] = nullptr;
    }
    result["filename"] = note->filename();
    result["path"] = note->path.string();
    result["success"] = true;

    std::cout << result.dump(2) << std::endl;
  } else if (print_path_) {
    std::cout << note->path.string() << std::endl;
  } else if (!options.quiet) {
    std::cout << "Created " << note->course_code << "::" << note->filename() << std::endl;
    if (options.verbose) {
      std::cout << "  Path: " << note->path.string() << std::endl;
    }
  }

  return 0;
}

} // namespace noter::cli
