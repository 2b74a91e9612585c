#include "noter/cli/commands/course_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

namespace noter::cli {

CourseCommand::CourseCommand(Application& app) : app_(app) {
}

void CourseCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("code", code_, "Course code, e.g. EAS103")->required();
  cmd->add_option("title", title_, "Course title")->required();
}

Result<int> CourseCommand::execute(const GlobalOptions& options) {
  auto resolver = app_.pathResolver();
  if (!resolver.has_value()) {
    return std::unexpected(resolver.error());
  }

  auto course = (*resolver)->createCourse(code_, title_);
  if (!course.has_value()) {
    return std::unexpected(course.error());
  }

  if (options.json) {
    nlohmann::json result;
    result["code"] = course->code;
    result["title"] = course->title;
    result["directory"] = course->directoryName();
    result["path"] = course->directory.string();
    result["success"] = true;

    std::cout << result.dump(2) << std::endl;
  } else if (!options.quiet) {
    std::cout << "Created " << course->directoryName() << std::endl;
    if (options.verbose) {
      std::cout << "  Path: " << course->directory.string() << std::endl;
    }
  }

  return 0;
}

} // namespace noter::cli
