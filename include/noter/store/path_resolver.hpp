#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "noter/common.hpp"
#include "noter/config/config.hpp"
#include "noter/core/course.hpp"
#include "noter/core/note_name.hpp"

namespace noter::store {

/**
 * @brief A note file created inside a course directory
 */
struct NoteFile {
  std::string course_code;
  std::optional<std::string> title;
  std::filesystem::path path;

  std::string filename() const { return path.filename().string(); }
};

/**
 * @brief Maps course codes and titles onto the notes directory tree
 *
 * Every mutating operation creates exactly one directory or file with an
 * atomic create-if-absent call, so two concurrent invocations can never
 * both succeed on the same path.
 */
class PathResolver {
public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  struct Options {
    std::filesystem::path root;
    core::NamingOptions naming;
    bool front_matter = true;
    bool date_prefix = false;
    Clock clock;   // Defaults to the system clock
  };

  // Options for a root with the note settings of a loaded config
  static Options optionsFromConfig(const config::Config& config, const std::filesystem::path& root);

  explicit PathResolver(Options options);

  /**
   * @brief Create the directory for a new course
   * @param code Course code, e.g. "EAS103"
   * @param title Display title, may be empty
   * @return The course, or kAlreadyExists if a folder for the code is present
   */
  Result<core::Course> createCourse(const std::string& code, const std::string& title);

  /**
   * @brief Create a note in the course matching code
   * @param code Course code; matched case-insensitively against folder names
   * @param title Note title; without one the lowest free untitled-<n> is used
   * @return The note, or kCourseNotFound if no folder carries the code
   */
  Result<NoteFile> createNote(const std::string& code, const std::optional<std::string>& title);

  // The single course folder for code
  Result<core::Course> findCourse(const std::string& code) const;

  // All course folders under the root, sorted by directory name
  Result<std::vector<core::Course>> listCourses() const;

  // Upper bound on untitled names tried when racing other writers
  static constexpr int kMaxUntitledAttempts = 64;

private:
  Options options_;

  Result<void> checkRoot() const;
  Result<NoteFile> createUntitledNote(const core::Course& course, const core::NamingOptions& naming,
                                      const std::string& content);
};

}  // namespace noter::store
