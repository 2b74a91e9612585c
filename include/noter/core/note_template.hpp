#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace noter::core {

// What a freshly created note records about itself
struct NoteHeader {
  std::string course_code;
  std::optional<std::string> title;
  std::chrono::system_clock::time_point created;
};

/**
 * @brief Initial content of a new note
 *
 * With front matter the note starts with a YAML block holding course, title
 * and creation time. Titled notes then get a "# <title>" heading. An untitled
 * note without front matter is an empty file.
 */
std::string renderNoteContent(const NoteHeader& header, bool front_matter);

}  // namespace noter::core
