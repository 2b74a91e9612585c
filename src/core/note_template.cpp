#include "noter/core/note_template.hpp"

#include <yaml-cpp/yaml.h>

#include "noter/util/time.hpp"

namespace noter::core {

std::string renderNoteContent(const NoteHeader& header, bool front_matter) {
  std::string content;

  if (front_matter) {
    YAML::Node node;
    node["course"] = header.course_code;
    if (header.title.has_value()) {
      node["title"] = *header.title;
    }
    node["created"] = noter::util::Time::toRfc3339(header.created);

    YAML::Emitter emitter;
    emitter << node;

    content += "---\n";
    content += emitter.c_str();
    content += "\n---\n";
  }

  if (header.title.has_value()) {
    if (!content.empty()) {
      content += "\n";
    }
    content += "# " + *header.title + "\n\n";
  }

  return content;
}

}  // namespace noter::core
