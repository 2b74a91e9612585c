#include "noter/store/path_resolver.hpp"

#include <algorithm>
#include <iterator>

#include <spdlog/spdlog.h>

#include "noter/core/note_template.hpp"
#include "noter/util/filesystem.hpp"
#include "noter/util/time.hpp"

namespace noter::store {

PathResolver::Options PathResolver::optionsFromConfig(const config::Config& config,
                                                      const std::filesystem::path& root) {
  Options options;
  options.root = root;
  options.naming.extension = config.notes.extension;
  options.naming.untitled_prefix = config.notes.untitled_prefix;
  options.naming.untitled_start = config.notes.untitled_start;
  options.front_matter = config.notes.front_matter;
  options.date_prefix = config.notes.date_prefix;
  return options;
}

PathResolver::PathResolver(Options options) : options_(std::move(options)) {
  if (!options_.clock) {
    options_.clock = &noter::util::Time::now;
  }
}

Result<core::Course> PathResolver::createCourse(const std::string& code, const std::string& title) {
  auto dir_name = core::courseDirectoryName(code, title);
  if (!dir_name.has_value()) {
    return std::unexpected(dir_name.error());
  }

  auto root_ok = checkRoot();
  if (!root_ok.has_value()) {
    return std::unexpected(root_ok.error());
  }

  // Held until the folder exists so two creators cannot both pass the check
  auto lock = noter::util::DirectoryLock::acquire(options_.root);
  if (!lock.has_value()) {
    return std::unexpected(lock.error());
  }

  // One folder per code, whatever title it was created with
  auto existing = listCourses();
  if (!existing.has_value()) {
    return std::unexpected(existing.error());
  }
  for (const auto& course : *existing) {
    if (core::sameCourseCode(course.code, code)) {
      return makeErrorResult<core::Course>(ErrorCode::kAlreadyExists,
                                           "Course " + code + " already exists: " + course.directoryName());
    }
  }

  auto directory = options_.root / *dir_name;
  auto created = noter::util::FileSystem::createDirectoryExclusive(directory);
  if (!created.has_value()) {
    if (created.error().code() == ErrorCode::kAlreadyExists) {
      return makeErrorResult<core::Course>(ErrorCode::kAlreadyExists,
                                           "Course folder already exists: " + *dir_name);
    }
    return std::unexpected(created.error());
  }

  spdlog::info("Created course folder {}", directory.string());

  core::Course course;
  course.code = code;
  course.title = title;
  course.slug = dir_name->size() > code.size() ? dir_name->substr(code.size() + 1) : std::string{};
  course.directory = std::move(directory);
  return course;
}

Result<NoteFile> PathResolver::createNote(const std::string& code,
                                          const std::optional<std::string>& title) {
  auto course = findCourse(code);
  if (!course.has_value()) {
    return std::unexpected(course.error());
  }

  auto created_at = options_.clock();
  core::NamingOptions naming = options_.naming;
  if (options_.date_prefix) {
    naming.date_prefix = noter::util::Time::toLocalDate(created_at);
  }

  core::NoteHeader header;
  header.course_code = course->code;
  header.title = title;
  header.created = created_at;
  auto content = core::renderNoteContent(header, options_.front_matter);

  if (!title.has_value()) {
    return createUntitledNote(*course, naming, content);
  }

  auto filename = core::titledNoteFilename(*title, naming);
  if (!filename.has_value()) {
    return std::unexpected(filename.error());
  }

  auto path = course->directory / *filename;
  auto written = noter::util::FileSystem::createFileExclusive(path, content);
  if (!written.has_value()) {
    if (written.error().code() == ErrorCode::kAlreadyExists) {
      return makeErrorResult<NoteFile>(ErrorCode::kAlreadyExists,
                                       course->code + "::" + *filename + " already exists");
    }
    return std::unexpected(written.error());
  }

  spdlog::info("Created note {}", path.string());
  return NoteFile{course->code, title, std::move(path)};
}

Result<core::Course> PathResolver::findCourse(const std::string& code) const {
  auto valid = core::validateCourseCode(code);
  if (!valid.has_value()) {
    return std::unexpected(valid.error());
  }

  auto courses = listCourses();
  if (!courses.has_value()) {
    return std::unexpected(courses.error());
  }

  std::vector<core::Course> matches;
  std::copy_if(courses->begin(), courses->end(), std::back_inserter(matches),
               [&code](const core::Course& course) { return core::sameCourseCode(course.code, code); });

  if (matches.empty()) {
    return makeErrorResult<core::Course>(ErrorCode::kCourseNotFound,
                                         "Could not find notes folder for course " + code +
                                         " in " + options_.root.string());
  }
  if (matches.size() > 1) {
    std::string names;
    for (const auto& match : matches) {
      if (!names.empty()) names += ", ";
      names += match.directoryName();
    }
    return makeErrorResult<core::Course>(ErrorCode::kAmbiguousCourse,
                                         "Several folders belong to course " + code + ": " + names);
  }

  spdlog::debug("Course {} resolved to {}", code, matches.front().directory.string());
  return matches.front();
}

Result<std::vector<core::Course>> PathResolver::listCourses() const {
  auto root_ok = checkRoot();
  if (!root_ok.has_value()) {
    return std::unexpected(root_ok.error());
  }

  auto entries = noter::util::FileSystem::listDirectory(options_.root);
  if (!entries.has_value()) {
    return std::unexpected(entries.error());
  }

  std::vector<core::Course> courses;
  for (const auto& entry : *entries) {
    if (entry.type != noter::util::EntryType::kDirectory) {
      continue;
    }
    auto parts = core::parseCourseDirectory(entry.name);
    if (!parts.has_value()) {
      continue;
    }

    core::Course course;
    course.code = std::move(parts->code);
    course.slug = std::move(parts->slug);
    course.directory = options_.root / entry.name;
    courses.push_back(std::move(course));
  }

  std::sort(courses.begin(), courses.end(), [](const core::Course& a, const core::Course& b) {
    return a.directory.filename() < b.directory.filename();
  });
  return courses;
}

Result<void> PathResolver::checkRoot() const {
  std::error_code ec;
  if (!std::filesystem::is_directory(options_.root, ec)) {
    return makeErrorResult<void>(ErrorCode::kIoError,
                                 "Notes root is not a directory: " + options_.root.string());
  }
  return {};
}

Result<NoteFile> PathResolver::createUntitledNote(const core::Course& course,
                                                  const core::NamingOptions& naming,
                                                  const std::string& content) {
  auto entries = noter::util::FileSystem::listDirectory(course.directory);
  if (!entries.has_value()) {
    return std::unexpected(entries.error());
  }

  std::vector<std::string> names;
  names.reserve(entries->size());
  for (const auto& entry : *entries) {
    names.push_back(entry.name);
  }

  for (int attempt = 0; attempt < kMaxUntitledAttempts; ++attempt) {
    auto filename = core::nextUntitledFilename(names, naming);
    auto path = course.directory / filename;

    auto written = noter::util::FileSystem::createFileExclusive(path, content);
    if (written.has_value()) {
      spdlog::info("Created note {}", path.string());
      return NoteFile{course.code, std::nullopt, std::move(path)};
    }
    if (written.error().code() != ErrorCode::kAlreadyExists) {
      return std::unexpected(written.error());
    }

    // Another writer took this number between the listing and the create
    spdlog::debug("{} appeared concurrently, trying the next number", filename);
    names.push_back(std::move(filename));
  }

  return makeErrorResult<NoteFile>(ErrorCode::kIoError,
                                   "Gave up picking an untitled note name in " +
                                   course.directory.string());
}

}  // namespace noter::store
