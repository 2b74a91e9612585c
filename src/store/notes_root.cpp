#include "noter/store/notes_root.hpp"

#include <spdlog/spdlog.h>

#include "noter/util/filesystem.hpp"

namespace noter::store {

namespace {

constexpr std::string_view kMarkerTemplate =
    "# noter collection root.\n"
    "# Settings here override the user configuration for this collection.\n"
    "\n"
    "[notes]\n"
    "# extension = \"md\"\n"
    "# untitled_prefix = \"untitled\"\n"
    "# untitled_start = 1\n"
    "# front_matter = true\n"
    "# date_prefix = false\n";

Result<std::filesystem::path> absoluteDirectory(const std::filesystem::path& path,
                                                std::string_view what) {
  std::error_code ec;
  auto absolute = std::filesystem::absolute(path, ec);
  if (ec) {
    return makeErrorResult<std::filesystem::path>(
        ErrorCode::kIoError, "Cannot resolve " + std::string(what) + " " + path.string() + ": " + ec.message());
  }
  // "/notes/" and "/notes" name the same root
  absolute = absolute.lexically_normal();
  if (!absolute.has_filename() && absolute != absolute.root_path()) {
    absolute = absolute.parent_path();
  }

  if (!std::filesystem::is_directory(absolute, ec)) {
    return makeErrorResult<std::filesystem::path>(
        ErrorCode::kInvalidArgument, std::string(what) + " is not a directory: " + absolute.string());
  }
  return absolute;
}

NotesRoot makeRoot(std::filesystem::path path, RootSource source) {
  NotesRoot root;
  root.marker_file = path / NotesRootLocator::kMarkerFileName;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(root.marker_file, ec)) {
    root.marker_file.clear();
  }
  root.path = std::move(path);
  root.source = source;
  return root;
}

}  // namespace

std::string_view rootSourceToString(RootSource source) {
  switch (source) {
    case RootSource::kCommandLine:
      return "command line";
    case RootSource::kEnvironment:
      return "environment";
    case RootSource::kConfig:
      return "config";
    case RootSource::kMarker:
      return "marker";
    case RootSource::kWorkingDirectory:
      return "working directory";
  }
  return "unknown";
}

Result<NotesRoot> NotesRootLocator::locate(const Options& options) {
  const std::pair<const std::filesystem::path*, RootSource> explicit_roots[] = {
    {&options.command_line, RootSource::kCommandLine},
    {&options.environment, RootSource::kEnvironment},
    {&options.configured, RootSource::kConfig},
  };

  for (const auto& [path, source] : explicit_roots) {
    if (path->empty()) {
      continue;
    }
    auto dir = absoluteDirectory(*path, "Notes root");
    if (!dir.has_value()) {
      return std::unexpected(dir.error());
    }
    spdlog::debug("Notes root {} from {}", dir->string(), rootSourceToString(source));
    return makeRoot(std::move(*dir), source);
  }

  auto start = absoluteDirectory(options.start_dir.empty() ? std::filesystem::path(".") : options.start_dir,
                                 "Working directory");
  if (!start.has_value()) {
    return std::unexpected(start.error());
  }

  if (auto marked = findMarkerRoot(*start)) {
    spdlog::debug("Notes root {} from marker", marked->string());
    return makeRoot(std::move(*marked), RootSource::kMarker);
  }

  spdlog::debug("No {} above {}, using working directory", kMarkerFileName, start->string());
  return makeRoot(std::move(*start), RootSource::kWorkingDirectory);
}

std::optional<std::filesystem::path> NotesRootLocator::findMarkerRoot(const std::filesystem::path& start_dir) {
  std::error_code ec;
  auto dir = std::filesystem::absolute(start_dir, ec);
  if (ec) {
    return std::nullopt;
  }
  dir = dir.lexically_normal();

  while (true) {
    if (std::filesystem::is_regular_file(dir / kMarkerFileName, ec)) {
      return dir;
    }
    auto parent = dir.parent_path();
    if (parent.empty() || parent == dir) {
      return std::nullopt;
    }
    dir = std::move(parent);
  }
}

Result<std::filesystem::path> NotesRootLocator::initialize(const std::filesystem::path& dir) {
  auto root = absoluteDirectory(dir, "Notes root");
  if (!root.has_value()) {
    return std::unexpected(root.error());
  }

  auto marker = *root / kMarkerFileName;
  auto created = noter::util::FileSystem::createFileExclusive(marker, std::string(kMarkerTemplate));
  if (!created.has_value()) {
    if (created.error().code() == ErrorCode::kAlreadyExists) {
      return makeErrorResult<std::filesystem::path>(
          ErrorCode::kAlreadyExists, root->string() + " is already a notes root");
    }
    return std::unexpected(created.error());
  }

  spdlog::info("Marked {} as notes root", root->string());
  return marker;
}

}  // namespace noter::store
