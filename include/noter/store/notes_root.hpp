#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

#include "noter/common.hpp"

namespace noter::store {

// Where the notes root came from, in precedence order
enum class RootSource {
  kCommandLine,
  kEnvironment,
  kConfig,
  kMarker,
  kWorkingDirectory
};

std::string_view rootSourceToString(RootSource source);

struct NotesRoot {
  std::filesystem::path path;
  RootSource source = RootSource::kWorkingDirectory;
  std::filesystem::path marker_file;   // Empty if the root carries no marker
};

/**
 * @brief Finds the top-level directory all course folders live in
 *
 * Resolution order: --root, $NOTER_ROOT, notes_root from the user config,
 * the nearest ancestor of the working directory holding a .noter.toml
 * marker, and finally the working directory itself.
 */
class NotesRootLocator {
public:
  struct Options {
    std::filesystem::path command_line;
    std::filesystem::path environment;
    std::filesystem::path configured;
    std::filesystem::path start_dir;
  };

  static Result<NotesRoot> locate(const Options& options);

  // Nearest directory at or above start_dir holding the marker file
  static std::optional<std::filesystem::path> findMarkerRoot(const std::filesystem::path& start_dir);

  /**
   * @brief Mark a directory as a notes root
   * @return Path of the written marker; kAlreadyExists if one is present
   */
  static Result<std::filesystem::path> initialize(const std::filesystem::path& dir);

  static constexpr std::string_view kMarkerFileName = ".noter.toml";
  static constexpr std::string_view kRootEnvVar = "NOTER_ROOT";
};

}  // namespace noter::store
