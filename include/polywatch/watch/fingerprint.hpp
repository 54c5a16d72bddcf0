#pragma once

#include "polywatch/config/watcher_config.hpp"
#include "polywatch/core/error.hpp"
#include "polywatch/watch/path_rules.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace polywatch {

struct ScanResult {
  std::uint64_t fingerprint{0};
  // Set when an accepted file named like the dependency file carries an
  // mtime different from the one passed to scan().
  bool dep_changed{false};
  // The mtime to pass to the next scan(); unchanged if dep_changed is false.
  std::filesystem::file_time_type dep_mtime{};
  std::size_t files_hashed{0};
};

// Hashes (relative path, size, mtime) of every accepted regular file under
// root into one FNV-1a 64 digest. Directories are visited in name order and
// hidden subdirectories (leading '.') are skipped along with their
// contents; the root is always entered whatever its name. Symlinks are not
// followed.
class TreeFingerprinter {
public:
  TreeFingerprinter(std::filesystem::path root, PathRules rules,
                    std::string dep_file = {});
  explicit TreeFingerprinter(const WatcherConfig& config);

  // Unreadable entries below the root are logged and skipped. Only a root
  // that cannot be listed is an error (Error::ScanFailed).
  [[nodiscard]] auto scan(std::filesystem::file_time_type previous_dep_mtime)
      const -> Result<ScanResult>;

  [[nodiscard]] auto root() const noexcept -> const std::filesystem::path& {
    return root_;
  }

private:
  struct WalkState;

  auto walk(const std::filesystem::path& dir, const std::string& rel_dir,
            WalkState& state) const -> bool;
  auto visit_file(const std::filesystem::directory_entry& entry,
                  const std::string& rel_path, const std::string& name,
                  WalkState& state) const -> void;

  std::filesystem::path root_;
  PathRules rules_;
  std::string dep_name_;
};

// Text fed to the hash for a modification time, nanosecond precision.
[[nodiscard]] auto format_mtime(std::filesystem::file_time_type mtime)
    -> std::string;

}  // namespace polywatch
