#include "polywatch/watch/fingerprint.hpp"

#include "polywatch/util/hash.hpp"
#include "polywatch/util/log.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <vector>

namespace polywatch {

namespace fs = std::filesystem;

struct TreeFingerprinter::WalkState {
  util::Fnv1a64 hasher;
  bool dep_changed{false};
  fs::file_time_type dep_mtime{};
  std::size_t files_hashed{0};
};

TreeFingerprinter::TreeFingerprinter(fs::path root, PathRules rules,
                                     std::string dep_file)
    : root_{std::move(root)},
      rules_{std::move(rules)},
      dep_name_{dep_file.empty() ? std::string{}
                                 : fs::path(dep_file).filename().string()} {}

TreeFingerprinter::TreeFingerprinter(const WatcherConfig& config)
    : TreeFingerprinter(config.root, PathRules{config.includes, config.excludes},
                        config.dep_file) {}

auto TreeFingerprinter::scan(fs::file_time_type previous_dep_mtime) const
    -> Result<ScanResult> {
  std::error_code ec;
  auto status = fs::status(root_, ec);
  if (ec) {
    log::warn("Error accessing {}: {}", root_.string(), ec.message());
    return fail(Error::ScanFailed);
  }
  if (!fs::is_directory(status)) {
    log::warn("Watch root {} is not a directory", root_.string());
    return fail(Error::ScanFailed);
  }

  WalkState state;
  state.dep_mtime = previous_dep_mtime;
  if (!walk(root_, {}, state)) {
    return fail(Error::ScanFailed);
  }

  log::trace("Hashed {} files under {}", state.files_hashed, root_.string());
  return ok(ScanResult{
      .fingerprint = state.hasher.digest(),
      .dep_changed = state.dep_changed,
      .dep_mtime = state.dep_mtime,
      .files_hashed = state.files_hashed,
  });
}

auto TreeFingerprinter::walk(const fs::path& dir, const std::string& rel_dir,
                             WalkState& state) const -> bool {
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    log::warn("Error accessing {}: {}", dir.string(), ec.message());
    return false;
  }

  std::vector<fs::directory_entry> entries;
  for (auto end = fs::directory_iterator{}; !ec && it != end;
       it.increment(ec)) {
    entries.push_back(*it);
  }
  if (ec) {
    log::warn("Error accessing {}: {}", dir.string(), ec.message());
  }

  std::ranges::sort(entries, {}, [](const fs::directory_entry& e) {
    return e.path().filename().native();
  });

  for (const auto& entry : entries) {
    auto name = entry.path().filename().string();
    auto rel_path = rel_dir.empty() ? name : rel_dir + '/' + name;

    std::error_code status_ec;
    auto status = entry.symlink_status(status_ec);
    if (status_ec) {
      log::warn("Error accessing {}: {}", entry.path().string(),
                status_ec.message());
      continue;
    }

    if (fs::is_directory(status)) {
      if (name.starts_with('.')) {
        continue;
      }
      // A subdirectory that cannot be listed only loses its own subtree.
      walk(entry.path(), rel_path, state);
    } else if (fs::is_regular_file(status)) {
      visit_file(entry, rel_path, name, state);
    }
  }
  return true;
}

auto TreeFingerprinter::visit_file(const fs::directory_entry& entry,
                                   const std::string& rel_path,
                                   const std::string& name,
                                   WalkState& state) const -> void {
  if (!rules_.matches(rel_path)) {
    return;
  }

  std::error_code ec;
  auto size = entry.file_size(ec);
  if (ec) {
    log::warn("Error accessing {}: {}", entry.path().string(), ec.message());
    return;
  }
  auto mtime = entry.last_write_time(ec);
  if (ec) {
    log::warn("Error accessing {}: {}", entry.path().string(), ec.message());
    return;
  }

  state.hasher.update(rel_path)
      .update(std::to_string(size))
      .update(format_mtime(mtime));
  ++state.files_hashed;

  if (!dep_name_.empty() && name == dep_name_ && mtime != state.dep_mtime) {
    state.dep_changed = true;
    state.dep_mtime = mtime;
  }
}

auto format_mtime(fs::file_time_type mtime) -> std::string {
  return std::format("{:%Y-%m-%d %H:%M:%S}",
                     std::chrono::file_clock::to_sys(mtime));
}

}  // namespace polywatch
