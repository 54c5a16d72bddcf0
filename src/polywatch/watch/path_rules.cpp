#include "polywatch/watch/path_rules.hpp"

#include <algorithm>

namespace polywatch {

namespace {

auto rule_hits(std::string_view path, std::string_view rule) -> bool {
  return path.starts_with(rule) || path.ends_with(rule);
}

}  // namespace

auto should_process(std::string_view relative_path,
                    std::span<const std::string> includes,
                    std::span<const std::string> excludes) -> bool {
  auto hits = [relative_path](const std::string& rule) {
    return rule_hits(relative_path, rule);
  };

  if (std::ranges::any_of(excludes, hits)) {
    return false;
  }
  if (includes.empty()) {
    return true;
  }
  return std::ranges::any_of(includes, hits);
}

}  // namespace polywatch
