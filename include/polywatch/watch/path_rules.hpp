#pragma once

#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace polywatch {

// A rule matches a relative path when the path starts or ends with it.
// Excludes are checked first and always win; an empty include list admits
// everything not excluded.
[[nodiscard]] auto should_process(std::string_view relative_path,
                                  std::span<const std::string> includes,
                                  std::span<const std::string> excludes)
    -> bool;

class PathRules {
public:
  PathRules() = default;
  PathRules(std::vector<std::string> includes,
            std::vector<std::string> excludes)
      : includes_{std::move(includes)}, excludes_{std::move(excludes)} {}

  [[nodiscard]] auto matches(std::string_view relative_path) const -> bool {
    return should_process(relative_path, includes_, excludes_);
  }

  [[nodiscard]] auto includes() const noexcept
      -> const std::vector<std::string>& {
    return includes_;
  }
  [[nodiscard]] auto excludes() const noexcept
      -> const std::vector<std::string>& {
    return excludes_;
  }

private:
  std::vector<std::string> includes_;
  std::vector<std::string> excludes_;
};

}  // namespace polywatch
