#pragma once

#include "polywatch/config/watcher_config.hpp"
#include "polywatch/core/error.hpp"

#include <string_view>

namespace polywatch {

// Loads a WatcherConfig from YAML. Keys absent from the document keep the
// defaults of WatcherConfig.
class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<WatcherConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<WatcherConfig>;
};

}  // namespace polywatch
