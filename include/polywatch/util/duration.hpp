#pragma once

#include "polywatch/core/error.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace polywatch::util {

// Parses Go-style durations: "500ms", "1s", "1.5s", "1m30s", "2h".
// Accepted units: ns, us, ms, s, m, h. A bare "0" is zero. Sub-millisecond
// remainders are truncated.
[[nodiscard]] auto parse_duration(std::string_view text)
    -> Result<std::chrono::milliseconds>;

[[nodiscard]] auto format_duration(std::chrono::milliseconds d) -> std::string;

}  // namespace polywatch::util
