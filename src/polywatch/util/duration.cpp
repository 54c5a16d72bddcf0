#include "polywatch/util/duration.hpp"

#include <array>
#include <charconv>
#include <cstdint>
#include <format>
#include <limits>

namespace polywatch::util {

namespace {

struct Unit {
  std::string_view suffix;
  double nanos;
};

// Longest suffixes first so "ms" is not read as "m".
constexpr std::array<Unit, 6> kUnits{{
    {"ns", 1.0},
    {"us", 1e3},
    {"ms", 1e6},
    {"h", 3600e9},
    {"m", 60e9},
    {"s", 1e9},
}};

constexpr double kMaxNanos =
    static_cast<double>(std::numeric_limits<std::int64_t>::max());

auto is_number_char(char c) -> bool {
  return (c >= '0' && c <= '9') || c == '.';
}

}  // namespace

auto parse_duration(std::string_view text) -> Result<std::chrono::milliseconds> {
  if (text.empty()) {
    return fail(Error::InvalidArgument);
  }
  if (text == "0") {
    return ok(std::chrono::milliseconds{0});
  }

  double total_nanos = 0.0;
  std::size_t pos = 0;
  while (pos < text.size()) {
    std::size_t num_end = pos;
    while (num_end < text.size() && is_number_char(text[num_end])) {
      ++num_end;
    }
    if (num_end == pos) {
      return fail(Error::InvalidArgument);
    }

    double value = 0.0;
    auto [ptr, ec] =
        std::from_chars(text.data() + pos, text.data() + num_end, value);
    if (ec != std::errc{} || ptr != text.data() + num_end) {
      return fail(Error::InvalidArgument);
    }

    auto rest = text.substr(num_end);
    const Unit* unit = nullptr;
    for (const auto& u : kUnits) {
      if (rest.starts_with(u.suffix)) {
        unit = &u;
        break;
      }
    }
    if (unit == nullptr) {
      return fail(Error::InvalidArgument);
    }

    total_nanos += value * unit->nanos;
    pos = num_end + unit->suffix.size();
  }

  // Same ceiling as a signed 64-bit nanosecond count, roughly 292 years.
  if (total_nanos >= kMaxNanos) {
    return fail(Error::InvalidArgument);
  }

  return ok(std::chrono::milliseconds{
      static_cast<std::chrono::milliseconds::rep>(total_nanos / 1e6)});
}

auto format_duration(std::chrono::milliseconds d) -> std::string {
  auto ms = d.count();
  if (ms == 0) {
    return "0s";
  }
  if (ms % 1000 != 0) {
    return std::format("{}ms", ms);
  }
  auto secs = ms / 1000;
  if (secs % 60 != 0 || secs < 60) {
    return secs >= 60 ? std::format("{}m{}s", secs / 60, secs % 60)
                      : std::format("{}s", secs);
  }
  auto mins = secs / 60;
  if (mins % 60 != 0 || mins < 60) {
    return mins >= 60 ? std::format("{}h{}m", mins / 60, mins % 60)
                      : std::format("{}m", mins);
  }
  return std::format("{}h", mins / 60);
}

}  // namespace polywatch::util
