#pragma once

#include <chrono>
#include <string_view>

namespace polywatch {

inline constexpr std::string_view kVersion = "0.1.0";

namespace shell {
inline constexpr const char* kPath = "/bin/sh";
inline constexpr const char* kArgv0 = "sh";
inline constexpr int kExecFailedStatus = 127;
}  // namespace shell

namespace timing {
inline constexpr auto kDefaultPollInterval = std::chrono::milliseconds(1000);
inline constexpr auto kLoggerIdleSleep = std::chrono::microseconds(100);
}  // namespace timing

namespace defaults {
inline constexpr std::string_view kRoot = ".";
inline constexpr std::string_view kBuildCommand =
    "echo 'No build command specified'";
inline constexpr std::string_view kRunCommand =
    "echo 'No run command specified'";
inline constexpr std::string_view kLogLevel = "info";
}  // namespace defaults

}  // namespace polywatch
