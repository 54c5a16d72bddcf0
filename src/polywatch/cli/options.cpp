#include "polywatch/cli/commands.hpp"

#include "polywatch/config/config.hpp"
#include "polywatch/core/constants.hpp"
#include "polywatch/util/duration.hpp"

#include <array>
#include <print>
#include <utility>

namespace polywatch::cli {

namespace {

using Field = std::optional<std::string> CliOptions::*;

struct ValueFlag {
  std::string_view long_name;
  std::string_view short_name;
  Field field;
};

constexpr std::array<ValueFlag, 11> kValueFlags{{
    {"--config", "-c", &CliOptions::config_file},
    {"--root", "", &CliOptions::root},
    {"--interval", "", &CliOptions::interval},
    {"--build", "", &CliOptions::build},
    {"--run", "", &CliOptions::run},
    {"--depfile", "", &CliOptions::dep_file},
    {"--depcommand", "", &CliOptions::dep_command},
    {"--include", "", &CliOptions::include},
    {"--exclude", "", &CliOptions::exclude},
    {"--workdir", "", &CliOptions::work_dir},
    {"--log-level", "", &CliOptions::log_level},
}};

auto find_flag(std::string_view name) -> const ValueFlag* {
  for (const auto& flag : kValueFlags) {
    if (name == flag.long_name ||
        (!flag.short_name.empty() && name == flag.short_name)) {
      return &flag;
    }
  }
  return nullptr;
}

auto is_log_level(std::string_view name) -> bool {
  return name == "trace" || name == "debug" || name == "info" ||
         name == "warn" || name == "error";
}

}  // namespace

auto parse_args(std::span<const std::string_view> args) -> Result<CliOptions> {
  CliOptions opts;

  for (std::size_t i = 0; i < args.size(); ++i) {
    std::string_view arg = args[i];

    if (arg == "-h" || arg == "--help") {
      opts.help = true;
      continue;
    }
    if (arg == "-v" || arg == "--version") {
      opts.version = true;
      continue;
    }

    std::string_view name = arg;
    std::optional<std::string_view> inline_value;
    if (auto eq = arg.find('='); arg.starts_with("--") && eq != arg.npos) {
      name = arg.substr(0, eq);
      inline_value = arg.substr(eq + 1);
    }

    const auto* flag = find_flag(name);
    if (flag == nullptr) {
      std::println(stderr, "Unknown option: {}", arg);
      return fail(Error::InvalidArgument);
    }

    if (inline_value) {
      opts.*(flag->field) = std::string(*inline_value);
    } else if (++i < args.size()) {
      opts.*(flag->field) = std::string(args[i]);
    } else {
      std::println(stderr, "Error: {} requires an argument", name);
      return fail(Error::InvalidArgument);
    }
  }

  return ok(std::move(opts));
}

auto resolve_config(const CliOptions& opts) -> Result<WatcherConfig> {
  WatcherConfig config;
  if (opts.config_file) {
    auto loaded = ConfigLoader::load_from_file(*opts.config_file);
    if (!loaded) {
      std::println(stderr, "Error: Failed to load config {}: {}",
                   *opts.config_file, loaded.error().message());
      return fail(loaded.error());
    }
    config = std::move(*loaded);
  }

  if (opts.root) config.root = *opts.root;
  if (opts.build) config.build_command = *opts.build;
  if (opts.run) config.run_command = *opts.run;
  if (opts.dep_file) config.dep_file = *opts.dep_file;
  if (opts.dep_command) config.dep_command = *opts.dep_command;
  if (opts.include) config.includes = split_rules(*opts.include);
  if (opts.exclude) config.excludes = split_rules(*opts.exclude);
  if (opts.work_dir) config.work_dir = *opts.work_dir;
  if (opts.log_level) config.log_level = *opts.log_level;

  if (opts.interval) {
    auto interval = util::parse_duration(*opts.interval);
    if (!interval) {
      std::println(stderr, "Error: invalid --interval '{}'", *opts.interval);
      return fail(Error::InvalidArgument);
    }
    config.interval = *interval;
  }

  if (config.interval.count() <= 0) {
    std::println(stderr, "Error: interval must be positive");
    return fail(Error::InvalidArgument);
  }
  if (config.root.empty()) {
    std::println(stderr, "Error: root directory must not be empty");
    return fail(Error::InvalidArgument);
  }
  if (!is_log_level(config.log_level)) {
    std::println(stderr, "Error: unknown log level '{}'", config.log_level);
    return fail(Error::InvalidArgument);
  }

  return ok(std::move(config));
}

void print_banner() {
  std::println(
      "polywatch - the build-run watcher for your projects. Change it. "
      "Build it. Run it. Repeat.");
  std::println("Example:");
  std::println(
      "  polywatch --root=./myapp --depfile=go.mod "
      "--depcommand=\"go mod tidy && go mod download\" "
      "--build=\"go build -o myapp .\" --run=\"./myapp\" --include=.go "
      "--exclude=.git,.polycode");
  std::println("");
}

void print_usage(std::string_view prog) {
  std::println("Usage: {} [OPTIONS]", prog);
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>     YAML config file; flags override it");
  std::println("  --root <dir>            Directory to watch (default: .)");
  std::println(
      "  --interval <duration>   Polling interval, e.g. 1s, 500ms (default: "
      "1s)");
  std::println("  --build <cmd>           Build command to run on change");
  std::println("  --run <cmd>             Run command to execute built app");
  std::println(
      "  --depfile <file>        Dependency file to monitor (e.g. go.mod, "
      "package.json)");
  std::println(
      "  --depcommand <cmd>      Command to run when the dependency file "
      "changes");
  std::println(
      "  --include <rules>       Comma-separated prefix/suffix rules, e.g. "
      "'.go,services'");
  std::println(
      "  --exclude <rules>       Comma-separated prefix/suffix rules, e.g. "
      "'.git,tmp'");
  std::println("  --workdir <dir>         Directory the commands run in");
  std::println(
      "  --log-level <level>     trace, debug, info, warn, error (default: "
      "info)");
  std::println("  -v, --version           Show version and exit");
  std::println("  -h, --help              Show this help message");
}

void print_version() {
  std::println("polywatch v{}", kVersion);
}

}  // namespace polywatch::cli
