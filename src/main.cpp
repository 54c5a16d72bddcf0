#include "polywatch/cli/commands.hpp"

#include <string_view>
#include <vector>

int main(int argc, char* argv[]) {
  std::vector<std::string_view> args(argv + 1, argv + argc);

  auto opts = polywatch::cli::parse_args(args);
  if (!opts) {
    polywatch::cli::print_usage(argv[0]);
    return 1;
  }
  if (opts->help) {
    polywatch::cli::print_usage(argv[0]);
    return 0;
  }
  if (opts->version) {
    polywatch::cli::print_version();
    return 0;
  }

  polywatch::cli::print_banner();

  auto config = polywatch::cli::resolve_config(*opts);
  if (!config) {
    return 1;
  }
  return polywatch::cli::cmd_watch(*config);
}
