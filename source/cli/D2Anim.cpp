#include "Cli.hpp"
#include "Commands.hpp"

#include <fmt/color.h>

#ifndef D2ANIM_VERSION
#define D2ANIM_VERSION "unknown"
#endif

int main(int argc, const char** argv) {
  fmt::print(stderr, "d2anim {}\n", D2ANIM_VERSION);
  auto args = parse(argc, argv);
  if (!args) {
    fmt::print(stderr, "{}\n{}", args.error(), usage());
    return 1;
  }
  if (!args->has_value()) {
    fmt::print(stderr, "{}", usage());
    return 0;
  }
  const CliOptions& opt = **args;
  if (opt.verbose) {
    rsl::logging::init(rsl::logging::Level::Trace);
  }

  auto ok = run(opt);
  if (!ok) {
    fmt::print(stderr, "{}\n",
               fmt::styled(ok.error().describe(), fmt::fg(fmt::color::red)));
    return 1;
  }
  return 0;
}
