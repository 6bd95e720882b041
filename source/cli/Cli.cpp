#include "Cli.hpp"

#include <rsl/EnumCast.hpp>

std::string usage() {
  return "Usage:\n"
         "  d2anim compile   <source> <animdata.d2> (--json | --txt) "
         "[--sort] [--strict-triggers] [--verbose]\n"
         "  d2anim decompile <animdata.d2> <target> (--json | --txt) "
         "[--sort] [--strict-triggers] [--verbose]\n"
         "  d2anim rebuild   <animdata.d2> <out.d2> [--check] [--verbose]\n";
}

static Result<void> SetFormat(CliOptions& args, InterchangeFormat format) {
  EXPECT(args.format == InterchangeFormat::None ||
             args.format == format,
         "--json and --txt are mutually exclusive");
  args.format = format;
  return {};
}

Result<std::optional<CliOptions>> parse(int argc, const char** argv) {
  if (argc < 2) {
    return std::nullopt;
  }
  CliOptions args{};
  args.command = TRY(rsl::enum_cast<Command>(argv[1]));

  std::vector<std::string_view> positional;
  for (int i = 2; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "--json") {
      TRY(SetFormat(args, InterchangeFormat::Json));
    } else if (arg == "--txt") {
      TRY(SetFormat(args, InterchangeFormat::Txt));
    } else if (arg == "--sort") {
      args.sort = true;
    } else if (arg == "--strict-triggers") {
      args.strict_triggers = true;
    } else if (arg == "--check") {
      args.check = true;
    } else if (arg == "--verbose" || arg == "-v") {
      args.verbose = true;
    } else if (arg.starts_with("--")) {
      return std::unexpected(fmt::format("Unknown option {}", arg));
    } else {
      positional.push_back(arg);
    }
  }

  EXPECT(positional.size() == 2,
         fmt::format("Expected <from> and <to>, got {} path(s)",
                     positional.size()));
  args.from = positional[0];
  args.to = positional[1];

  if (args.command == Command::rebuild) {
    EXPECT(args.format == InterchangeFormat::None,
           "rebuild takes no interchange format");
    EXPECT(!args.sort, "--sort does not apply to rebuild");
    EXPECT(!args.strict_triggers,
           "--strict-triggers does not apply to rebuild");
  } else {
    EXPECT(args.format != InterchangeFormat::None,
           "One of --json or --txt is required");
    EXPECT(!args.check, "--check only applies to rebuild");
  }
  return args;
}
