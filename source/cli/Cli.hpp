#pragma once

#include <core/common.h>

// d2anim compile   <source> <animdata.d2> (--json | --txt)
// d2anim decompile <animdata.d2> <target> (--json | --txt)
// d2anim rebuild   <animdata.d2> <out.d2>
// --sort
// --strict-triggers
// --check
// --verbose
//
enum class Command {
  compile,
  decompile,
  rebuild,
};

enum class InterchangeFormat {
  None,
  Json,
  Txt,
};

struct CliOptions {
  Command command = Command::compile;
  std::string from;
  std::string to;
  InterchangeFormat format = InterchangeFormat::None;
  bool sort = false;
  bool strict_triggers = false;
  bool check = false;
  bool verbose = false;
};

//! std::nullopt when no command was given
Result<std::optional<CliOptions>> parse(int argc, const char** argv);
std::string usage();
