#include "Commands.hpp"

#include <algorithm>
#include <d2anim/Integrity.hpp>
#include <d2anim/io/AnimDataIO.hpp>
#include <d2anim/text/Json.hpp>
#include <d2anim/text/TabbedText.hpp>
#include <fmt/color.h>
#include <oishii/util/util.hxx>
#include <rsl/WriteFile.hpp>

using d2anim::AnimationRecord;
using d2anim::Error;
using d2anim::ErrorCode;
using d2anim::ErrorKind;

static Error IoError(std::string message) {
  return Error{
      .kind = ErrorKind::Io,
      .code = ErrorCode::FileAccess,
      .message = std::move(message),
  };
}

static d2anim::Result<std::vector<u8>> ReadInput(std::string_view path) {
  auto file = oishii::UtilReadFile(path);
  if (!file) {
    return std::unexpected(IoError(file.error()));
  }
  return std::move(*file);
}

static d2anim::Result<void> WriteOutput(std::span<const u8> data,
                                        std::string_view path) {
  auto ok = rsl::WriteFile(data, path);
  if (!ok) {
    return std::unexpected(IoError(ok.error()));
  }
  return {};
}

static std::span<const u8> AsBytes(std::string_view text) {
  return {reinterpret_cast<const u8*>(text.data()), text.size()};
}

static void LogDiagnostics(std::span<const AnimationRecord> records) {
  for (const auto& diagnostic : d2anim::CheckRecords(records)) {
    rsl::warn("{}", diagnostic.message());
  }
}

// Diagnostics are warnings; the trigger policy decides whether one is fatal.
static d2anim::Result<void> Check(std::vector<AnimationRecord>& records,
                                  const CliOptions& opt) {
  LogDiagnostics(records);
  TRY(d2anim::EnforceTriggerPolicy(records,
                                   opt.strict_triggers
                                       ? d2anim::TriggerPolicy::Strict
                                       : d2anim::TriggerPolicy::Lenient));
  if (opt.sort) {
    d2anim::SortRecordsByIdentifier(records);
  }
  return {};
}

d2anim::Result<void> compile(const CliOptions& opt) {
  rsl::info("Compiling: {} => {}", opt.from, opt.to);
  auto file = TRY(ReadInput(opt.from));
  const std::string_view text(reinterpret_cast<const char*>(file.data()),
                              file.size());
  std::vector<AnimationRecord> records;
  if (opt.format == InterchangeFormat::Json) {
    records = TRY(d2anim::ReadJson(text));
  } else {
    records = TRY(d2anim::ReadTabbedText(text));
  }
  rsl::info("Read {} records from {}", records.size(), opt.from);
  TRY(Check(records, opt));
  auto bytes = d2anim::WriteAnimData(records);
  TRY(WriteOutput(bytes, opt.to));
  return {};
}

d2anim::Result<void> decompile(const CliOptions& opt) {
  rsl::info("Decompiling: {} => {}", opt.from, opt.to);
  auto file = TRY(ReadInput(opt.from));
  auto records = TRY(d2anim::ReadAnimData(file, opt.from));
  rsl::info("Read {} records from {}", records.size(), opt.from);
  TRY(Check(records, opt));
  const std::string text = opt.format == InterchangeFormat::Json
                               ? d2anim::WriteJson(records)
                               : d2anim::WriteTabbedText(records);
  TRY(WriteOutput(AsBytes(text), opt.to));
  return {};
}

d2anim::Result<void> CompareRebuild(std::span<const u8> original,
                                    std::span<const u8> rebuilt) {
  const auto first = std::ranges::mismatch(rebuilt, original).in1;
  if (first == rebuilt.end() && rebuilt.size() == original.size()) {
    return {};
  }
  return std::unexpected(Error{
      .kind = ErrorKind::Data,
      .code = ErrorCode::RebuildMismatch,
      .message = fmt::format("Rebuilt table ({} bytes) differs from input ({} "
                             "bytes)",
                             rebuilt.size(), original.size()),
      .offset = static_cast<u32>(first - rebuilt.begin()),
  });
}

d2anim::Result<void> rebuild(const CliOptions& opt) {
  rsl::info("Rebuilding: {} => {}", opt.from, opt.to);
  auto file = TRY(ReadInput(opt.from));
  auto records = TRY(d2anim::ReadAnimData(file, opt.from));
  LogDiagnostics(records);
  auto bytes = d2anim::WriteAnimData(records);
  if (opt.check) {
    TRY(CompareRebuild(file, bytes));
  }
  TRY(WriteOutput(bytes, opt.to));
  if (opt.check) {
    fmt::print(stderr, "{}\n",
               fmt::styled("Rebuilt table is byte-identical",
                           fmt::fg(fmt::color::green)));
  }
  return {};
}

d2anim::Result<void> run(const CliOptions& opt) {
  switch (opt.command) {
  case Command::compile:
    return compile(opt);
  case Command::decompile:
    return decompile(opt);
  case Command::rebuild:
    return rebuild(opt);
  }
  return {};
}
