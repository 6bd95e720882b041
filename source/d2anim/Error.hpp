#pragma once

#include <core/common.h>

namespace d2anim {

//! Broad class of a failure; decides how a caller reacts to it.
enum class ErrorKind {
  Format,     //!< The byte stream is structurally malformed
  Data,       //!< A well-formed byte region decodes to an invalid value
  Validation, //!< A caller-supplied value is outside its legal range
  TabbedText, //!< A tabbed text document could not be read
  Json,       //!< A JSON document could not be read
  Io,         //!< A file could not be read or written
};

//! The specific violation.
enum class ErrorCode {
  Truncated,
  SizeMismatch,
  IdentifierNotAscii,
  IdentifierLength,
  IdentifierContainsNull,
  FrameOutOfRange,
  CodeOutOfRange,
  DuplicateTriggerFrame,
  TriggerBeyondLastFrame,
  ValueOutOfRange,
  BucketMismatch,
  MissingColumn,
  MissingCell,
  NotAnInteger,
  MalformedDocument,
  FileAccess,
  RebuildMismatch,
};

struct Error {
  ErrorKind kind = ErrorKind::Format;
  ErrorCode code = ErrorCode::Truncated;
  std::string message;

  // Decoding: byte offset of the offending record or field
  std::optional<u32> offset;
  // Encoding and interchange: which record, which field
  std::optional<std::size_t> record;
  std::string field;
  // Tabbed text: 0-based line below the header row, and column
  std::optional<std::size_t> row;
  std::optional<std::size_t> column;
  std::string column_name;

  //! Single-line rendering, e.g.
  //! `Data/BucketMismatch: Incorrect hash ... (offset=0x4)`
  std::string describe() const;
};

template <typename T> using Result = std::expected<T, Error>;

//! Lift an untyped stream failure into a `Format` error at |offset|.
template <typename T>
Result<T> StreamResult(std::expected<T, std::string>&& result, u32 offset,
                       std::string_view what) {
  if (!result) {
    return std::unexpected(Error{
        .kind = ErrorKind::Format,
        .code = ErrorCode::Truncated,
        .message = fmt::format("{}: {}", what, result.error()),
        .offset = offset,
    });
  }
  return std::move(*result);
}

} // namespace d2anim
