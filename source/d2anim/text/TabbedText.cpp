#include "TabbedText.hpp"

#include <charconv>
#include <unordered_map>

namespace d2anim {

namespace txt {
std::string FrameColumn(u32 frame) {
  return fmt::format("FrameData{:03}", frame);
}
} // namespace txt

// A non-blank line (or a run of lines joined by a quoted line break)
struct Row {
  //! 0-based physical line the row starts on
  std::size_t line = 0;
  std::vector<std::string> cells;
};

static Error TextError(ErrorCode code, std::string message,
                       std::optional<std::size_t> row = std::nullopt) {
  return Error{
      .kind = ErrorKind::TabbedText,
      .code = code,
      .message = std::move(message),
      .row = row,
  };
}

// A quote only opens a quoted section at the start of a cell; anywhere else
// it is a literal character.
static Result<std::vector<Row>> SplitRows(std::string_view text) {
  std::vector<Row> rows;
  Row row;
  std::string cell;
  std::size_t line = 0;
  bool quoted = false;
  bool cell_started = false;
  bool row_has_content = false;

  const auto end_cell = [&] {
    row.cells.push_back(std::move(cell));
    cell.clear();
    cell_started = false;
  };
  const auto end_row = [&] {
    end_cell();
    if (row_has_content) {
      rows.push_back(std::move(row));
    }
    row = Row{.line = ++line};
    row_has_content = false;
  };

  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (quoted) {
      if (c == '\n') {
        ++line;
      }
      if (c != '"') {
        cell += c;
      } else if (i + 1 < text.size() && text[i + 1] == '"') {
        cell += '"';
        ++i;
      } else {
        quoted = false;
      }
      continue;
    }
    switch (c) {
    case '"':
      if (!cell_started) {
        quoted = true;
      } else {
        cell += c;
      }
      cell_started = true;
      row_has_content = true;
      break;
    case '\t':
      end_cell();
      row_has_content = true;
      break;
    case '\r':
      if (i + 1 < text.size() && text[i + 1] == '\n') {
        ++i;
      }
      end_row();
      break;
    case '\n':
      end_row();
      break;
    default:
      cell += c;
      cell_started = true;
      row_has_content = true;
      break;
    }
  }
  if (quoted) {
    return std::unexpected(
        TextError(ErrorCode::MalformedDocument,
                  "Unexpected end of file inside a quoted cell",
                  rows.empty() ? std::nullopt
                               : std::optional<std::size_t>(
                                     row.line - rows.front().line - 1)));
  }
  end_row();
  return rows;
}

namespace {

class RowReader {
public:
  RowReader(const std::vector<std::string>& header,
            const std::vector<std::string>& row, std::size_t index)
      : mHeader(header), mRow(row), mIndex(index) {}

  Result<std::string_view> cell(std::size_t column) const {
    if (column >= mRow.size()) {
      return std::unexpected(at(
          TextError(ErrorCode::MissingCell, "Missing cell", mIndex), column));
    }
    return mRow[column];
  }

  Result<s64> integer(std::size_t column) const {
    std::string_view s = TRY(cell(column));
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
      s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
      s.remove_suffix(1);
    if (s.starts_with('+')) {
      s.remove_prefix(1);
    }
    s64 value = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size()) {
      return std::unexpected(
          at(TextError(ErrorCode::NotAnInteger,
                       fmt::format("Cannot convert cell value \"{}\" to integer",
                                   mRow[column]),
                       mIndex),
             column));
    }
    return value;
  }

  //! Attach row and column to an error raised by a field factory.
  Error at(Error err, std::size_t column) const {
    err.kind = ErrorKind::TabbedText;
    err.row = mIndex;
    err.column = column;
    if (column < mHeader.size()) {
      err.column_name = mHeader[column];
    }
    return err;
  }

private:
  const std::vector<std::string>& mHeader;
  const std::vector<std::string>& mRow;
  std::size_t mIndex;
};

} // namespace

Result<std::vector<AnimationRecord>> ReadTabbedText(std::string_view text) {
  auto rows = TRY(SplitRows(text));
  if (rows.empty()) {
    return std::vector<AnimationRecord>{};
  }

  const std::vector<std::string>& header = rows.front().cells;
  std::unordered_map<std::string_view, std::size_t> columns;
  for (std::size_t i = 0; i < header.size(); ++i) {
    columns[header[i]] = i;
  }
  const auto find_column = [&](std::string_view name) -> Result<std::size_t> {
    auto it = columns.find(name);
    if (it == columns.end()) {
      auto err = TextError(ErrorCode::MissingColumn, "Missing column");
      err.column_name = std::string(name);
      return std::unexpected(err);
    }
    return it->second;
  };

  const std::size_t identifier_column =
      TRY(find_column(txt::kIdentifierColumn));
  const std::size_t frames_column =
      TRY(find_column(txt::kFramesPerDirectionColumn));
  const std::size_t speed_column = TRY(find_column(txt::kSpeedColumn));
  std::array<std::size_t, kFrameMax> frame_columns;
  for (u32 frame = 0; frame < kFrameMax; ++frame) {
    frame_columns[frame] = TRY(find_column(txt::FrameColumn(frame)));
  }

  std::vector<AnimationRecord> records;
  for (std::size_t r = 1; r < rows.size(); ++r) {
    // Counted in physical lines below the header, blank lines included
    RowReader row(header, rows[r].cells,
                  rows[r].line - rows.front().line - 1);

    const std::string_view identifier = TRY(row.cell(identifier_column));
    const s64 frames_per_direction = TRY(row.integer(frames_column));
    const s64 speed = TRY(row.integer(speed_column));

    std::vector<Trigger> triggers;
    for (u32 frame = 0; frame < kFrameMax; ++frame) {
      const s64 code = TRY(row.integer(frame_columns[frame]));
      if (code == 0) {
        continue;
      }
      auto trigger = Trigger::Create(frame, code);
      if (!trigger) {
        return std::unexpected(row.at(trigger.error(), frame_columns[frame]));
      }
      triggers.push_back(*trigger);
    }
    // One cell per frame, so frames cannot collide
    auto trigger_set = TriggerSet::Create(std::move(triggers));
    if (!trigger_set) {
      return std::unexpected(row.at(trigger_set.error(), frame_columns[0]));
    }

    auto record = AnimationRecord::Create(identifier, frames_per_direction,
                                          speed, std::move(*trigger_set));
    if (!record) {
      const auto& field = record.error().field;
      const std::size_t column = field == "identifier" ? identifier_column
                                 : field == "speed"    ? speed_column
                                                       : frames_column;
      return std::unexpected(row.at(record.error(), column));
    }
    records.push_back(std::move(*record));
  }
  return records;
}

static void AppendCell(std::string& out, std::string_view cell) {
  if (cell.find_first_of("\t\r\n\"") == std::string_view::npos) {
    out += cell;
    return;
  }
  out += '"';
  for (const char c : cell) {
    if (c == '"') {
      out += '"';
    }
    out += c;
  }
  out += '"';
}

std::string WriteTabbedText(std::span<const AnimationRecord> records) {
  std::string out;
  out += txt::kIdentifierColumn;
  out += '\t';
  out += txt::kFramesPerDirectionColumn;
  out += '\t';
  out += txt::kSpeedColumn;
  for (u32 frame = 0; frame < kFrameMax; ++frame) {
    out += '\t';
    out += txt::FrameColumn(frame);
  }
  out += "\r\n";

  for (const auto& record : records) {
    AppendCell(out, record.identifier());
    out += fmt::format("\t{}\t{}", record.framesPerDirection(),
                       record.speed());
    for (const u8 code : EncodeFrames(record.triggers())) {
      out += fmt::format("\t{}", code);
    }
    out += "\r\n";
  }
  return out;
}

} // namespace d2anim
