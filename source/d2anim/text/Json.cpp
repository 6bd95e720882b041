#include "Json.hpp"

#include <charconv>
#include <limits>
#include <nlohmann/json.hpp>

namespace d2anim {

using json = nlohmann::ordered_json;

static Error JsonError(std::string message,
                       std::optional<std::size_t> record = std::nullopt,
                       std::string field = {}) {
  return Error{
      .kind = ErrorKind::Json,
      .code = ErrorCode::MalformedDocument,
      .message = std::move(message),
      .record = record,
      .field = std::move(field),
  };
}

static Result<s64> GetInteger(const json& value, std::size_t record,
                              std::string_view field) {
  if (value.is_number_unsigned()) {
    const auto u = value.get<u64>();
    if (u > static_cast<u64>(std::numeric_limits<s64>::max())) {
      // Beyond every field's range; report it as a value violation
      return std::unexpected(Error{
          .kind = ErrorKind::Validation,
          .code = ErrorCode::ValueOutOfRange,
          .message = fmt::format("{} is out of range", u),
          .record = record,
          .field = std::string(field),
      });
    }
    return static_cast<s64>(u);
  }
  if (value.is_number_integer()) {
    return value.get<s64>();
  }
  return std::unexpected(JsonError(
      fmt::format("Expected an integer, got {}", value.type_name()), record,
      std::string(field)));
}

// First of |keys| present in |object|
static const json* FindMember(const json& object,
                              std::initializer_list<std::string_view> keys) {
  for (const auto key : keys) {
    auto it = object.find(std::string(key));
    if (it != object.end()) {
      return &*it;
    }
  }
  return nullptr;
}

static Result<const json*>
RequireMember(const json& object, std::size_t record, std::string_view field,
              std::initializer_list<std::string_view> keys) {
  const json* value = FindMember(object, keys);
  if (value == nullptr) {
    return std::unexpected(
        JsonError(fmt::format("Missing key \"{}\"", field), record,
                  std::string(field)));
  }
  return value;
}

static Result<Trigger> ReadTrigger(s64 frame, const json& code,
                                   std::size_t record) {
  const s64 c = TRY(GetInteger(code, record, "triggers"));
  auto trigger = Trigger::Create(frame, c);
  if (!trigger) {
    auto err = trigger.error();
    err.record = record;
    return std::unexpected(err);
  }
  return *trigger;
}

static Result<TriggerSet> ReadTriggers(const json& node, std::size_t record) {
  std::vector<Trigger> triggers;
  if (node.is_object()) {
    for (const auto& item : node.items()) {
      const std::string& key = item.key();
      const json& code = item.value();
      s64 frame = 0;
      const auto [ptr, ec] =
          std::from_chars(key.data(), key.data() + key.size(), frame);
      if (key.empty() || ec != std::errc{} || ptr != key.data() + key.size()) {
        return std::unexpected(JsonError(
            fmt::format("Trigger key \"{}\" is not a frame number", key),
            record, "triggers"));
      }
      triggers.push_back(TRY(ReadTrigger(frame, code, record)));
    }
  } else if (node.is_array()) {
    for (const auto& pair : node) {
      if (!pair.is_array() || pair.size() != 2) {
        return std::unexpected(
            JsonError("Trigger entries must be [frame, code] pairs", record,
                      "triggers"));
      }
      const s64 frame = TRY(GetInteger(pair[0], record, "triggers"));
      triggers.push_back(TRY(ReadTrigger(frame, pair[1], record)));
    }
  } else {
    return std::unexpected(JsonError(
        fmt::format("Expected an object or array, got {}", node.type_name()),
        record, "triggers"));
  }

  auto set = TriggerSet::Create(std::move(triggers));
  if (!set) {
    auto err = set.error();
    err.record = record;
    return std::unexpected(err);
  }
  return std::move(*set);
}

static Result<AnimationRecord> ReadRecordObject(const json& node,
                                                std::size_t record) {
  if (!node.is_object()) {
    return std::unexpected(JsonError(
        fmt::format("Expected an object, got {}", node.type_name()), record));
  }
  const json* identifier =
      TRY(RequireMember(node, record, "identifier", {"identifier", "cof_name"}));
  const json* frames = TRY(RequireMember(
      node, record, "frames_per_direction", {"frames_per_direction"}));
  const json* speed =
      TRY(RequireMember(node, record, "speed", {"speed", "animation_speed"}));
  const json* triggers =
      TRY(RequireMember(node, record, "triggers", {"triggers"}));

  if (!identifier->is_string()) {
    return std::unexpected(JsonError(
        fmt::format("Expected a string, got {}", identifier->type_name()),
        record, "identifier"));
  }
  const s64 frames_per_direction =
      TRY(GetInteger(*frames, record, "frames_per_direction"));
  const s64 animation_speed = TRY(GetInteger(*speed, record, "speed"));
  auto trigger_set = TRY(ReadTriggers(*triggers, record));

  auto result = AnimationRecord::Create(identifier->get<std::string>(),
                                        frames_per_direction, animation_speed,
                                        std::move(trigger_set));
  if (!result) {
    auto err = result.error();
    err.record = record;
    return std::unexpected(err);
  }
  return std::move(*result);
}

Result<std::vector<AnimationRecord>> ReadJson(std::string_view text) {
  const json doc = json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded()) {
    return std::unexpected(JsonError("Document is not valid JSON"));
  }
  if (!doc.is_array()) {
    return std::unexpected(JsonError(
        fmt::format("Expected a top-level array, got {}", doc.type_name())));
  }

  std::vector<AnimationRecord> records;
  records.reserve(doc.size());
  for (std::size_t i = 0; i < doc.size(); ++i) {
    records.push_back(TRY(ReadRecordObject(doc[i], i)));
  }
  return records;
}

std::string WriteJson(std::span<const AnimationRecord> records) {
  json doc = json::array();
  for (const auto& record : records) {
    json triggers = json::object();
    for (const auto& trigger : record.triggers()) {
      triggers[std::to_string(trigger.frame())] = trigger.code();
    }
    json entry = {
        {"identifier", record.identifier()},
        {"frames_per_direction", record.framesPerDirection()},
        {"speed", record.speed()},
        {"triggers", std::move(triggers)},
    };
    doc.push_back(std::move(entry));
  }
  return doc.dump(2);
}

} // namespace d2anim
