/**
 * Event record forwarded by the collaboration bridge, and its JSON wire form.
 */

#pragma once

#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <spdlog/fmt/fmt.h>

namespace collab {

/**
 * Scalar metadata value: string, integer, number or boolean.
 *
 * Implicit constructors let metadata be written as an initializer list:
 *   {{"tool", "nmap"}, {"exit_code", 0}, {"elevated", true}}
 */
class MetadataValue {
 public:
  enum class Kind { STRING, INTEGER, NUMBER, BOOLEAN };

  MetadataValue(const char* value) : value_(std::string(value ? value : "")) {}
  MetadataValue(std::string value) : value_(std::move(value)) {}
  MetadataValue(bool value) : value_(value) {}
  MetadataValue(int value) : value_(static_cast<std::int64_t>(value)) {}
  MetadataValue(long value) : value_(static_cast<std::int64_t>(value)) {}
  MetadataValue(long long value) : value_(static_cast<std::int64_t>(value)) {}
  MetadataValue(unsigned int value) : value_(static_cast<std::int64_t>(value)) {}
  // Values above INT64_MAX become NUMBER
  MetadataValue(unsigned long value) : value_(from_unsigned(value)) {}
  MetadataValue(unsigned long long value) : value_(from_unsigned(value)) {}
  MetadataValue(double value) : value_(value) {}

  Kind kind() const { return static_cast<Kind>(value_.index()); }

  const std::string& as_string() const { return std::get<std::string>(value_); }
  std::int64_t as_integer() const { return std::get<std::int64_t>(value_); }
  double as_number() const { return std::get<double>(value_); }
  bool as_boolean() const { return std::get<bool>(value_); }

  bool operator==(const MetadataValue& other) const {
    return value_ == other.value_;
  }
  bool operator!=(const MetadataValue& other) const { return !(*this == other); }

 private:
  // Alternative order must match Kind
  using Storage = std::variant<std::string, std::int64_t, double, bool>;

  static Storage from_unsigned(unsigned long long value) {
    if (value > static_cast<unsigned long long>(
                    std::numeric_limits<std::int64_t>::max())) {
      return Storage(std::in_place_type<double>, static_cast<double>(value));
    }
    return Storage(std::in_place_type<std::int64_t>, static_cast<std::int64_t>(value));
  }

  Storage value_;
};

using Metadata = std::map<std::string, MetadataValue>;

/**
 * One occurrence to forward to the collaboration endpoint.
 *
 * Immutable once constructed; only copied or moved into the queue and a batch.
 */
class Event {
 public:
  Event(std::string id, std::string type, std::string content,
        std::int64_t timestamp_ms, std::string operation_id,
        std::optional<std::string> session_id = std::nullopt,
        std::optional<std::string> user_id = std::nullopt,
        Metadata metadata = {})
      : id_(std::move(id)),
        type_(std::move(type)),
        content_(std::move(content)),
        timestamp_ms_(timestamp_ms),
        operation_id_(std::move(operation_id)),
        session_id_(std::move(session_id)),
        user_id_(std::move(user_id)),
        metadata_(std::move(metadata)) {}

  /**
   * Build an event stamped with a fresh id and the current wall-clock time.
   */
  static Event create(std::string type, std::string content,
                      std::string operation_id,
                      std::optional<std::string> session_id = std::nullopt,
                      std::optional<std::string> user_id = std::nullopt,
                      Metadata metadata = {});

  const std::string& id() const { return id_; }
  const std::string& type() const { return type_; }
  const std::string& content() const { return content_; }
  std::int64_t timestamp_ms() const { return timestamp_ms_; }
  const std::string& operation_id() const { return operation_id_; }
  const std::optional<std::string>& session_id() const { return session_id_; }
  const std::optional<std::string>& user_id() const { return user_id_; }
  const Metadata& metadata() const { return metadata_; }

 private:
  std::string id_;
  std::string type_;
  std::string content_;
  std::int64_t timestamp_ms_;
  std::string operation_id_;
  std::optional<std::string> session_id_;
  std::optional<std::string> user_id_;
  Metadata metadata_;
};

namespace detail {

/**
 * Random RFC 4122 version 4 identifier.
 */
inline std::string generate_event_id() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  static const char* hex = "0123456789abcdef";

  std::uint64_t hi = rng();
  std::uint64_t lo = rng();
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // RFC 4122 variant

  std::string out;
  out.reserve(36);
  auto write = [&](std::uint64_t v, int nibbles) {
    for (int i = 0; i < nibbles; ++i) {
      out.push_back(hex[(v >> 60) & 0xF]);
      v <<= 4;
    }
  };
  write(hi, 8);
  out.push_back('-');
  write(hi << 32, 4);
  out.push_back('-');
  write(hi << 48, 4);
  out.push_back('-');
  write(lo, 4);
  out.push_back('-');
  write(lo << 16, 12);
  return out;
}

inline std::int64_t now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

/**
 * Length of the well-formed UTF-8 sequence starting at str[i], or 0 if the
 * bytes there are not one (stray continuation, overlong form, surrogate,
 * code point above U+10FFFF, or truncated sequence).
 */
inline size_t utf8_sequence_length(const std::string& str, size_t i) {
  unsigned char lead = static_cast<unsigned char>(str[i]);
  if (lead < 0x80) {
    return 1;
  }

  size_t length = 0;
  unsigned char second_min = 0x80;
  unsigned char second_max = 0xBF;
  if (lead >= 0xC2 && lead <= 0xDF) {
    length = 2;
  } else if (lead == 0xE0) {
    length = 3;
    second_min = 0xA0;
  } else if (lead == 0xED) {
    length = 3;
    second_max = 0x9F;
  } else if (lead >= 0xE1 && lead <= 0xEF) {
    length = 3;
  } else if (lead == 0xF0) {
    length = 4;
    second_min = 0x90;
  } else if (lead >= 0xF1 && lead <= 0xF3) {
    length = 4;
  } else if (lead == 0xF4) {
    length = 4;
    second_max = 0x8F;
  } else {
    return 0;
  }

  if (i + length > str.size()) {
    return 0;
  }
  unsigned char second = static_cast<unsigned char>(str[i + 1]);
  if (second < second_min || second > second_max) {
    return 0;
  }
  for (size_t k = 2; k < length; ++k) {
    unsigned char next = static_cast<unsigned char>(str[i + k]);
    if (next < 0x80 || next > 0xBF) {
      return 0;
    }
  }
  return length;
}

// Invalid UTF-8 bytes are replaced one for one with U+FFFD
inline void append_json_string(std::string& out, const std::string& str) {
  out.push_back('"');
  size_t i = 0;
  while (i < str.size()) {
    char c = str[i];
    if (static_cast<unsigned char>(c) >= 0x80) {
      size_t length = utf8_sequence_length(str, i);
      if (length == 0) {
        out += "\\ufffd";
        ++i;
      } else {
        out.append(str, i, length);
        i += length;
      }
      continue;
    }

    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\b':
        out += "\\b";
        break;
      case '\f':
        out += "\\f";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x",
                        static_cast<unsigned int>(static_cast<unsigned char>(c)));
          out += buf;
        } else {
          out.push_back(c);
        }
        break;
    }
    ++i;
  }
  out.push_back('"');
}

inline void append_optional_string(std::string& out,
                                   const std::optional<std::string>& value) {
  if (value) {
    append_json_string(out, *value);
  } else {
    out += "null";
  }
}

inline void append_metadata_value(std::string& out, const MetadataValue& value) {
  switch (value.kind()) {
    case MetadataValue::Kind::STRING:
      append_json_string(out, value.as_string());
      break;
    case MetadataValue::Kind::INTEGER:
      out += std::to_string(value.as_integer());
      break;
    case MetadataValue::Kind::NUMBER:
      // JSON has no NaN/Infinity
      if (std::isfinite(value.as_number())) {
        out += fmt::format("{}", value.as_number());
      } else {
        out += "null";
      }
      break;
    case MetadataValue::Kind::BOOLEAN:
      out += value.as_boolean() ? "true" : "false";
      break;
  }
}

}  // namespace detail

inline Event Event::create(std::string type, std::string content,
                           std::string operation_id,
                           std::optional<std::string> session_id,
                           std::optional<std::string> user_id,
                           Metadata metadata) {
  return Event(detail::generate_event_id(), std::move(type), std::move(content),
               detail::now_ms(), std::move(operation_id), std::move(session_id),
               std::move(user_id), std::move(metadata));
}

/**
 * Serialize one event as a JSON object (field order matches the ingest API).
 */
inline std::string to_json(const Event& event) {
  std::string json;
  json.reserve(128 + event.content().size());

  json += "{\"id\":";
  detail::append_json_string(json, event.id());
  json += ",\"type\":";
  detail::append_json_string(json, event.type());
  json += ",\"content\":";
  detail::append_json_string(json, event.content());
  json += ",\"timestamp\":";
  json += std::to_string(event.timestamp_ms());
  json += ",\"operation_id\":";
  detail::append_json_string(json, event.operation_id());
  json += ",\"session_id\":";
  detail::append_optional_string(json, event.session_id());
  json += ",\"user_id\":";
  detail::append_optional_string(json, event.user_id());

  json += ",\"metadata\":{";
  bool first = true;
  for (const auto& [key, value] : event.metadata()) {
    if (!first) {
      json.push_back(',');
    }
    first = false;
    detail::append_json_string(json, key);
    json.push_back(':');
    detail::append_metadata_value(json, value);
  }
  json += "}}";
  return json;
}

/**
 * Serialize a batch as the request body: {"events":[...]}.
 */
inline std::string serialize_batch(const std::vector<Event>& events) {
  std::string payload = "{\"events\":[";
  for (size_t i = 0; i < events.size(); ++i) {
    if (i > 0) {
      payload.push_back(',');
    }
    payload += to_json(events[i]);
  }
  payload += "]}";
  return payload;
}

}  // namespace collab
