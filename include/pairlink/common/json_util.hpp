#pragma once

#include "pairlink/common/result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

namespace pairlink::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Escape and wrap a string in double quotes.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

enum class JsonKind { String, Number, Bool, Null, Object, Array };

struct JsonField {
  JsonKind kind = JsonKind::Null;
  /// Unescaped text for strings, raw text for everything else.
  std::string text;
};

/// Top-level members of one JSON object. Nested values are kept as raw text.
class JsonObject {
public:
  using Map = std::unordered_map<std::string, JsonField>;

  JsonObject() = default;
  explicit JsonObject(Map fields) : fields_(std::move(fields)) {}

  [[nodiscard]] bool has(const std::string &key) const { return fields_.contains(key); }
  [[nodiscard]] std::size_t size() const { return fields_.size(); }
  [[nodiscard]] const Map &fields() const { return fields_; }

  /// String member, or nullopt when missing or not a string.
  [[nodiscard]] std::optional<std::string> get_string(const std::string &key) const;

  /// Boolean member. Also accepts the strings "true" and "false".
  [[nodiscard]] std::optional<bool> get_bool(const std::string &key) const;

private:
  Map fields_;
};

/// Parse a document that must consist of exactly one JSON object. A repeated member keeps
/// its last value. Strings must be valid UTF-8 and use only the escapes JSON defines.
[[nodiscard]] Result<JsonObject> json_parse_object(const std::string &json);

} // namespace pairlink::common
