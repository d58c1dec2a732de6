#include "pairlink/common/json_util.hpp"

#include <cctype>
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace pairlink::common {

namespace {

constexpr std::size_t kMaxDepth = 32;

void append_utf8(std::string &out, std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

bool parse_hex4(const std::string &raw, std::size_t pos, std::uint32_t &out) {
  if (pos + 4 > raw.size()) {
    return false;
  }
  out = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = raw[i];
    out <<= 4;
    if (ch >= '0' && ch <= '9') {
      out |= static_cast<std::uint32_t>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      out |= static_cast<std::uint32_t>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      out |= static_cast<std::uint32_t>(ch - 'A' + 10);
    } else {
      return false;
    }
  }
  return true;
}

// Length of the well-formed UTF-8 sequence starting at pos, or 0 when it is not one.
std::size_t utf8_sequence_length(const std::string &text, const std::size_t pos) {
  const auto byte = [&text](const std::size_t i) {
    return i < text.size() ? static_cast<unsigned char>(text[i]) : 0U;
  };
  const unsigned char lead = byte(pos);
  if (lead < 0x80) {
    return 1;
  }
  std::size_t length = 0;
  unsigned char low = 0x80;
  unsigned char high = 0xBF;
  if (lead >= 0xC2 && lead <= 0xDF) {
    length = 2;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    length = 3;
    if (lead == 0xE0) {
      low = 0xA0;
    } else if (lead == 0xED) {
      high = 0x9F;
    }
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    length = 4;
    if (lead == 0xF0) {
      low = 0x90;
    } else if (lead == 0xF4) {
      high = 0x8F;
    }
  } else {
    return 0;
  }
  for (std::size_t i = 1; i < length; ++i) {
    const unsigned char next = byte(pos + i);
    const unsigned char min = i == 1 ? low : 0x80;
    const unsigned char max = i == 1 ? high : 0xBF;
    if (next < min || next > max) {
      return 0;
    }
  }
  return length;
}

class Scanner {
public:
  explicit Scanner(const std::string &text) : text_(text) {}

  bool parse_object(JsonObject::Map &out) {
    pos_ = json_skip_ws(text_, pos_);
    if (!expect('{')) {
      return fail("expected '{'");
    }
    pos_ = json_skip_ws(text_, pos_);
    if (peek() == '}') {
      ++pos_;
      return true;
    }
    while (true) {
      pos_ = json_skip_ws(text_, pos_);
      std::string key;
      if (!parse_string(key)) {
        return fail("expected member name");
      }
      pos_ = json_skip_ws(text_, pos_);
      if (!expect(':')) {
        return fail("expected ':'");
      }
      pos_ = json_skip_ws(text_, pos_);
      JsonField field;
      if (!parse_value(field, 1)) {
        return false;
      }
      out[key] = std::move(field);
      pos_ = json_skip_ws(text_, pos_);
      if (expect(',')) {
        continue;
      }
      if (expect('}')) {
        return true;
      }
      return fail("expected ',' or '}'");
    }
  }

  [[nodiscard]] bool at_end() const { return json_skip_ws(text_, pos_) >= text_.size(); }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] std::size_t position() const { return pos_; }

private:
  [[nodiscard]] char peek() const { return pos_ < text_.size() ? text_[pos_] : '\0'; }

  bool expect(const char ch) {
    if (peek() != ch) {
      return false;
    }
    ++pos_;
    return true;
  }

  bool fail(const std::string &message) {
    if (error_.empty()) {
      error_ = message + " at offset " + std::to_string(pos_);
    }
    return false;
  }

  bool parse_string(std::string &out) {
    if (peek() != '"') {
      return false;
    }
    const auto end = json_find_string_end(text_, pos_);
    if (end == std::string::npos) {
      return fail("unterminated string");
    }
    std::string decoded;
    decoded.reserve(end - pos_ - 1);
    std::size_t i = pos_ + 1;
    while (i < end) {
      const auto ch = static_cast<unsigned char>(text_[i]);
      if (ch < 0x20) {
        pos_ = i;
        return fail("control character in string");
      }
      if (ch == '\\') {
        if (!decode_escape(i, decoded)) {
          return false;
        }
        continue;
      }
      const std::size_t length = utf8_sequence_length(text_, i);
      if (length == 0 || i + length > end) {
        pos_ = i;
        return fail("invalid UTF-8 in string");
      }
      decoded.append(text_, i, length);
      i += length;
    }
    out = std::move(decoded);
    pos_ = end + 1;
    return true;
  }

  // Decodes the escape at text_[i] ('\\') and advances i past it.
  bool decode_escape(std::size_t &i, std::string &out) {
    const char kind = i + 1 < text_.size() ? text_[i + 1] : '\0';
    switch (kind) {
    case '"':
    case '\\':
    case '/':
      out.push_back(kind);
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'u':
      return decode_unicode_escape(i, out);
    default:
      pos_ = i;
      return fail("invalid escape in string");
    }
    i += 2;
    return true;
  }

  bool decode_unicode_escape(std::size_t &i, std::string &out) {
    std::uint32_t cp = 0;
    if (!parse_hex4(text_, i + 2, cp)) {
      pos_ = i;
      return fail("invalid \\u escape");
    }
    std::size_t next = i + 6;
    if (cp >= 0xDC00 && cp <= 0xDFFF) {
      pos_ = i;
      return fail("unpaired surrogate in string");
    }
    if (cp >= 0xD800 && cp <= 0xDBFF) {
      std::uint32_t low = 0;
      if (text_.compare(next, 2, "\\u") != 0 || !parse_hex4(text_, next + 2, low) ||
          low < 0xDC00 || low > 0xDFFF) {
        pos_ = i;
        return fail("unpaired surrogate in string");
      }
      cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
      next += 6;
    }
    append_utf8(out, cp);
    i = next;
    return true;
  }

  bool parse_literal(const char *word, JsonKind kind, JsonField &out) {
    const std::string literal(word);
    if (text_.compare(pos_, literal.size(), literal) != 0) {
      return fail("invalid literal");
    }
    out.kind = kind;
    out.text = literal;
    pos_ += literal.size();
    return true;
  }

  bool parse_number(JsonField &out) {
    const std::size_t start = pos_;
    if (peek() == '-') {
      ++pos_;
    }
    if (peek() == '0') {
      ++pos_;
    } else if (std::isdigit(static_cast<unsigned char>(peek())) != 0) {
      while (std::isdigit(static_cast<unsigned char>(peek())) != 0) {
        ++pos_;
      }
    } else {
      return fail("invalid number");
    }
    if (peek() == '.') {
      ++pos_;
      if (std::isdigit(static_cast<unsigned char>(peek())) == 0) {
        return fail("invalid number");
      }
      while (std::isdigit(static_cast<unsigned char>(peek())) != 0) {
        ++pos_;
      }
    }
    if (peek() == 'e' || peek() == 'E') {
      ++pos_;
      if (peek() == '+' || peek() == '-') {
        ++pos_;
      }
      if (std::isdigit(static_cast<unsigned char>(peek())) == 0) {
        return fail("invalid number");
      }
      while (std::isdigit(static_cast<unsigned char>(peek())) != 0) {
        ++pos_;
      }
    }
    out.kind = JsonKind::Number;
    out.text = text_.substr(start, pos_ - start);
    return true;
  }

  bool skip_container(char open, char close, std::size_t depth) {
    ++pos_;
    pos_ = json_skip_ws(text_, pos_);
    if (expect(close)) {
      return true;
    }
    while (true) {
      pos_ = json_skip_ws(text_, pos_);
      if (open == '{') {
        std::string key;
        if (!parse_string(key)) {
          return fail("expected member name");
        }
        pos_ = json_skip_ws(text_, pos_);
        if (!expect(':')) {
          return fail("expected ':'");
        }
        pos_ = json_skip_ws(text_, pos_);
      }
      JsonField ignored;
      if (!parse_value(ignored, depth + 1)) {
        return false;
      }
      pos_ = json_skip_ws(text_, pos_);
      if (expect(',')) {
        continue;
      }
      if (expect(close)) {
        return true;
      }
      return fail(std::string("expected ',' or '") + close + "'");
    }
  }

  bool parse_value(JsonField &out, std::size_t depth) {
    if (depth > kMaxDepth) {
      return fail("nesting too deep");
    }
    const char ch = peek();
    if (ch == '"') {
      out.kind = JsonKind::String;
      return parse_string(out.text);
    }
    if (ch == '{' || ch == '[') {
      const std::size_t start = pos_;
      const char close = ch == '{' ? '}' : ']';
      if (!skip_container(ch, close, depth)) {
        return false;
      }
      out.kind = ch == '{' ? JsonKind::Object : JsonKind::Array;
      out.text = text_.substr(start, pos_ - start);
      return true;
    }
    if (ch == 't') {
      return parse_literal("true", JsonKind::Bool, out);
    }
    if (ch == 'f') {
      return parse_literal("false", JsonKind::Bool, out);
    }
    if (ch == 'n') {
      return parse_literal("null", JsonKind::Null, out);
    }
    if (ch == '-' || std::isdigit(static_cast<unsigned char>(ch)) != 0) {
      return parse_number(out);
    }
    return fail("unexpected character");
  }

  const std::string &text_;
  std::size_t pos_ = 0;
  std::string error_;
};

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        std::ostringstream hex;
        hex << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(static_cast<unsigned char>(ch));
        escaped += hex.str();
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_quote(const std::string &value) { return "\"" + json_escape(value) + "\""; }

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::optional<std::string> JsonObject::get_string(const std::string &key) const {
  const auto it = fields_.find(key);
  if (it == fields_.end() || it->second.kind != JsonKind::String) {
    return std::nullopt;
  }
  return it->second.text;
}

std::optional<bool> JsonObject::get_bool(const std::string &key) const {
  const auto it = fields_.find(key);
  if (it == fields_.end()) {
    return std::nullopt;
  }
  const auto &field = it->second;
  if (field.kind != JsonKind::Bool && field.kind != JsonKind::String) {
    return std::nullopt;
  }
  if (field.text == "true") {
    return true;
  }
  if (field.text == "false") {
    return false;
  }
  return std::nullopt;
}

Result<JsonObject> json_parse_object(const std::string &json) {
  Scanner scanner(json);
  JsonObject::Map fields;
  if (!scanner.parse_object(fields)) {
    return Result<JsonObject>::failure(ErrorCode::InvalidPayload,
                                       "invalid JSON: " + scanner.error(), json);
  }
  if (!scanner.at_end()) {
    return Result<JsonObject>::failure(
        ErrorCode::InvalidPayload,
        "invalid JSON: trailing characters at offset " + std::to_string(scanner.position()),
        json);
  }
  return Result<JsonObject>::success(JsonObject(std::move(fields)));
}

} // namespace pairlink::common
