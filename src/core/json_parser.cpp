// Implementation of minimal flat-object JSON parser.

#include "core/json_parser.h"

#include <cctype>
#include <cstdlib>
#include <cstring>
#include <limits>

namespace continuo {

int JsonValue::asInt(int default_val) const {
  if (type != Number) return default_val;
  // Saturate; the cast is undefined outside the int range.
  if (number_val >= static_cast<double>(std::numeric_limits<int>::max())) {
    return std::numeric_limits<int>::max();
  }
  if (number_val <= static_cast<double>(std::numeric_limits<int>::min())) {
    return std::numeric_limits<int>::min();
  }
  return static_cast<int>(number_val);
}

float JsonValue::asFloat(float default_val) const {
  if (type != Number) return default_val;
  if (number_val >= static_cast<double>(std::numeric_limits<float>::max())) {
    return std::numeric_limits<float>::max();
  }
  if (number_val <= -static_cast<double>(std::numeric_limits<float>::max())) {
    return -std::numeric_limits<float>::max();
  }
  return static_cast<float>(number_val);
}

bool JsonValue::asBool(bool default_val) const {
  if (type == Bool) return bool_val;
  return default_val;
}

std::string JsonValue::asString(const std::string& default_val) const {
  if (type == String) return string_val;
  return default_val;
}

namespace {

/// Cursor over the input text.
struct JsonCursor {
  const char* json;
  size_t length;
  size_t pos = 0;

  bool atEnd() const { return pos >= length; }
  char peek() const { return json[pos]; }

  void skipWhitespace() {
    while (pos < length && std::isspace(static_cast<unsigned char>(json[pos]))) ++pos;
  }

  bool consumeLiteral(const char* literal) {
    size_t len = std::strlen(literal);
    if (length - pos < len || std::strncmp(json + pos, literal, len) != 0) return false;
    pos += len;
    return true;
  }
};

void setError(std::string* error, const char* what, size_t pos) {
  if (error) *error = std::string(what) + " at offset " + std::to_string(pos);
}

/// @brief Parse a string literal (cursor at opening quote).
bool parseString(JsonCursor& cur, std::string& out) {
  if (cur.atEnd() || cur.peek() != '"') return false;
  ++cur.pos;
  out.clear();
  while (!cur.atEnd() && cur.peek() != '"') {
    char chr = cur.peek();
    if (chr == '\\' && cur.pos + 1 < cur.length) {
      ++cur.pos;
      switch (cur.peek()) {
        case 'n':  out += '\n'; break;
        case 't':  out += '\t'; break;
        case 'r':  out += '\r'; break;
        default:   out += cur.peek(); break;
      }
    } else {
      out += chr;
    }
    ++cur.pos;
  }
  if (cur.atEnd()) return false;  // unterminated
  ++cur.pos;
  return true;
}

/// @brief Parse a number without exceptions.
bool parseNumber(JsonCursor& cur, double& out) {
  size_t start = cur.pos;
  if (!cur.atEnd() && (cur.peek() == '-' || cur.peek() == '+')) ++cur.pos;
  while (!cur.atEnd() && (std::isdigit(static_cast<unsigned char>(cur.peek())) ||
                          cur.peek() == '.' || cur.peek() == 'e' || cur.peek() == 'E' ||
                          cur.peek() == '-' || cur.peek() == '+')) {
    ++cur.pos;
  }
  if (cur.pos == start) return false;

  std::string num_str(cur.json + start, cur.pos - start);
  char* end = nullptr;
  out = std::strtod(num_str.c_str(), &end);
  return end != nullptr && *end == '\0';
}

/// @brief Skip a nested object or array (cursor at its opening bracket).
bool skipNested(JsonCursor& cur) {
  int depth = 0;
  std::string ignored;
  while (!cur.atEnd()) {
    char chr = cur.peek();
    if (chr == '"') {
      if (!parseString(cur, ignored)) return false;
      continue;
    }
    if (chr == '{' || chr == '[') ++depth;
    if (chr == '}' || chr == ']') --depth;
    ++cur.pos;
    if (depth == 0) return true;
  }
  return false;
}

/// @brief Only whitespace may follow the closing brace.
bool expectDocumentEnd(JsonCursor& cur, std::string* error) {
  cur.skipWhitespace();
  if (!cur.atEnd()) {
    setError(error, "unexpected text after object", cur.pos);
    return false;
  }
  return true;
}

}  // namespace

bool parseJsonObject(const char* json, size_t length, JsonObject& out,
                     std::string* error) {
  out.clear();
  if (!json || length == 0) {
    setError(error, "empty document", 0);
    return false;
  }

  JsonCursor cur{json, length};
  cur.skipWhitespace();
  if (cur.atEnd() || cur.peek() != '{') {
    setError(error, "expected '{'", cur.pos);
    return false;
  }
  ++cur.pos;

  cur.skipWhitespace();
  if (!cur.atEnd() && cur.peek() == '}') {
    ++cur.pos;
    return expectDocumentEnd(cur, error);
  }

  while (true) {
    cur.skipWhitespace();
    if (cur.atEnd()) {
      setError(error, "unterminated object", cur.pos);
      return false;
    }

    std::string key;
    if (!parseString(cur, key)) {
      setError(error, "expected member name", cur.pos);
      return false;
    }

    cur.skipWhitespace();
    if (cur.atEnd() || cur.peek() != ':') {
      setError(error, "expected ':'", cur.pos);
      return false;
    }
    ++cur.pos;
    cur.skipWhitespace();
    if (cur.atEnd()) {
      setError(error, "missing value", cur.pos);
      return false;
    }

    JsonValue val;
    char chr = cur.peek();
    if (chr == '"') {
      val.type = JsonValue::String;
      if (!parseString(cur, val.string_val)) {
        setError(error, "unterminated string", cur.pos);
        return false;
      }
      out[key] = val;
    } else if (cur.consumeLiteral("true")) {
      val.type = JsonValue::Bool;
      val.bool_val = true;
      out[key] = val;
    } else if (cur.consumeLiteral("false")) {
      val.type = JsonValue::Bool;
      val.bool_val = false;
      out[key] = val;
    } else if (cur.consumeLiteral("null")) {
      out[key] = val;
    } else if (chr == '{' || chr == '[') {
      if (!skipNested(cur)) {
        setError(error, "unterminated nested value", cur.pos);
        return false;
      }
    } else {
      val.type = JsonValue::Number;
      if (!parseNumber(cur, val.number_val)) {
        setError(error, "invalid value", cur.pos);
        return false;
      }
      out[key] = val;
    }

    // Each member is followed by ',' and another member, or by the closing '}'.
    cur.skipWhitespace();
    if (cur.atEnd()) {
      setError(error, "unterminated object", cur.pos);
      return false;
    }
    if (cur.peek() == '}') {
      ++cur.pos;
      return expectDocumentEnd(cur, error);
    }
    if (cur.peek() != ',') {
      setError(error, "expected ',' or '}'", cur.pos);
      return false;
    }
    ++cur.pos;
  }
}

}  // namespace continuo
