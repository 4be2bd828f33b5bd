/// @file
/// @brief Implementation of the minimal JSON writer.

#include "core/json_helpers.h"

#include <cmath>
#include <cstdio>
#include <sstream>

namespace continuo {

void JsonWriter::beforeElement() {
  if (after_key_) {
    after_key_ = false;
    return;
  }
  if (!has_element_.empty()) {
    if (has_element_.back()) buffer_ += ',';
    has_element_.back() = true;
  }
}

void JsonWriter::beginObject() {
  beforeElement();
  buffer_ += '{';
  has_element_.push_back(false);
}

void JsonWriter::endObject() {
  buffer_ += '}';
  if (!has_element_.empty()) has_element_.pop_back();
}

void JsonWriter::beginArray() {
  beforeElement();
  buffer_ += '[';
  has_element_.push_back(false);
}

void JsonWriter::endArray() {
  buffer_ += ']';
  if (!has_element_.empty()) has_element_.pop_back();
}

void JsonWriter::key(std::string_view name) {
  beforeElement();
  buffer_ += '"';
  buffer_ += escapeString(name);
  buffer_ += "\":";
  after_key_ = true;
}

void JsonWriter::value(std::string_view val) {
  beforeElement();
  buffer_ += '"';
  buffer_ += escapeString(val);
  buffer_ += '"';
}

void JsonWriter::value(int val) {
  beforeElement();
  buffer_ += std::to_string(val);
}

void JsonWriter::value(size_t val) {
  beforeElement();
  buffer_ += std::to_string(val);
}

void JsonWriter::value(double val) {
  beforeElement();
  if (std::isnan(val) || std::isinf(val)) {
    buffer_ += "null";
    return;
  }
  std::ostringstream oss;
  oss << val;
  buffer_ += oss.str();
}

void JsonWriter::value(bool val) {
  beforeElement();
  buffer_ += val ? "true" : "false";
}

std::string JsonWriter::escapeString(std::string_view input) {
  std::string result;
  result.reserve(input.size());
  for (char chr : input) {
    switch (chr) {
      case '"':  result += "\\\""; break;
      case '\\': result += "\\\\"; break;
      case '\n': result += "\\n";  break;
      case '\r': result += "\\r";  break;
      case '\t': result += "\\t";  break;
      default:
        if (static_cast<unsigned char>(chr) < 0x20) {
          char hex_buf[8];
          std::snprintf(hex_buf, sizeof(hex_buf), "\\u%04x",
                        static_cast<unsigned>(static_cast<unsigned char>(chr)));
          result += hex_buf;
        } else {
          result += chr;
        }
        break;
    }
  }
  return result;
}

}  // namespace continuo
