// Minimal flat-object JSON parser for configuration input (no external dependencies).
//
// Handles a flat object with string, number, boolean and null values. Nested
// objects and arrays are skipped.

#ifndef CONTINUO_CORE_JSON_PARSER_H
#define CONTINUO_CORE_JSON_PARSER_H

#include <cstddef>
#include <map>
#include <string>

namespace continuo {

/// @brief A single JSON value (string, number, or boolean).
struct JsonValue {
  enum Type { String, Number, Bool, Null };
  Type type = Null;
  std::string string_val;
  double number_val = 0.0;
  bool bool_val = false;

  /// @brief Get value as integer, with default.
  int asInt(int default_val = 0) const;

  /// @brief Get value as float, with default.
  float asFloat(float default_val = 0.0f) const;

  /// @brief Get value as boolean, with default.
  bool asBool(bool default_val = false) const;

  /// @brief Get value as string, with default.
  std::string asString(const std::string& default_val = "") const;
};

/// Parsed top-level members keyed by name.
using JsonObject = std::map<std::string, JsonValue>;

/// @brief Parse a flat JSON object.
///
/// @param json Pointer to JSON text.
/// @param length Length of the text.
/// @param out Receives the members (cleared first).
/// @param error If non-null, receives the reason and byte offset of a failure.
/// @return False on malformed input; out then holds the members read so far.
bool parseJsonObject(const char* json, size_t length, JsonObject& out,
                     std::string* error);

}  // namespace continuo

#endif  // CONTINUO_CORE_JSON_PARSER_H
