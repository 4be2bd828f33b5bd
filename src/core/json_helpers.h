// Minimal JSON serialization writer (no external dependencies).
//
// Builds realization and analysis output as a JSON string. Does not parse
// JSON; see core/json_parser.h for input.

#ifndef CONTINUO_CORE_JSON_HELPERS_H
#define CONTINUO_CORE_JSON_HELPERS_H

#include <string>
#include <string_view>
#include <vector>

namespace continuo {

/// @brief Incremental JSON writer.
///
/// Usage:
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("soprano");
///   writer.value(72);
///   writer.endObject();
///   // writer.toString() -> {"soprano":72}
/// @endcode
///
/// Inserts commas automatically. The caller must balance begin/end calls.
class JsonWriter {
 public:
  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  /// @brief Write an object key; the next call must write its value.
  void key(std::string_view name);

  void value(std::string_view val);
  void value(const char* val) { value(std::string_view(val)); }
  void value(int val);
  void value(size_t val);
  /// Non-finite values are written as null.
  void value(double val);
  void value(bool val);

  /// @brief Compact JSON text.
  const std::string& toString() const { return buffer_; }

 private:
  /// Emit a separating comma if the current container already has an element.
  void beforeElement();

  static std::string escapeString(std::string_view input);

  std::string buffer_;
  std::vector<bool> has_element_;  ///< One entry per open container.
  bool after_key_ = false;
};

}  // namespace continuo

#endif  // CONTINUO_CORE_JSON_HELPERS_H
