// Minimal JSON parser (no external dependencies).
//
// parseJson() reads a full JSON document into a JsonValue tree and keeps
// object keys in document order, which the study matrix loader relies on.
// parseJsonObject() is the flat key-value view used for configuration input.

#ifndef IPED_CORE_JSON_PARSER_H
#define IPED_CORE_JSON_PARSER_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace iped {

/// @brief A JSON value. Objects and arrays hold their children by value.
struct JsonValue {
  enum Type { String, Number, Bool, Null, Object, Array };
  Type type = Null;
  std::string string_val;
  double number_val = 0.0;
  bool bool_val = false;

  /// Object members in document order (keys and values are parallel).
  std::vector<std::string> object_keys;
  std::vector<JsonValue> object_values;

  /// Array elements.
  std::vector<JsonValue> array_items;

  /// @brief Get value as integer, with default.
  int asInt(int default_val = 0) const;

  /// @brief Get value as unsigned integer, with default.
  uint32_t asUint(uint32_t default_val = 0) const;

  /// @brief Get value as double, with default.
  double asDouble(double default_val = 0.0) const;

  /// @brief Get value as boolean, with default.
  bool asBool(bool default_val = false) const;

  /// @brief Get value as string, with default.
  std::string asString(const std::string& default_val = "") const;

  /// @brief True if this is a Number holding an integral value.
  bool isInteger() const;

  /// @brief Look up an object member.
  /// @param name Member key.
  /// @return Pointer to the first member with that key, or nullptr.
  const JsonValue* find(std::string_view name) const;
};

/// @brief Parse a complete JSON document.
///
/// Trailing non-whitespace after the root value is an error. Nesting is
/// limited to 64 levels.
///
/// @param json Pointer to JSON text.
/// @param length Length of JSON text.
/// @param[out] out Parsed root value.
/// @param[out] error Optional error description (with byte offset).
/// @return True on success.
bool parseJson(const char* json, size_t length, JsonValue& out,
               std::string* error = nullptr);

/// @brief Parse a flat JSON object into a key-value map.
///
/// Only top-level keys are returned. Nested objects and arrays are kept as
/// Object/Array values but callers reading configuration ignore them.
///
/// @param json Pointer to JSON string.
/// @param length Length of JSON string.
/// @return Map of key-value pairs. Empty map on parse error.
std::map<std::string, JsonValue> parseJsonObject(const char* json, size_t length);

}  // namespace iped

#endif  // IPED_CORE_JSON_PARSER_H
