// Minimal JSON serialization writer (no external dependencies).
//
// Builds JSON output via a string-builder approach. Used for the study
// matrix output and the generation summary.

#ifndef IPED_CORE_JSON_HELPERS_H
#define IPED_CORE_JSON_HELPERS_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace iped {

/// @brief Simple JSON writer that builds a JSON string incrementally.
///
/// Usage:
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("task_id");
///   writer.value("0_0");
///   writer.key("task_index");
///   writer.value(0);
///   writer.endObject();
///   std::string json = writer.toString();
///   // -> {"task_id":"0_0","task_index":0}
/// @endcode
///
/// Supports nested objects and arrays. Tracks comma insertion automatically.
/// Does not validate structure (caller must match begin/end pairs).
class JsonWriter {
 public:
  JsonWriter() = default;

  /// @brief Begin a JSON object '{'.
  void beginObject();

  /// @brief End a JSON object '}'.
  void endObject();

  /// @brief Begin a JSON array '['.
  void beginArray();

  /// @brief End a JSON array ']'.
  void endArray();

  /// @brief Write an object key (must be followed by a value call).
  /// @param name Key string.
  void key(std::string_view name);

  /// @brief Write a string value.
  /// @param val String to write (will be JSON-escaped).
  void value(std::string_view val);

  /// @brief Write a string literal value (avoids the const char* -> bool overload).
  void value(const char* val) { value(std::string_view(val)); }

  /// @brief Write an integer value.
  void value(int val);

  /// @brief Write an unsigned integer value.
  void value(uint32_t val);

  /// @brief Write a 64-bit integer value.
  void value(int64_t val);

  /// @brief Write a floating-point value. NaN and infinity become null.
  void value(double val);

  /// @brief Write a boolean value.
  void value(bool val);

  /// @brief Write a null value.
  void valueNull();

  /// @brief Get the accumulated JSON string.
  /// @return Complete JSON string built so far.
  std::string toString() const;

  /// @brief Get the accumulated JSON string with pretty-print indentation.
  /// @param indent_size Number of spaces per indent level (default: 2).
  /// @return Formatted JSON string.
  std::string toPrettyString(int indent_size = 2) const;

 private:
  /// Write a comma if needed before the next value/key.
  void maybeComma();

  /// Mark the current container as holding at least one element.
  void markWritten();

  /// Close the innermost container.
  void closeContainer(char closer);

  /// Escape special characters in a string for JSON output.
  static std::string escapeString(std::string_view input);

  std::string buffer_;

  // One entry per open container: true once an element has been written.
  std::vector<bool> needs_comma_;
};

}  // namespace iped

#endif  // IPED_CORE_JSON_HELPERS_H
