// Minimal JSON serialization writer (no external dependencies).
//
// Builds the events JSON and the analysis JSON via a string-builder
// approach. Does not parse JSON (see core/json_parser.h).

#ifndef SHAPESOUND_CORE_JSON_HELPERS_H
#define SHAPESOUND_CORE_JSON_HELPERS_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace shapesound {

/// @brief Simple JSON writer that builds a JSON string incrementally.
///
/// Usage:
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("angularity");
///   writer.value(0.82);
///   writer.key("mode");
///   writer.value("kiki");
///   writer.endObject();
///   std::string json = writer.toString();
///   // -> {"angularity":0.82,"mode":"kiki"}
/// @endcode
///
/// Commas are inserted automatically. Structure is not validated: the
/// caller must balance begin/end pairs.
class JsonWriter {
 public:
  JsonWriter() = default;

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  /// @brief Write an object key (must be followed by a value call).
  void key(std::string_view name);

  /// @brief Write a string value (JSON-escaped).
  void value(std::string_view val);

  /// @brief Overload so string literals do not decay to bool.
  void value(const char* val) { value(std::string_view(val)); }

  void value(int val);
  void value(uint32_t val);

  /// @brief Write a floating-point value with 6 significant digits.
  /// NaN and infinity are written as null.
  void value(double val);

  void value(bool val);
  void valueNull();

  /// @brief Get the accumulated JSON string.
  std::string toString() const;

  /// @brief Get the accumulated JSON string with indentation.
  /// @param indent_size Number of spaces per indent level.
  std::string toPrettyString(int indent_size = 2) const;

 private:
  /// Write a comma if the current container already holds an element.
  void maybeComma();

  /// Mark that the current container now holds an element.
  void markElement();

  /// Escape special characters in a string for JSON output.
  static std::string escapeString(std::string_view input);

  std::string buffer_;

  // One entry per open container: true once it holds an element.
  std::vector<bool> needs_comma_;
};

}  // namespace shapesound

#endif  // SHAPESOUND_CORE_JSON_HELPERS_H
