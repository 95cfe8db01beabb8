// Minimal flat-object JSON parser for config input (no external dependencies).
//
// Handles only the subset needed for GeneratorConfig: a flat object with
// string, number, boolean and null values. Nested objects and arrays are
// skipped.

#ifndef SHAPESOUND_CORE_JSON_PARSER_H
#define SHAPESOUND_CORE_JSON_PARSER_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace shapesound {

/// @brief A single JSON value (string, number, boolean or null).
struct JsonValue {
  enum Type { String, Number, Bool, Null };
  Type type = Null;
  std::string string_val;
  double number_val = 0.0;
  bool bool_val = false;

  /// @brief Get value as unsigned integer, with default.
  uint32_t asUint(uint32_t default_val = 0) const;

  /// @brief Get value as double, with default.
  double asDouble(double default_val = 0.0) const;

  /// @brief Get value as boolean, with default.
  bool asBool(bool default_val = false) const;

  /// @brief Get value as string, with default.
  std::string asString(const std::string& default_val = "") const;
};

/// @brief Parse a flat JSON object into a key-value map.
///
/// @param json Pointer to JSON text.
/// @param length Length of the JSON text.
/// @return Map of key-value pairs. Keys parsed before a syntax error are
///         kept; an input that does not start with '{' yields an empty map.
std::map<std::string, JsonValue> parseJsonObject(const char* json, size_t length);

}  // namespace shapesound

#endif  // SHAPESOUND_CORE_JSON_PARSER_H
