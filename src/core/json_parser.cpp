// Implementation of minimal flat-object JSON parser.

#include "core/json_parser.h"

#include <cctype>
#include <cstdlib>
#include <cstring>

namespace shapesound {

uint32_t JsonValue::asUint(uint32_t default_val) const {
  if (type == Number && number_val >= 0.0) return static_cast<uint32_t>(number_val);
  return default_val;
}

double JsonValue::asDouble(double default_val) const {
  if (type == Number) return number_val;
  return default_val;
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

/// @brief Cursor over the JSON text.
struct Cursor {
  const char* json;
  size_t length;
  size_t pos;

  bool atEnd() const { return pos >= length; }
  char peek() const { return json[pos]; }

  void skipWhitespace() {
    while (!atEnd() && std::isspace(static_cast<unsigned char>(json[pos]))) ++pos;
  }

  /// Consume `word` if the text continues with it.
  bool consumeWord(const char* word) {
    size_t len = std::strlen(word);
    if (pos + len > length || std::strncmp(json + pos, word, len) != 0) return false;
    pos += len;
    return true;
  }
};

/// @brief Parse a JSON string literal (cursor at opening quote).
std::string parseString(Cursor& cur) {
  std::string result;
  if (cur.atEnd() || cur.peek() != '"') return result;
  ++cur.pos;

  while (!cur.atEnd() && cur.peek() != '"') {
    char chr = cur.peek();
    if (chr == '\\' && cur.pos + 1 < cur.length) {
      ++cur.pos;
      switch (cur.peek()) {
        case 'n': result += '\n'; break;
        case 't': result += '\t'; break;
        case 'r': result += '\r'; break;
        default:  result += cur.peek(); break;
      }
    } else {
      result += chr;
    }
    ++cur.pos;
  }

  if (!cur.atEnd()) ++cur.pos;  // closing quote
  return result;
}

/// @brief Parse a JSON number (integer, fraction, exponent).
/// @return False if no digits were found.
bool parseNumber(Cursor& cur, double& out) {
  size_t start = cur.pos;
  if (!cur.atEnd() && (cur.peek() == '-' || cur.peek() == '+')) ++cur.pos;
  while (!cur.atEnd() &&
         (std::isdigit(static_cast<unsigned char>(cur.peek())) || cur.peek() == '.' ||
          cur.peek() == 'e' || cur.peek() == 'E' ||
          ((cur.peek() == '-' || cur.peek() == '+') &&
           (cur.json[cur.pos - 1] == 'e' || cur.json[cur.pos - 1] == 'E')))) {
    ++cur.pos;
  }
  if (cur.pos == start) return false;

  std::string num_str(cur.json + start, cur.pos - start);
  char* end_ptr = nullptr;
  out = std::strtod(num_str.c_str(), &end_ptr);
  return end_ptr != num_str.c_str();
}

/// @brief Skip a nested object or array (cursor at '{' or '[').
void skipContainer(Cursor& cur) {
  int depth = 0;
  while (!cur.atEnd()) {
    char chr = cur.peek();
    if (chr == '"') {
      parseString(cur);
      continue;
    }
    if (chr == '{' || chr == '[') ++depth;
    if (chr == '}' || chr == ']') --depth;
    ++cur.pos;
    if (depth == 0) return;
  }
}

}  // namespace

std::map<std::string, JsonValue> parseJsonObject(const char* json, size_t length) {
  std::map<std::string, JsonValue> result;
  if (json == nullptr || length == 0) return result;

  Cursor cur{json, length, 0};
  cur.skipWhitespace();
  if (cur.atEnd() || cur.peek() != '{') return result;
  ++cur.pos;

  while (true) {
    cur.skipWhitespace();
    if (cur.atEnd() || cur.peek() == '}') break;
    if (cur.peek() == ',') {
      ++cur.pos;
      cur.skipWhitespace();
    }
    if (cur.atEnd() || cur.peek() != '"') break;

    std::string key = parseString(cur);
    cur.skipWhitespace();
    if (cur.atEnd() || cur.peek() != ':') break;
    ++cur.pos;
    cur.skipWhitespace();
    if (cur.atEnd()) break;

    JsonValue val;
    char chr = cur.peek();
    if (chr == '"') {
      val.type = JsonValue::String;
      val.string_val = parseString(cur);
    } else if (cur.consumeWord("true")) {
      val.type = JsonValue::Bool;
      val.bool_val = true;
    } else if (cur.consumeWord("false")) {
      val.type = JsonValue::Bool;
      val.bool_val = false;
    } else if (cur.consumeWord("null")) {
      val.type = JsonValue::Null;
    } else if (chr == '{' || chr == '[') {
      skipContainer(cur);
      continue;
    } else {
      val.type = JsonValue::Number;
      if (!parseNumber(cur, val.number_val)) break;
    }
    result[key] = val;
  }

  return result;
}

}  // namespace shapesound
