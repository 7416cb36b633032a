// Implementation of the minimal JSON parser.

#include "core/json_parser.h"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace iped {

int JsonValue::asInt(int default_val) const {
  if (type != Number) return default_val;
  if (number_val >= static_cast<double>(std::numeric_limits<int>::max())) {
    return std::numeric_limits<int>::max();
  }
  if (number_val <= static_cast<double>(std::numeric_limits<int>::min())) {
    return std::numeric_limits<int>::min();
  }
  return static_cast<int>(number_val);
}

uint32_t JsonValue::asUint(uint32_t default_val) const {
  if (type != Number || !(number_val >= 0.0)) return default_val;
  if (number_val >= static_cast<double>(std::numeric_limits<uint32_t>::max())) {
    return std::numeric_limits<uint32_t>::max();
  }
  return static_cast<uint32_t>(number_val);
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

bool JsonValue::isInteger() const {
  return type == Number && std::floor(number_val) == number_val;
}

const JsonValue* JsonValue::find(std::string_view name) const {
  for (size_t idx = 0; idx < object_keys.size(); ++idx) {
    if (object_keys[idx] == name) return &object_values[idx];
  }
  return nullptr;
}

namespace {

constexpr int kMaxDepth = 64;

/// @brief Recursive-descent reader over a byte range.
class Parser {
 public:
  Parser(const char* json, size_t length) : json_(json), length_(length) {}

  bool parseDocument(JsonValue& out) {
    skipWhitespace();
    if (!parseValue(out, 0)) return false;
    skipWhitespace();
    if (pos_ != length_) return fail("trailing characters");
    return true;
  }

  const std::string& error() const { return error_; }

 private:
  bool fail(const char* what) {
    if (error_.empty()) {
      error_ = std::string(what) + " at offset " + std::to_string(pos_);
    }
    return false;
  }

  void skipWhitespace() {
    while (pos_ < length_ && std::isspace(static_cast<unsigned char>(json_[pos_]))) {
      ++pos_;
    }
  }

  bool consumeLiteral(const char* literal) {
    size_t start = pos_;
    for (const char* chr = literal; *chr != '\0'; ++chr) {
      if (pos_ >= length_ || json_[pos_] != *chr) {
        pos_ = start;
        return fail("invalid literal");
      }
      ++pos_;
    }
    return true;
  }

  bool parseValue(JsonValue& out, int depth) {
    if (depth > kMaxDepth) return fail("nesting too deep");
    if (pos_ >= length_) return fail("unexpected end of input");

    char chr = json_[pos_];
    if (chr == '{') return parseObject(out, depth);
    if (chr == '[') return parseArray(out, depth);
    if (chr == '"') {
      out.type = JsonValue::String;
      return parseString(out.string_val);
    }
    if (chr == 't') {
      out.type = JsonValue::Bool;
      out.bool_val = true;
      return consumeLiteral("true");
    }
    if (chr == 'f') {
      out.type = JsonValue::Bool;
      out.bool_val = false;
      return consumeLiteral("false");
    }
    if (chr == 'n') {
      out.type = JsonValue::Null;
      return consumeLiteral("null");
    }
    if (chr == '-' || std::isdigit(static_cast<unsigned char>(chr))) {
      return parseNumber(out);
    }
    return fail("unexpected character");
  }

  bool parseObject(JsonValue& out, int depth) {
    out.type = JsonValue::Object;
    ++pos_;  // '{'
    skipWhitespace();
    if (pos_ < length_ && json_[pos_] == '}') {
      ++pos_;
      return true;
    }

    while (true) {
      skipWhitespace();
      if (pos_ >= length_ || json_[pos_] != '"') return fail("expected object key");
      std::string key;
      if (!parseString(key)) return false;

      skipWhitespace();
      if (pos_ >= length_ || json_[pos_] != ':') return fail("expected ':'");
      ++pos_;
      skipWhitespace();

      JsonValue child;
      if (!parseValue(child, depth + 1)) return false;
      out.object_keys.push_back(std::move(key));
      out.object_values.push_back(std::move(child));

      skipWhitespace();
      if (pos_ >= length_) return fail("unterminated object");
      if (json_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (json_[pos_] == '}') {
        ++pos_;
        return true;
      }
      return fail("expected ',' or '}'");
    }
  }

  bool parseArray(JsonValue& out, int depth) {
    out.type = JsonValue::Array;
    ++pos_;  // '['
    skipWhitespace();
    if (pos_ < length_ && json_[pos_] == ']') {
      ++pos_;
      return true;
    }

    while (true) {
      skipWhitespace();
      JsonValue child;
      if (!parseValue(child, depth + 1)) return false;
      out.array_items.push_back(std::move(child));

      skipWhitespace();
      if (pos_ >= length_) return fail("unterminated array");
      if (json_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (json_[pos_] == ']') {
        ++pos_;
        return true;
      }
      return fail("expected ',' or ']'");
    }
  }

  /// Append a code point as UTF-8.
  static void appendUtf8(std::string& dest, uint32_t code_point) {
    if (code_point < 0x80) {
      dest += static_cast<char>(code_point);
    } else if (code_point < 0x800) {
      dest += static_cast<char>(0xC0 | (code_point >> 6));
      dest += static_cast<char>(0x80 | (code_point & 0x3F));
    } else if (code_point < 0x10000) {
      dest += static_cast<char>(0xE0 | (code_point >> 12));
      dest += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
      dest += static_cast<char>(0x80 | (code_point & 0x3F));
    } else {
      dest += static_cast<char>(0xF0 | (code_point >> 18));
      dest += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
      dest += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
      dest += static_cast<char>(0x80 | (code_point & 0x3F));
    }
  }

  bool parseHex4(uint32_t& out) {
    if (pos_ + 4 > length_) return fail("truncated \\u escape");
    out = 0;
    for (int idx = 0; idx < 4; ++idx) {
      char chr = json_[pos_++];
      out <<= 4;
      if (chr >= '0' && chr <= '9') {
        out |= static_cast<uint32_t>(chr - '0');
      } else if (chr >= 'a' && chr <= 'f') {
        out |= static_cast<uint32_t>(chr - 'a' + 10);
      } else if (chr >= 'A' && chr <= 'F') {
        out |= static_cast<uint32_t>(chr - 'A' + 10);
      } else {
        return fail("invalid \\u escape");
      }
    }
    return true;
  }

  /// Expects pos_ at the opening quote; leaves it past the closing quote.
  bool parseString(std::string& out) {
    ++pos_;  // opening quote
    while (pos_ < length_) {
      char chr = json_[pos_++];
      if (chr == '"') return true;
      if (chr != '\\') {
        out += chr;
        continue;
      }
      if (pos_ >= length_) break;
      char esc = json_[pos_++];
      switch (esc) {
        case '"':  out += '"'; break;
        case '\\': out += '\\'; break;
        case '/':  out += '/'; break;
        case 'b':  out += '\b'; break;
        case 'f':  out += '\f'; break;
        case 'n':  out += '\n'; break;
        case 'r':  out += '\r'; break;
        case 't':  out += '\t'; break;
        case 'u': {
          uint32_t code_point = 0;
          if (!parseHex4(code_point)) return false;
          // Surrogate pair.
          if (code_point >= 0xD800 && code_point <= 0xDBFF &&
              pos_ + 1 < length_ && json_[pos_] == '\\' && json_[pos_ + 1] == 'u') {
            pos_ += 2;
            uint32_t low = 0;
            if (!parseHex4(low)) return false;
            code_point = 0x10000 + ((code_point - 0xD800) << 10) + (low - 0xDC00);
          }
          appendUtf8(out, code_point);
          break;
        }
        default:
          return fail("invalid escape");
      }
    }
    return fail("unterminated string");
  }

  bool parseNumber(JsonValue& out) {
    size_t start = pos_;
    if (json_[pos_] == '-') ++pos_;
    while (pos_ < length_ && std::isdigit(static_cast<unsigned char>(json_[pos_]))) ++pos_;
    if (pos_ < length_ && json_[pos_] == '.') {
      ++pos_;
      while (pos_ < length_ && std::isdigit(static_cast<unsigned char>(json_[pos_]))) ++pos_;
    }
    if (pos_ < length_ && (json_[pos_] == 'e' || json_[pos_] == 'E')) {
      ++pos_;
      if (pos_ < length_ && (json_[pos_] == '+' || json_[pos_] == '-')) ++pos_;
      while (pos_ < length_ && std::isdigit(static_cast<unsigned char>(json_[pos_]))) ++pos_;
    }

    std::string num_str(json_ + start, pos_ - start);
    char* end = nullptr;
    double parsed = std::strtod(num_str.c_str(), &end);
    if (num_str.empty() || end != num_str.c_str() + num_str.size()) {
      pos_ = start;
      return fail("invalid number");
    }
    out.type = JsonValue::Number;
    out.number_val = parsed;
    return true;
  }

  const char* json_;
  size_t length_;
  size_t pos_ = 0;
  std::string error_;
};

}  // namespace

bool parseJson(const char* json, size_t length, JsonValue& out, std::string* error) {
  out = JsonValue();
  if (!json) {
    if (error) *error = "null input";
    return false;
  }
  Parser parser(json, length);
  if (!parser.parseDocument(out)) {
    if (error) *error = parser.error();
    return false;
  }
  return true;
}

std::map<std::string, JsonValue> parseJsonObject(const char* json, size_t length) {
  std::map<std::string, JsonValue> result;
  JsonValue root;
  if (!parseJson(json, length, root) || root.type != JsonValue::Object) {
    return result;
  }
  for (size_t idx = 0; idx < root.object_keys.size(); ++idx) {
    // First occurrence wins, matching JsonValue::find().
    result.emplace(root.object_keys[idx], root.object_values[idx]);
  }
  return result;
}

}  // namespace iped
