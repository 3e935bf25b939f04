// Implementation of minimal flat-object JSON parser.

#include "core/json_parser.h"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <utility>

namespace tonelang {

namespace {

bool isWholeInt(double val) {
  return std::isfinite(val) && std::floor(val) == val &&
         val >= static_cast<double>(std::numeric_limits<int>::min()) &&
         val <= static_cast<double>(std::numeric_limits<int>::max());
}

}  // namespace

bool JsonValue::isInt() const {
  return type == Number && isWholeInt(number_val);
}

int JsonValue::asInt(int default_val) const {
  if (isInt()) return static_cast<int>(number_val);
  return default_val;
}

bool JsonValue::asIntList(std::vector<int>& out) const {
  if (type != Array) return false;
  std::vector<int> result;
  result.reserve(array_val.size());
  for (double val : array_val) {
    if (!isWholeInt(val)) return false;
    result.push_back(static_cast<int>(val));
  }
  out = result;
  return true;
}

namespace {

/// Reader over the raw buffer. Every parse method returns false after
/// recording the first failure.
class JsonReader {
 public:
  JsonReader(const char* json, size_t length) : json_(json), length_(length) {}

  bool parseObject(std::map<std::string, JsonValue>& out);

  bool atEnd() {
    skipWhitespace();
    return pos_ >= length_;
  }

  bool fail(const std::string& message) {
    if (error_.empty()) {
      error_ = message;
      error_pos_ = pos_;
    }
    return false;
  }

  const std::string& error() const { return error_; }
  size_t errorOffset() const { return error_pos_; }

 private:
  void skipWhitespace() {
    while (pos_ < length_ && std::isspace(static_cast<unsigned char>(json_[pos_]))) {
      ++pos_;
    }
  }

  bool peekIs(char chr) const { return pos_ < length_ && json_[pos_] == chr; }

  bool expect(char chr) {
    skipWhitespace();
    if (!peekIs(chr)) return fail(std::string("expected '") + chr + "'");
    ++pos_;
    return true;
  }

  bool parseString(std::string& out);
  bool parseNumber(double& out);
  bool parseLiteral(const char* word);
  bool parseNumberArray(std::vector<double>& out);
  bool skipNested();
  bool parseValue(JsonValue& out);

  const char* json_;
  size_t length_;
  size_t pos_ = 0;
  std::string error_;
  size_t error_pos_ = 0;
};

bool JsonReader::parseString(std::string& out) {
  if (!peekIs('"')) return fail("expected string");
  ++pos_;  // skip opening quote

  out.clear();
  while (pos_ < length_ && json_[pos_] != '"') {
    if (json_[pos_] == '\\') {
      if (pos_ + 1 >= length_) break;
      ++pos_;
      switch (json_[pos_]) {
        case '"':  out += '"'; break;
        case '\\': out += '\\'; break;
        case '/':  out += '/'; break;
        case 'b':  out += '\b'; break;
        case 'f':  out += '\f'; break;
        case 'n':  out += '\n'; break;
        case 't':  out += '\t'; break;
        case 'r':  out += '\r'; break;
        default:   return fail("unsupported escape sequence");
      }
    } else {
      out += json_[pos_];
    }
    ++pos_;
  }

  if (!peekIs('"')) return fail("unterminated string");
  ++pos_;  // skip closing quote
  return true;
}

bool JsonReader::parseNumber(double& out) {
  size_t start = pos_;
  if (peekIs('-')) ++pos_;
  size_t digits_start = pos_;
  while (pos_ < length_ && std::isdigit(static_cast<unsigned char>(json_[pos_]))) ++pos_;
  if (pos_ == digits_start) {
    pos_ = start;
    return fail("invalid value");
  }
  if (peekIs('.')) {
    ++pos_;
    while (pos_ < length_ && std::isdigit(static_cast<unsigned char>(json_[pos_]))) ++pos_;
  }
  if (peekIs('e') || peekIs('E')) {
    ++pos_;
    if (peekIs('+') || peekIs('-')) ++pos_;
    while (pos_ < length_ && std::isdigit(static_cast<unsigned char>(json_[pos_]))) ++pos_;
  }

  std::string num_str(json_ + start, pos_ - start);
  out = std::strtod(num_str.c_str(), nullptr);
  return true;
}

bool JsonReader::parseLiteral(const char* word) {
  size_t word_len = std::strlen(word);
  if (length_ - pos_ < word_len || std::strncmp(json_ + pos_, word, word_len) != 0) {
    return fail("invalid value");
  }
  pos_ += word_len;
  return true;
}

bool JsonReader::parseNumberArray(std::vector<double>& out) {
  ++pos_;  // skip '['
  skipWhitespace();
  if (peekIs(']')) {
    ++pos_;
    return true;
  }
  while (true) {
    skipWhitespace();
    double val = 0.0;
    if (!parseNumber(val)) return fail("arrays may only contain numbers");
    out.push_back(val);
    skipWhitespace();
    if (peekIs(',')) {
      ++pos_;
      continue;
    }
    return expect(']');
  }
}

bool JsonReader::skipNested() {
  int depth = 0;
  while (pos_ < length_) {
    char chr = json_[pos_];
    if (chr == '"') {
      std::string ignored;
      if (!parseString(ignored)) return false;
      continue;
    }
    if (chr == '{' || chr == '[') ++depth;
    if (chr == '}' || chr == ']') --depth;
    ++pos_;
    if (depth == 0) return true;
  }
  return fail("unterminated nested value");
}

bool JsonReader::parseValue(JsonValue& out) {
  skipWhitespace();
  if (pos_ >= length_) return fail("unexpected end of input");

  switch (json_[pos_]) {
    case '"':
      out.type = JsonValue::String;
      return parseString(out.string_val);
    case 't':
      out.type = JsonValue::Bool;
      out.bool_val = true;
      return parseLiteral("true");
    case 'f':
      out.type = JsonValue::Bool;
      out.bool_val = false;
      return parseLiteral("false");
    case 'n':
      out.type = JsonValue::Null;
      return parseLiteral("null");
    case '[':
      out.type = JsonValue::Array;
      return parseNumberArray(out.array_val);
    case '{':
      // Nested object: skipped, reported as null.
      out.type = JsonValue::Null;
      return skipNested();
    default:
      out.type = JsonValue::Number;
      return parseNumber(out.number_val);
  }
}

bool JsonReader::parseObject(std::map<std::string, JsonValue>& out) {
  if (!expect('{')) return false;
  skipWhitespace();
  if (peekIs('}')) {
    ++pos_;
    return true;
  }

  while (true) {
    skipWhitespace();
    std::string key;
    if (!parseString(key)) return false;
    if (!expect(':')) return false;

    JsonValue val;
    if (!parseValue(val)) return false;
    out[key] = val;

    skipWhitespace();
    if (peekIs(',')) {
      ++pos_;
      continue;
    }
    return expect('}');
  }
}

}  // namespace

JsonParseResult parseJsonObject(const char* json, size_t length) {
  JsonParseResult result;
  if (!json || length == 0) {
    result.error_message = "empty input";
    return result;
  }

  JsonReader reader(json, length);
  std::map<std::string, JsonValue> values;
  if (reader.parseObject(values) && !reader.atEnd()) {
    reader.fail("trailing characters after object");
  }

  if (!reader.error().empty()) {
    result.error_message = reader.error();
    result.error_offset = reader.errorOffset();
    return result;
  }

  result.success = true;
  result.values = std::move(values);
  return result;
}

JsonParseResult parseJsonObject(const std::string& json) {
  return parseJsonObject(json.data(), json.size());
}

}  // namespace tonelang
