/// @file
/// @brief Implementation of the minimal JSON writer for structured output.

#include "core/json_helpers.h"

#include <cstdio>
#include <sstream>

namespace tonelang {

namespace {

/// Significant digits for non-integer numbers (enough for 1/3 and friends).
constexpr int kDoublePrecision = 10;

}  // namespace

void JsonWriter::beforeItem() {
  if (after_key_) {
    after_key_ = false;
    return;
  }
  if (has_items_.empty()) return;
  if (has_items_.back()) buffer_ += ',';
  has_items_.back() = true;
  newline();
}

void JsonWriter::newline() {
  if (indent_size_ <= 0) return;
  buffer_ += '\n';
  buffer_.append(has_items_.size() * static_cast<size_t>(indent_size_), ' ');
}

void JsonWriter::open(char bracket) {
  beforeItem();
  buffer_ += bracket;
  has_items_.push_back(false);
}

void JsonWriter::close(char bracket) {
  bool had_items = false;
  if (!has_items_.empty()) {
    had_items = has_items_.back();
    has_items_.pop_back();
  }
  // Empty containers stay compact: {} or [].
  if (had_items) newline();
  buffer_ += bracket;
}

void JsonWriter::beginObject() { open('{'); }
void JsonWriter::endObject() { close('}'); }
void JsonWriter::beginArray() { open('['); }
void JsonWriter::endArray() { close(']'); }

void JsonWriter::key(std::string_view name) {
  beforeItem();
  buffer_ += '"';
  appendEscaped(buffer_, name);
  buffer_ += indent_size_ > 0 ? "\": " : "\":";
  after_key_ = true;
}

void JsonWriter::value(int val) {
  beforeItem();
  buffer_ += std::to_string(val);
}

void JsonWriter::value(const Rational& val) {
  beforeItem();
  if (val.isInteger()) {
    buffer_ += std::to_string(val.numerator());
    return;
  }
  std::ostringstream oss;
  oss.precision(kDoublePrecision);
  oss << val.toDouble();
  buffer_ += oss.str();
}

void JsonWriter::appendEscaped(std::string& out, std::string_view input) {
  for (char chr : input) {
    switch (chr) {
      case '"':  out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b";  break;
      case '\f': out += "\\f";  break;
      case '\n': out += "\\n";  break;
      case '\r': out += "\\r";  break;
      case '\t': out += "\\t";  break;
      default:
        // Remaining control characters (0x00-0x1F) as \u00XX.
        if (static_cast<unsigned char>(chr) < 0x20) {
          char hex_buf[8];
          std::snprintf(hex_buf, sizeof(hex_buf), "\\u%04x",
                        static_cast<unsigned>(static_cast<unsigned char>(chr)));
          out += hex_buf;
        } else {
          out += chr;
        }
        break;
    }
  }
}

}  // namespace tonelang
