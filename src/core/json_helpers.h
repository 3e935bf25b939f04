// Minimal JSON serialization writer (no external dependencies).
//
// Builds JSON output via a string-builder approach, compact or indented.
// Used for event output; does not parse JSON. Values are integers and beat
// positions, the only kinds event output carries.

#ifndef TONELANG_CORE_JSON_HELPERS_H
#define TONELANG_CORE_JSON_HELPERS_H

#include <string>
#include <string_view>
#include <vector>

#include "core/rational.h"

namespace tonelang {

/// @brief Simple JSON writer that builds a JSON string incrementally.
///
/// Usage:
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("pitch");
///   writer.value(60);
///   writer.key("start_time");
///   writer.value(Rational(1, 2));
///   writer.endObject();
///   // writer.toString() -> {"pitch":60,"start_time":0.5}
/// @endcode
///
/// Commas are inserted automatically. Does not validate structure (caller
/// must match begin/end pairs and follow every key with one value).
class JsonWriter {
 public:
  /// @param indent_size Spaces per nesting level; 0 writes compact JSON.
  explicit JsonWriter(int indent_size = 0) : indent_size_(indent_size) {}

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  /// @brief Write an object key (must be followed by a value call).
  void key(std::string_view name);

  void value(int val);

  /// @brief Write a beat value: integers exactly, fractions as decimals.
  void value(const Rational& val);

  /// @brief Accumulated JSON text.
  const std::string& toString() const { return buffer_; }

 private:
  /// Emit the separator (and indentation) that precedes a key or value.
  void beforeItem();
  void open(char bracket);
  void close(char bracket);
  void newline();

  static void appendEscaped(std::string& out, std::string_view input);

  std::string buffer_;
  int indent_size_ = 0;
  std::vector<bool> has_items_;  ///< One entry per open container.
  bool after_key_ = false;
};

}  // namespace tonelang

#endif  // TONELANG_CORE_JSON_HELPERS_H
