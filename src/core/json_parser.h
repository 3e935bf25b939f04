// Minimal flat-object JSON parser for config input (no external dependencies).
//
// Handles only the subset needed for the CLI configuration file: a flat
// object whose values are strings, numbers, booleans, null, or arrays of
// numbers. Nested objects are skipped.

#ifndef TONELANG_CORE_JSON_PARSER_H
#define TONELANG_CORE_JSON_PARSER_H

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace tonelang {

/// @brief A single JSON value (string, number, boolean, null or number array).
struct JsonValue {
  enum Type { String, Number, Bool, Null, Array };
  Type type = Null;
  std::string string_val;
  double number_val = 0.0;
  bool bool_val = false;
  std::vector<double> array_val;

  /// @brief True for a finite, whole Number within int range.
  bool isInt() const;

  /// @brief Get value as integer, with default when !isInt().
  int asInt(int default_val = 0) const;

  /// @brief Get an Array value as integers.
  /// @param out Receives the elements (unchanged on failure).
  /// @return False unless this is an Array whose elements are all whole
  ///         numbers within int range.
  bool asIntList(std::vector<int>& out) const;
};

/// @brief Outcome of parseJsonObject.
struct JsonParseResult {
  bool success = false;
  std::map<std::string, JsonValue> values;
  std::string error_message;
  size_t error_offset = 0;  ///< Byte offset of the failure when !success.
};

/// @brief Parse a flat JSON object into a key-value map.
///
/// Later duplicates of a key overwrite earlier ones. Arrays may only hold
/// numbers; nested objects are skipped without being interpreted.
///
/// @param json Pointer to JSON string.
/// @param length Length of JSON string.
/// @return JsonParseResult; on failure values is empty.
JsonParseResult parseJsonObject(const char* json, size_t length);

/// @brief Convenience overload for std::string input.
JsonParseResult parseJsonObject(const std::string& json);

}  // namespace tonelang

#endif  // TONELANG_CORE_JSON_PARSER_H
