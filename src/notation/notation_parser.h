// ToneLang text parser: notation source -> Score.
//
// Grammar summary:
//   score     := voice (';' voice)*
//   voice     := element*                 (whitespace separated)
//   element   := (note | chord | rest | grouping) ('*' int)?
//   note      := pitch modifier*          modifier := v<int> | n<num> | t<num>
//   chord     := '[' pitch (v|n)* ... ']' modifier*
//   rest      := 'R' | 'R' num | 'Rn' num
//   grouping  := '(' voice ')' modifier*
//   pitch     := [A-Ga-g] ('#'|'b')? '-'? digits

#ifndef TONELANG_NOTATION_NOTATION_PARSER_H
#define TONELANG_NOTATION_NOTATION_PARSER_H

#include <cstddef>
#include <cstdint>
#include <string>

#include "notation/sequence_element.h"

namespace tonelang {

/// Syntax error categories.
enum class SyntaxErrorKind : uint8_t {
  None,
  UnexpectedCharacter,  ///< Character that cannot start or continue a construct.
  UnexpectedEnd,        ///< Input ended inside '[' or '(' or after a prefix.
  BareNumber,           ///< Numeric literal without a modifier prefix.
  BareDecimalPoint,     ///< '.' without digits.
  DuplicateModifier,    ///< Same modifier given twice on one element.
  InvalidValue,         ///< Out-of-range number or a score past the expansion limits.
  InvalidPitch,         ///< Malformed pitch name.
  PitchOutOfRange       ///< Well-formed pitch outside MIDI 0-127.
};

/// @brief Convert SyntaxErrorKind to human-readable string.
const char* syntaxErrorKindToString(SyntaxErrorKind kind);

/// @brief Describes the first syntax error found in a notation source.
struct NotationSyntaxError {
  SyntaxErrorKind kind = SyntaxErrorKind::None;
  std::string token;    ///< Offending text.
  size_t offset = 0;    ///< 0-based byte offset.
  int line = 0;         ///< 1-based.
  int column = 0;       ///< 1-based.
  std::string hint;     ///< What would have been valid here.
  std::string message;  ///< "syntax error at line L, column C: ..." with hint.
};

/// @brief Result of parsing notation text.
struct ParseResult {
  bool success = false;
  Score score;
  NotationSyntaxError error;
};

/// Largest accepted repetition count.
constexpr int kMaxRepeatCount = 10000;

/// Largest number of elements a score may expand to once every repetition is
/// unrolled (chord notes count individually).
constexpr int64_t kMaxExpandedElements = 1000000;

/// Upper bound on the length of one voice, in beats. The parser rejects a
/// voice whose expanded element count times its largest beat literal exceeds it.
constexpr int64_t kMaxVoiceBeats = 1000000000;

/// @brief Parse ToneLang source into a Score.
///
/// Empty or whitespace-only text yields an empty score; empty voices are
/// dropped. Pitch names are resolved with nameToMidi, so the returned tree
/// is already numeric and within MIDI range. A score past
/// kMaxExpandedElements or a voice past kMaxVoiceBeats is an InvalidValue.
/// @param text Notation source.
/// @return ParseResult; on failure score is empty and error is filled.
ParseResult parseNotation(const std::string& text);

}  // namespace tonelang

#endif  // TONELANG_NOTATION_NOTATION_PARSER_H
