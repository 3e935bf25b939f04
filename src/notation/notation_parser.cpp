// Recursive-descent parser for ToneLang notation text.

#include "notation/notation_parser.h"

#include <cctype>
#include <cstdint>
#include <limits>
#include <utility>

#include "core/basic_types.h"
#include "core/pitch_utils.h"

namespace tonelang {

const char* syntaxErrorKindToString(SyntaxErrorKind kind) {
  switch (kind) {
    case SyntaxErrorKind::None:                return "None";
    case SyntaxErrorKind::UnexpectedCharacter: return "UnexpectedCharacter";
    case SyntaxErrorKind::UnexpectedEnd:       return "UnexpectedEnd";
    case SyntaxErrorKind::BareNumber:          return "BareNumber";
    case SyntaxErrorKind::BareDecimalPoint:    return "BareDecimalPoint";
    case SyntaxErrorKind::DuplicateModifier:   return "DuplicateModifier";
    case SyntaxErrorKind::InvalidValue:        return "InvalidValue";
    case SyntaxErrorKind::InvalidPitch:        return "InvalidPitch";
    case SyntaxErrorKind::PitchOutOfRange:     return "PitchOutOfRange";
  }
  return "Unknown";
}

namespace {

constexpr const char* kValidConstructsHint =
    "Expected a note (C3, F#4v90n0.5t1), a chord ([C3 E3 G3]), a rest (R, R2, Rn.5), "
    "a grouping ((C3 D3)), a repetition (*N) or ';' between voices";
constexpr const char* kBareNumberHint =
    "Numbers must follow a prefix: v (velocity), n (duration), t (time until next), "
    "R (rest length) or * (repeat count)";
constexpr const char* kBareDecimalHint = "A decimal point needs digits, e.g. n0.5 or n.5";
constexpr const char* kExpansionHint = "Lower the repeat counts (*N) or the beat values";
constexpr const char* kPitchHint =
    "Pitches are a letter A-G, an optional # or b and an octave number, e.g. C3, F#-1, Bb4";

/// Digit accumulation stops growing past this value (already out of range).
constexpr int kValueSaturation = 1000000;

bool isDigit(char chr) { return std::isdigit(static_cast<unsigned char>(chr)) != 0; }

bool isSpace(char chr) { return std::isspace(static_cast<unsigned char>(chr)) != 0; }

bool isPitchLetter(char chr) {
  char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(chr)));
  return lower >= 'a' && lower <= 'g';
}

int64_t saturatingAdd(int64_t lhs, int64_t rhs) {
  int64_t sum = 0;
  if (__builtin_add_overflow(lhs, rhs, &sum)) return std::numeric_limits<int64_t>::max();
  return sum;
}

int64_t saturatingMul(int64_t lhs, int64_t rhs) {
  int64_t product = 0;
  if (__builtin_mul_overflow(lhs, rhs, &product)) return std::numeric_limits<int64_t>::max();
  return product;
}

/// @brief Number of cursor steps and events an element unrolls to.
///
/// Each step advances the cursor by at most the largest beat value in its
/// voice (or the 1-beat default), so this also bounds the element's length.
int64_t expandedSize(const SequenceElement& elem) {
  switch (elem.type) {
    case ElementType::Note:
    case ElementType::Rest:
      return 1;
    case ElementType::Chord:
      return elem.chord_notes.empty() ? 1 : static_cast<int64_t>(elem.chord_notes.size());
    case ElementType::Grouping:
    case ElementType::Repetition: {
      int64_t content = 0;
      for (const auto& child : elem.content) {
        content = saturatingAdd(content, expandedSize(child));
      }
      // A grouping advances by at least one step when its t overrides the span.
      if (elem.type == ElementType::Grouping) return content < 1 ? 1 : content;
      return saturatingMul(content, elem.repeat < 1 ? 0 : elem.repeat);
    }
  }
  return 1;
}

/// @brief Smallest integer >= beats (beats > 0).
int64_t ceilBeats(const Rational& beats) {
  int64_t whole = beats.numerator() / beats.denominator();
  return beats.isInteger() ? whole : whole + 1;
}

class NotationParser {
 public:
  explicit NotationParser(const std::string& text) : text_(text) {}

  bool parseScore(Score& out);

  const NotationSyntaxError& error() const { return error_; }

 private:
  bool atEnd() const { return pos_ >= text_.size(); }
  char peek() const { return atEnd() ? '\0' : text_[pos_]; }

  void skipWhitespace() {
    while (!atEnd() && isSpace(text_[pos_])) ++pos_;
  }

  /// ';' ends a top-level sequence, the closing bracket ends a nested one.
  static bool isTerminator(char chr, char closing) {
    return closing == '\0' ? chr == ';' : chr == closing;
  }

  bool parseSequence(char closing, Voice& out);
  bool parseElement(SequenceElement& out);
  bool parseNote(SequenceElement& out);
  bool parseChord(SequenceElement& out);
  bool parseRest(SequenceElement& out);
  bool parseGrouping(SequenceElement& out);
  bool parseRepeat(SequenceElement& out);

  bool parsePitch(int& pitch);
  bool parseModifiers(Modifiers& mods, bool allow_time_until_next);
  bool parseVelocity(int& velocity);
  bool parseBeats(Rational& beats, const char* what);

  /// After an element only whitespace or a terminator may follow.
  bool expectSeparator(char closing);

  /// Add a finished top-level element to the score and voice totals.
  bool checkExpansion(const SequenceElement& elem, size_t start);

  bool fail(SyntaxErrorKind kind, size_t offset, const std::string& token,
            const std::string& detail, const std::string& hint);
  bool failUnexpected(size_t offset, const char* hint = kValidConstructsHint);
  bool failEnd(const std::string& hint);

  const std::string& text_;
  size_t pos_ = 0;
  NotationSyntaxError error_;

  int64_t score_elements_ = 0;
  int64_t voice_elements_ = 0;
  int64_t voice_max_beats_ = 1;  ///< Ceiling of the largest beat literal (default 1).
};

// ---------------------------------------------------------------------------
// Error reporting
// ---------------------------------------------------------------------------

bool NotationParser::fail(SyntaxErrorKind kind, size_t offset, const std::string& token,
                          const std::string& detail, const std::string& hint) {
  if (error_.kind != SyntaxErrorKind::None) return false;

  int line = 1;
  int column = 1;
  for (size_t idx = 0; idx < offset && idx < text_.size(); ++idx) {
    if (text_[idx] == '\n') {
      ++line;
      column = 1;
    } else {
      ++column;
    }
  }

  error_.kind = kind;
  error_.token = token;
  error_.offset = offset;
  error_.line = line;
  error_.column = column;
  error_.hint = hint;
  error_.message = "syntax error at line " + std::to_string(line) + ", column " +
                   std::to_string(column) + ": " + detail;
  if (!hint.empty()) error_.message += ". " + hint;
  return false;
}

bool NotationParser::failUnexpected(size_t offset, const char* hint) {
  if (offset >= text_.size()) return failEnd(hint);

  char chr = text_[offset];
  bool digit_after_point = chr == '.' && offset + 1 < text_.size() && isDigit(text_[offset + 1]);
  if (isDigit(chr) || digit_after_point) {
    size_t end = offset;
    while (end < text_.size() && (isDigit(text_[end]) || text_[end] == '.')) ++end;
    std::string token = text_.substr(offset, end - offset);
    return fail(SyntaxErrorKind::BareNumber, offset, token,
                "Unexpected number '" + token + "'", kBareNumberHint);
  }
  if (chr == '.') {
    return fail(SyntaxErrorKind::BareDecimalPoint, offset, ".", "Unexpected '.'",
                kBareDecimalHint);
  }
  std::string token(1, chr);
  return fail(SyntaxErrorKind::UnexpectedCharacter, offset, token,
              "Unexpected '" + token + "'", hint);
}

bool NotationParser::failEnd(const std::string& hint) {
  return fail(SyntaxErrorKind::UnexpectedEnd, text_.size(), "", "Unexpected end of input",
              hint);
}

// ---------------------------------------------------------------------------
// Structure
// ---------------------------------------------------------------------------

bool NotationParser::checkExpansion(const SequenceElement& elem, size_t start) {
  int64_t size = expandedSize(elem);
  std::string token = text_.substr(start, pos_ - start);

  score_elements_ = saturatingAdd(score_elements_, size);
  if (score_elements_ > kMaxExpandedElements) {
    return fail(SyntaxErrorKind::InvalidValue, start, token,
                "Score expands to more than " + std::to_string(kMaxExpandedElements) +
                    " elements",
                kExpansionHint);
  }

  voice_elements_ = saturatingAdd(voice_elements_, size);
  if (saturatingMul(voice_elements_, voice_max_beats_) > kMaxVoiceBeats) {
    return fail(SyntaxErrorKind::InvalidValue, start, token,
                "Voice may run longer than " + std::to_string(kMaxVoiceBeats) + " beats",
                kExpansionHint);
  }
  return true;
}

bool NotationParser::parseScore(Score& out) {
  while (true) {
    voice_elements_ = 0;
    voice_max_beats_ = 1;
    Voice voice;
    if (!parseSequence('\0', voice)) return false;
    if (!voice.empty()) out.push_back(std::move(voice));
    if (atEnd()) return true;
    ++pos_;  // ';'
  }
}

bool NotationParser::parseSequence(char closing, Voice& out) {
  while (true) {
    skipWhitespace();
    if (atEnd()) {
      if (closing == '\0') return true;
      return failEnd(std::string("Missing closing '") + closing + "'");
    }
    if (isTerminator(peek(), closing)) return true;

    size_t start = pos_;
    SequenceElement elem;
    if (!parseElement(elem)) return false;
    if (!expectSeparator(closing)) return false;
    if (closing == '\0' && !checkExpansion(elem, start)) return false;
    out.push_back(std::move(elem));
  }
}

bool NotationParser::expectSeparator(char closing) {
  if (atEnd()) return true;
  char chr = peek();
  if (isSpace(chr) || isTerminator(chr, closing)) return true;
  return failUnexpected(pos_);
}

bool NotationParser::parseElement(SequenceElement& out) {
  char chr = peek();
  bool parsed = false;
  if (chr == '[') {
    parsed = parseChord(out);
  } else if (chr == '(') {
    parsed = parseGrouping(out);
  } else if (chr == 'R') {
    parsed = parseRest(out);
  } else if (isPitchLetter(chr)) {
    parsed = parseNote(out);
  } else {
    return failUnexpected(pos_);
  }
  if (!parsed) return false;

  if (peek() == '*') return parseRepeat(out);
  return true;
}

bool NotationParser::parseNote(SequenceElement& out) {
  int pitch = 0;
  if (!parsePitch(pitch)) return false;
  Modifiers mods;
  if (!parseModifiers(mods, true)) return false;
  out = makeNote(pitch, mods);
  return true;
}

bool NotationParser::parseChord(SequenceElement& out) {
  ++pos_;  // '['
  std::vector<ChordNote> notes;

  while (true) {
    skipWhitespace();
    if (atEnd()) return failEnd("Missing closing ']'");
    if (peek() == ']') break;
    if (!isPitchLetter(peek())) return failUnexpected(pos_, "A chord may only contain pitches");

    ChordNote note;
    if (!parsePitch(note.pitch)) return false;
    Modifiers mods;
    if (!parseModifiers(mods, false)) return false;
    note.velocity = mods.velocity;
    note.duration = mods.duration;

    if (!atEnd() && !isSpace(peek()) && peek() != ']') {
      return failUnexpected(pos_, "A chord may only contain pitches");
    }
    notes.push_back(note);
  }

  if (notes.empty()) {
    return fail(SyntaxErrorKind::UnexpectedCharacter, pos_, "]", "Unexpected ']'",
                "A chord needs at least one pitch");
  }
  ++pos_;  // ']'

  Modifiers mods;
  if (!parseModifiers(mods, true)) return false;
  out = makeChord(std::move(notes), mods);
  return true;
}

bool NotationParser::parseRest(SequenceElement& out) {
  ++pos_;  // 'R'
  std::optional<Rational> duration;
  char chr = peek();
  if (chr == 'n') {
    ++pos_;
    Rational beats;
    if (!parseBeats(beats, "Rest duration")) return false;
    duration = beats;
  } else if (isDigit(chr) || chr == '.') {
    Rational beats;
    if (!parseBeats(beats, "Rest duration")) return false;
    duration = beats;
  }
  out = makeRest(duration);
  return true;
}

bool NotationParser::parseGrouping(SequenceElement& out) {
  ++pos_;  // '('
  Voice content;
  if (!parseSequence(')', content)) return false;
  ++pos_;  // ')'

  Modifiers mods;
  if (!parseModifiers(mods, true)) return false;
  out = makeGrouping(std::move(content), mods);
  return true;
}

bool NotationParser::parseRepeat(SequenceElement& out) {
  ++pos_;  // '*'
  size_t start = pos_;
  if (atEnd()) return failEnd("Expected a repeat count after '*'");
  if (!isDigit(peek())) return failUnexpected(pos_, "Expected a repeat count after '*'");

  int count = 0;
  while (!atEnd() && isDigit(peek())) {
    if (count < kValueSaturation) count = count * 10 + (peek() - '0');
    ++pos_;
  }
  std::string token = text_.substr(start, pos_ - start);
  if (count < 1 || count > kMaxRepeatCount) {
    return fail(SyntaxErrorKind::InvalidValue, start, token,
                "Repeat count " + token + " is outside 1-" + std::to_string(kMaxRepeatCount),
                "");
  }

  // A repeated grouping hands its content and modifiers to the repetition.
  if (out.type == ElementType::Grouping) {
    out = makeRepetition(std::move(out.content), count, out.modifiers);
  } else {
    SequenceElement inner = std::move(out);
    out = makeRepetition(Voice{std::move(inner)}, count);
  }

  if (expandedSize(out) > kMaxExpandedElements) {
    return fail(SyntaxErrorKind::InvalidValue, start, token,
                "Repetition expands to more than " + std::to_string(kMaxExpandedElements) +
                    " elements",
                kExpansionHint);
  }
  return true;
}

// ---------------------------------------------------------------------------
// Tokens
// ---------------------------------------------------------------------------

bool NotationParser::parsePitch(int& pitch) {
  size_t start = pos_;
  ++pos_;  // letter
  if (peek() == '#' || peek() == 'b') ++pos_;
  if (peek() == '-') ++pos_;
  size_t digit_start = pos_;
  while (!atEnd() && isDigit(peek())) ++pos_;

  std::string token = text_.substr(start, pos_ - start);
  if (pos_ == digit_start) {
    return fail(SyntaxErrorKind::InvalidPitch, start, token,
                "Invalid pitch '" + token + "'", kPitchHint);
  }

  PitchResult result = nameToMidi(token);
  if (result.error == PitchError::OutOfRange) {
    return fail(SyntaxErrorKind::PitchOutOfRange, start, token, result.error_message, "");
  }
  if (!result.ok()) {
    return fail(SyntaxErrorKind::InvalidPitch, start, token, result.error_message, kPitchHint);
  }
  pitch = result.value;
  return true;
}

bool NotationParser::parseModifiers(Modifiers& mods, bool allow_time_until_next) {
  while (!atEnd()) {
    char prefix = peek();
    size_t start = pos_;
    if (prefix != 'v' && prefix != 'n' && prefix != 't') return true;

    bool duplicate = (prefix == 'v' && mods.velocity) || (prefix == 'n' && mods.duration) ||
                     (prefix == 't' && mods.time_until_next);
    if (prefix == 't' && !allow_time_until_next) {
      return fail(SyntaxErrorKind::UnexpectedCharacter, start, "t", "Unexpected 't'",
                  "Notes inside a chord accept only v and n; put t after the closing ']'");
    }
    if (duplicate) {
      return fail(SyntaxErrorKind::DuplicateModifier, start, std::string(1, prefix),
                  std::string("Duplicate modifier '") + prefix + "'",
                  "Each of v, n and t may appear once per element");
    }
    ++pos_;

    if (prefix == 'v') {
      int velocity = 0;
      if (!parseVelocity(velocity)) return false;
      mods.velocity = velocity;
    } else {
      Rational beats;
      if (!parseBeats(beats, prefix == 'n' ? "Duration" : "Time until next")) return false;
      if (prefix == 'n') {
        mods.duration = beats;
      } else {
        mods.time_until_next = beats;
      }
    }
  }
  return true;
}

bool NotationParser::parseVelocity(int& velocity) {
  size_t start = pos_;
  if (atEnd()) return failEnd("Expected a velocity 1-127 after 'v'");
  if (!isDigit(peek())) return failUnexpected(pos_, "Expected a velocity 1-127 after 'v'");

  int value = 0;
  while (!atEnd() && isDigit(peek())) {
    if (value < kValueSaturation) value = value * 10 + (peek() - '0');
    ++pos_;
  }
  std::string token = text_.substr(start, pos_ - start);
  if (value < kVelocityMin || value > kVelocityMax) {
    return fail(SyntaxErrorKind::InvalidValue, start, token,
                "Velocity " + token + " is outside 1-127", "");
  }
  velocity = value;
  return true;
}

bool NotationParser::parseBeats(Rational& beats, const char* what) {
  size_t start = pos_;
  bool seen_point = false;
  while (!atEnd()) {
    char chr = peek();
    if (chr == '.' && !seen_point) {
      seen_point = true;
    } else if (!isDigit(chr)) {
      break;
    }
    ++pos_;
  }

  std::string token = text_.substr(start, pos_ - start);
  std::string expected = std::string("Expected a number for ") + what;
  if (token.empty()) {
    if (atEnd()) return failEnd(expected);
    return failUnexpected(pos_, expected.c_str());
  }
  if (token == ".") {
    return fail(SyntaxErrorKind::BareDecimalPoint, start, token, "Unexpected '.'",
                kBareDecimalHint);
  }
  if (!Rational::fromDecimalString(token, beats)) {
    return fail(SyntaxErrorKind::InvalidValue, start, token,
                "Number '" + token + "' is too large",
                "Beat values must be below 1000000000");
  }
  if (!beats.isPositive()) {
    return fail(SyntaxErrorKind::InvalidValue, start, token,
                std::string(what) + " must be positive", "");
  }
  int64_t ceiling = ceilBeats(beats);
  if (ceiling > voice_max_beats_) voice_max_beats_ = ceiling;
  return true;
}

}  // namespace

ParseResult parseNotation(const std::string& text) {
  ParseResult result;
  NotationParser parser(text);
  Score score;
  if (!parser.parseScore(score)) {
    result.error = parser.error();
    return result;
  }
  result.success = true;
  result.score = std::move(score);
  return result;
}

}  // namespace tonelang
