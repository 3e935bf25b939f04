// Tests for notation/notation_parser.h -- ToneLang text to notation tree.

#include "notation/notation_parser.h"

#include <gtest/gtest.h>

#include <string>

namespace tonelang {
namespace {

/// Parse text that must be valid; returns its score.
Score parseOk(const std::string& text) {
  ParseResult result = parseNotation(text);
  EXPECT_TRUE(result.success) << text << ": " << result.error.message;
  return result.score;
}

/// Parse text that must fail; returns the error.
NotationSyntaxError parseFail(const std::string& text) {
  ParseResult result = parseNotation(text);
  EXPECT_FALSE(result.success) << text;
  EXPECT_TRUE(result.score.empty()) << text;
  return result.error;
}

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

// ---------------------------------------------------------------------------
// Structure
// ---------------------------------------------------------------------------

TEST(NotationParserTest, EmptyInputYieldsEmptyScore) {
  EXPECT_TRUE(parseOk("").empty());
  EXPECT_TRUE(parseOk("   \n\t ").empty());
  EXPECT_TRUE(parseOk(" ; ;").empty());
}

TEST(NotationParserTest, NotesResolvePitchNames) {
  Score score = parseOk("C3 d3 F#4 Bb-1 C-2 G8");
  ASSERT_EQ(score.size(), 1u);
  const Voice& voice = score[0];
  ASSERT_EQ(voice.size(), 6u);
  int expected[] = {60, 62, 78, 22, 0, 127};
  for (size_t idx = 0; idx < voice.size(); ++idx) {
    EXPECT_EQ(voice[idx].type, ElementType::Note);
    EXPECT_EQ(voice[idx].pitch, expected[idx]);
    EXPECT_EQ(voice[idx].modifiers, Modifiers{});
  }
}

TEST(NotationParserTest, VoicesSplitOnSemicolon) {
  Score score = parseOk("C3 D3; G3 A3\n;B3");
  ASSERT_EQ(score.size(), 3u);
  EXPECT_EQ(score[0].size(), 2u);
  EXPECT_EQ(score[1].size(), 2u);
  EXPECT_EQ(score[2][0].pitch, 71);
}

TEST(NotationParserTest, ModifiersInAnyOrder) {
  Modifiers expected;
  expected.velocity = 80;
  expected.duration = Rational(2);
  expected.time_until_next = Rational(3);
  for (const char* text : {"C3v80n2t3", "C3n2v80t3", "C3t3n2v80"}) {
    Score score = parseOk(text);
    ASSERT_EQ(score.size(), 1u);
    EXPECT_EQ(score[0][0].modifiers, expected) << text;
  }
}

TEST(NotationParserTest, DecimalDurations) {
  Score score = parseOk("C3n0.5 D3n.25 E3t1.5");
  EXPECT_EQ(score[0][0].modifiers.duration, Rational(1, 2));
  EXPECT_EQ(score[0][1].modifiers.duration, Rational(1, 4));
  EXPECT_EQ(score[0][2].modifiers.time_until_next, Rational(3, 2));
}

TEST(NotationParserTest, ChordWithInnerModifiers) {
  Score score = parseOk("[C3v90 E3n2 G3]v70t4");
  const SequenceElement& chord = score[0][0];
  ASSERT_EQ(chord.type, ElementType::Chord);
  ASSERT_EQ(chord.chord_notes.size(), 3u);
  EXPECT_EQ(chord.chord_notes[0].velocity, 90);
  EXPECT_EQ(chord.chord_notes[1].duration, Rational(2));
  EXPECT_FALSE(chord.chord_notes[2].velocity.has_value());
  EXPECT_EQ(chord.modifiers.velocity, 70);
  EXPECT_EQ(chord.modifiers.time_until_next, Rational(4));
}

TEST(NotationParserTest, RestForms) {
  Score score = parseOk("R R2 Rn.5 R0.25");
  const Voice& voice = score[0];
  ASSERT_EQ(voice.size(), 4u);
  for (const auto& elem : voice) EXPECT_EQ(elem.type, ElementType::Rest);
  EXPECT_FALSE(voice[0].modifiers.duration.has_value());
  EXPECT_EQ(voice[1].modifiers.duration, Rational(2));
  EXPECT_EQ(voice[2].modifiers.duration, Rational(1, 2));
  EXPECT_EQ(voice[3].modifiers.duration, Rational(1, 4));
}

TEST(NotationParserTest, GroupingWithModifiers) {
  Score score = parseOk("(C3 (D3 E3)n2)v90");
  const SequenceElement& outer = score[0][0];
  ASSERT_EQ(outer.type, ElementType::Grouping);
  EXPECT_EQ(outer.modifiers.velocity, 90);
  ASSERT_EQ(outer.content.size(), 2u);
  EXPECT_EQ(outer.content[1].type, ElementType::Grouping);
  EXPECT_EQ(outer.content[1].modifiers.duration, Rational(2));
}

TEST(NotationParserTest, EmptyGroupingIsAllowed) {
  Score score = parseOk("() C3");
  ASSERT_EQ(score[0].size(), 2u);
  EXPECT_TRUE(score[0][0].content.empty());
}

// ---------------------------------------------------------------------------
// Repetition
// ---------------------------------------------------------------------------

TEST(NotationParserTest, RepeatedGroupingHandsOverContentAndModifiers) {
  Score score = parseOk("(C3 D3)v90*2");
  const SequenceElement& rep = score[0][0];
  ASSERT_EQ(rep.type, ElementType::Repetition);
  EXPECT_EQ(rep.repeat, 2);
  EXPECT_EQ(rep.modifiers.velocity, 90);
  ASSERT_EQ(rep.content.size(), 2u);
  EXPECT_EQ(rep.content[0].type, ElementType::Note);
}

TEST(NotationParserTest, RepeatedSingleElementIsWrapped) {
  Score score = parseOk("C4v80*3 [C4 E4]*2 R2*4");
  const Voice& voice = score[0];
  ASSERT_EQ(voice.size(), 3u);
  for (const auto& elem : voice) {
    EXPECT_EQ(elem.type, ElementType::Repetition);
    ASSERT_EQ(elem.content.size(), 1u);
    EXPECT_EQ(elem.modifiers, Modifiers{});
  }
  EXPECT_EQ(voice[0].repeat, 3);
  EXPECT_EQ(voice[0].content[0].modifiers.velocity, 80);
  EXPECT_EQ(voice[1].content[0].type, ElementType::Chord);
  EXPECT_EQ(voice[2].content[0].type, ElementType::Rest);
  EXPECT_EQ(voice[2].repeat, 4);
}

TEST(NotationParserTest, NestedRepetition) {
  Score score = parseOk("((C3 D3)*2 E3)*3");
  const SequenceElement& outer = score[0][0];
  ASSERT_EQ(outer.type, ElementType::Repetition);
  EXPECT_EQ(outer.repeat, 3);
  ASSERT_EQ(outer.content.size(), 2u);
  EXPECT_EQ(outer.content[0].type, ElementType::Repetition);
  EXPECT_EQ(outer.content[0].repeat, 2);
}

// ---------------------------------------------------------------------------
// Errors
// ---------------------------------------------------------------------------

TEST(NotationParserErrorTest, NegativeRepeatCount) {
  NotationSyntaxError error = parseFail("C4*-2");
  EXPECT_EQ(error.kind, SyntaxErrorKind::UnexpectedCharacter);
  EXPECT_EQ(error.token, "-");
  EXPECT_EQ(error.offset, 3u);
  EXPECT_EQ(error.line, 1);
  EXPECT_EQ(error.column, 4);
  EXPECT_TRUE(contains(error.message, "syntax error"));
  EXPECT_TRUE(contains(error.message, "Unexpected '-'"));
}

TEST(NotationParserErrorTest, ZeroRepeatCount) {
  EXPECT_EQ(parseFail("C4*0").kind, SyntaxErrorKind::InvalidValue);
}

TEST(NotationParserErrorTest, DuplicateModifiers) {
  for (const char* text : {"C3v80v90", "C3n2n3", "C3t1t2", "[C3]v1n1v2"}) {
    NotationSyntaxError error = parseFail(text);
    EXPECT_EQ(error.kind, SyntaxErrorKind::DuplicateModifier) << text;
    EXPECT_TRUE(contains(error.message, "Duplicate modifier")) << text;
  }
}

TEST(NotationParserErrorTest, PitchOutsideMidiRange) {
  for (const char* text : {"C-3", "Ab8", "C9"}) {
    NotationSyntaxError error = parseFail(text);
    EXPECT_EQ(error.kind, SyntaxErrorKind::PitchOutOfRange) << text;
    EXPECT_EQ(error.token, text);
    EXPECT_TRUE(contains(error.message, "outside valid range")) << error.message;
  }
}

TEST(NotationParserErrorTest, InvalidPitches) {
  EXPECT_EQ(parseFail("C").kind, SyntaxErrorKind::InvalidPitch);
  EXPECT_EQ(parseFail("E#3").kind, SyntaxErrorKind::InvalidPitch);
  EXPECT_EQ(parseFail("Cb3").kind, SyntaxErrorKind::InvalidPitch);
}

TEST(NotationParserErrorTest, VelocityRange) {
  EXPECT_EQ(parseFail("C3v999").kind, SyntaxErrorKind::InvalidValue);
  EXPECT_EQ(parseFail("C3v0").kind, SyntaxErrorKind::InvalidValue);
  NotationSyntaxError negative = parseFail("D3v-5");
  EXPECT_EQ(negative.kind, SyntaxErrorKind::UnexpectedCharacter);
  EXPECT_EQ(negative.token, "-");
}

TEST(NotationParserErrorTest, NonPositiveDuration) {
  EXPECT_EQ(parseFail("C3n0").kind, SyntaxErrorKind::InvalidValue);
  EXPECT_EQ(parseFail("C3t0.0").kind, SyntaxErrorKind::InvalidValue);
  EXPECT_EQ(parseFail("R0").kind, SyntaxErrorKind::InvalidValue);
}

TEST(NotationParserErrorTest, UnknownCharacters) {
  NotationSyntaxError error = parseFail("C3 X9 E3");
  EXPECT_EQ(error.kind, SyntaxErrorKind::UnexpectedCharacter);
  EXPECT_EQ(error.token, "X");
  EXPECT_EQ(error.column, 4);
  EXPECT_FALSE(error.hint.empty());

  EXPECT_EQ(parseFail("invalid-input!!").kind, SyntaxErrorKind::UnexpectedCharacter);
}

TEST(NotationParserErrorTest, BareNumber) {
  NotationSyntaxError error = parseFail("C3 4");
  EXPECT_EQ(error.kind, SyntaxErrorKind::BareNumber);
  EXPECT_EQ(error.token, "4");
  EXPECT_TRUE(contains(error.hint, "prefix"));

  EXPECT_EQ(parseFail("(C3)2").kind, SyntaxErrorKind::BareNumber);
}

TEST(NotationParserErrorTest, BareDecimalPoint) {
  EXPECT_EQ(parseFail("C3n.").kind, SyntaxErrorKind::BareDecimalPoint);
  EXPECT_EQ(parseFail("C3 . D3").kind, SyntaxErrorKind::BareDecimalPoint);
}

TEST(NotationParserErrorTest, UnclosedBrackets) {
  NotationSyntaxError chord = parseFail("[C3 E3");
  EXPECT_EQ(chord.kind, SyntaxErrorKind::UnexpectedEnd);
  EXPECT_EQ(chord.offset, 6u);

  EXPECT_EQ(parseFail("(C3 D3").kind, SyntaxErrorKind::UnexpectedEnd);
  EXPECT_EQ(parseFail("C3n").kind, SyntaxErrorKind::UnexpectedEnd);
}

TEST(NotationParserErrorTest, StrayClosersAndSeparators) {
  EXPECT_EQ(parseFail("C3)").kind, SyntaxErrorKind::UnexpectedCharacter);
  EXPECT_EQ(parseFail("C3 ]").kind, SyntaxErrorKind::UnexpectedCharacter);
  EXPECT_EQ(parseFail("(C3; D3)").kind, SyntaxErrorKind::UnexpectedCharacter);
  EXPECT_EQ(parseFail("C3D3").kind, SyntaxErrorKind::UnexpectedCharacter);
}

TEST(NotationParserErrorTest, ChordRestrictions) {
  EXPECT_EQ(parseFail("[]").kind, SyntaxErrorKind::UnexpectedCharacter);
  EXPECT_EQ(parseFail("[C3t1 E3]").kind, SyntaxErrorKind::UnexpectedCharacter);
  EXPECT_EQ(parseFail("[C3 R]").kind, SyntaxErrorKind::UnexpectedCharacter);
}

TEST(NotationParserErrorTest, LineAndColumnCountNewlines) {
  NotationSyntaxError error = parseFail("C3 D3\nE3 F3\n  G3v200");
  EXPECT_EQ(error.line, 3);
  EXPECT_EQ(error.column, 6);
  EXPECT_TRUE(contains(error.message, "line 3, column 6"));
}

// ---------------------------------------------------------------------------
// Size limits
// ---------------------------------------------------------------------------

/// Text made of count copies of unit.
std::string repeatText(const std::string& unit, int count) {
  std::string text;
  for (int idx = 0; idx < count; ++idx) text += unit;
  return text;
}

TEST(NotationParserLimitTest, RepeatCountCap) {
  EXPECT_EQ(parseOk("C3*10000")[0][0].repeat, kMaxRepeatCount);
  NotationSyntaxError error = parseFail("C3*10001");
  EXPECT_EQ(error.kind, SyntaxErrorKind::InvalidValue);
  EXPECT_EQ(error.token, "10001");
}

TEST(NotationParserLimitTest, NestedRepetitionPastExpansionLimit) {
  NotationSyntaxError error = parseFail("(((C3)*10000)*10000)*10000");
  EXPECT_EQ(error.kind, SyntaxErrorKind::InvalidValue);
  EXPECT_EQ(error.offset, 14u);
  EXPECT_EQ(error.token, "10000");
  EXPECT_TRUE(contains(error.message, "expands to more than 1000000 elements"))
      << error.message;
}

TEST(NotationParserLimitTest, ExpansionLimitCountsWholeScore) {
  // 100 x 10000 notes is exactly the limit.
  EXPECT_EQ(parseOk(repeatText("C3*10000 ", 100))[0].size(), 100u);

  NotationSyntaxError error = parseFail(repeatText("C3*10000 ", 50) + ";" +
                                        repeatText(" D3*10000", 51));
  EXPECT_EQ(error.kind, SyntaxErrorKind::InvalidValue);
  EXPECT_EQ(error.token, "D3*10000");
  EXPECT_TRUE(contains(error.message, "Score expands")) << error.message;
}

TEST(NotationParserLimitTest, ChordNotesCountTowardExpansion) {
  NotationSyntaxError error = parseFail("([C3 E3 G3])*10000 ([C3 E3 G3])*10000 " +
                                        repeatText("[C3 E3]*10000 ", 100));
  EXPECT_EQ(error.kind, SyntaxErrorKind::InvalidValue);
}

TEST(NotationParserLimitTest, BeatLiteralDigitCap) {
  EXPECT_TRUE(parseNotation("C3n999999999").success);
  NotationSyntaxError error = parseFail("C3n1000000000");
  EXPECT_EQ(error.kind, SyntaxErrorKind::InvalidValue);
  EXPECT_EQ(error.token, "1000000000");
  EXPECT_TRUE(contains(error.message, "too large")) << error.message;
  EXPECT_EQ(parseFail("C3n999999999999.123456789").kind, SyntaxErrorKind::InvalidValue);
}

TEST(NotationParserLimitTest, VoiceLengthLimit) {
  NotationSyntaxError error = parseFail("C3n999999999.5 D3n0.000000001 E3");
  EXPECT_EQ(error.kind, SyntaxErrorKind::InvalidValue);
  EXPECT_EQ(error.offset, 15u);
  EXPECT_EQ(error.token, "D3n0.000000001");
  EXPECT_TRUE(contains(error.message, "1000000000 beats")) << error.message;

  NotationSyntaxError repeated = parseFail("C3n200000*10000");
  EXPECT_EQ(repeated.kind, SyntaxErrorKind::InvalidValue);
}

TEST(NotationParserLimitTest, VoiceLengthIsPerVoice) {
  EXPECT_EQ(parseOk("C3n999999999; D3n999999999").size(), 2u);
}

TEST(NotationParserErrorTest, KindNames) {
  EXPECT_STREQ(syntaxErrorKindToString(SyntaxErrorKind::BareNumber), "BareNumber");
  EXPECT_STREQ(syntaxErrorKindToString(SyntaxErrorKind::PitchOutOfRange), "PitchOutOfRange");
}

}  // namespace
}  // namespace tonelang
