// Tests for notation/sequence_element.h -- factories and structural equality.

#include "notation/sequence_element.h"

#include <gtest/gtest.h>

namespace tonelang {
namespace {

TEST(SequenceElementTest, FactoriesSetKind) {
  EXPECT_EQ(makeNote(60).type, ElementType::Note);
  EXPECT_EQ(makeChord({{60, std::nullopt, std::nullopt}}).type, ElementType::Chord);
  EXPECT_EQ(makeRest().type, ElementType::Rest);
  EXPECT_EQ(makeGrouping({}).type, ElementType::Grouping);
  EXPECT_EQ(makeRepetition({}, 2).type, ElementType::Repetition);
}

TEST(SequenceElementTest, RestStoresDurationAsModifier) {
  SequenceElement rest = makeRest(Rational(3, 2));
  EXPECT_EQ(rest.modifiers.duration, Rational(3, 2));
  EXPECT_FALSE(makeRest().modifiers.duration.has_value());
}

TEST(SequenceElementTest, EqualityIgnoresFieldsOfOtherKinds) {
  SequenceElement lhs = makeRest(Rational(1));
  SequenceElement rhs = makeRest(Rational(1));
  rhs.pitch = 99;  // Not meaningful for a rest
  EXPECT_EQ(lhs, rhs);
}

TEST(SequenceElementTest, EqualityComparesNestedContent) {
  Modifiers loud;
  loud.velocity = 100;
  SequenceElement lhs = makeRepetition({makeNote(60), makeGrouping({makeNote(62)})}, 2, loud);
  SequenceElement rhs = lhs;
  EXPECT_EQ(lhs, rhs);

  rhs.content[1].content[0].pitch = 63;
  EXPECT_NE(lhs, rhs);

  SequenceElement other_count = lhs;
  other_count.repeat = 3;
  EXPECT_NE(lhs, other_count);
}

TEST(SequenceElementTest, TypeNames) {
  EXPECT_STREQ(elementTypeToString(ElementType::Chord), "Chord");
  EXPECT_STREQ(elementTypeToString(ElementType::Repetition), "Repetition");
}

}  // namespace
}  // namespace tonelang
