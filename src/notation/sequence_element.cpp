// Implementation of notation tree factories and comparisons.

#include "notation/sequence_element.h"

#include <utility>

namespace tonelang {

const char* elementTypeToString(ElementType type) {
  switch (type) {
    case ElementType::Note:       return "Note";
    case ElementType::Chord:      return "Chord";
    case ElementType::Rest:       return "Rest";
    case ElementType::Grouping:   return "Grouping";
    case ElementType::Repetition: return "Repetition";
  }
  return "Unknown";
}

bool operator==(const Modifiers& lhs, const Modifiers& rhs) {
  return lhs.velocity == rhs.velocity && lhs.duration == rhs.duration &&
         lhs.time_until_next == rhs.time_until_next;
}

bool operator==(const ChordNote& lhs, const ChordNote& rhs) {
  return lhs.pitch == rhs.pitch && lhs.velocity == rhs.velocity &&
         lhs.duration == rhs.duration;
}

bool operator==(const SequenceElement& lhs, const SequenceElement& rhs) {
  if (lhs.type != rhs.type || lhs.modifiers != rhs.modifiers) return false;
  switch (lhs.type) {
    case ElementType::Note:
      return lhs.pitch == rhs.pitch;
    case ElementType::Chord:
      return lhs.chord_notes == rhs.chord_notes;
    case ElementType::Rest:
      return true;
    case ElementType::Grouping:
      return lhs.content == rhs.content;
    case ElementType::Repetition:
      return lhs.repeat == rhs.repeat && lhs.content == rhs.content;
  }
  return false;
}

SequenceElement makeNote(int pitch, const Modifiers& modifiers) {
  SequenceElement elem;
  elem.type = ElementType::Note;
  elem.pitch = pitch;
  elem.modifiers = modifiers;
  return elem;
}

SequenceElement makeChord(std::vector<ChordNote> notes, const Modifiers& modifiers) {
  SequenceElement elem;
  elem.type = ElementType::Chord;
  elem.chord_notes = std::move(notes);
  elem.modifiers = modifiers;
  return elem;
}

SequenceElement makeRest(std::optional<Rational> duration) {
  SequenceElement elem;
  elem.type = ElementType::Rest;
  elem.modifiers.duration = duration;
  return elem;
}

SequenceElement makeGrouping(Voice content, const Modifiers& modifiers) {
  SequenceElement elem;
  elem.type = ElementType::Grouping;
  elem.content = std::move(content);
  elem.modifiers = modifiers;
  return elem;
}

SequenceElement makeRepetition(Voice content, int repeat, const Modifiers& modifiers) {
  SequenceElement elem;
  elem.type = ElementType::Repetition;
  elem.content = std::move(content);
  elem.repeat = repeat;
  elem.modifiers = modifiers;
  return elem;
}

}  // namespace tonelang
