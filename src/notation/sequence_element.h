// Notation tree -- the closed set of sequence elements a voice is built from.

#ifndef TONELANG_NOTATION_SEQUENCE_ELEMENT_H
#define TONELANG_NOTATION_SEQUENCE_ELEMENT_H

#include <cstdint>
#include <optional>
#include <vector>

#include "core/rational.h"

namespace tonelang {

/// Element kinds. Every pass switches over all of them without a default
/// label, so adding a kind fails the build until each pass handles it.
enum class ElementType : uint8_t {
  Note,
  Chord,
  Rest,
  Grouping,
  Repetition
};

/// @brief Convert ElementType to human-readable string.
const char* elementTypeToString(ElementType type);

/// @brief Optional modifiers a node may set and its descendants inherit.
struct Modifiers {
  std::optional<int> velocity;              ///< 1-127.
  std::optional<Rational> duration;         ///< Beats, > 0.
  std::optional<Rational> time_until_next;  ///< Beats, > 0. Cursor advance override.
};

bool operator==(const Modifiers& lhs, const Modifiers& rhs);
inline bool operator!=(const Modifiers& lhs, const Modifiers& rhs) { return !(lhs == rhs); }

/// @brief One note inside a chord (no time_until_next of its own).
struct ChordNote {
  int pitch = 0;
  std::optional<int> velocity;
  std::optional<Rational> duration;
};

bool operator==(const ChordNote& lhs, const ChordNote& rhs);

struct SequenceElement;

/// Ordered element list played sequentially.
using Voice = std::vector<SequenceElement>;

/// Voices played simultaneously, each from beat 0.
using Score = std::vector<Voice>;

/// @brief A node of the notation tree.
///
/// Which fields are meaningful depends on type:
///   - Note:       pitch, modifiers
///   - Chord:      chord_notes (non-empty), modifiers
///   - Rest:       modifiers.duration only
///   - Grouping:   content, modifiers
///   - Repetition: content, repeat (>= 1), modifiers
struct SequenceElement {
  ElementType type = ElementType::Note;
  int pitch = 0;
  std::vector<ChordNote> chord_notes;
  std::vector<SequenceElement> content;
  int repeat = 1;
  Modifiers modifiers;
};

bool operator==(const SequenceElement& lhs, const SequenceElement& rhs);
inline bool operator!=(const SequenceElement& lhs, const SequenceElement& rhs) {
  return !(lhs == rhs);
}

// ---------------------------------------------------------------------------
// Factories
// ---------------------------------------------------------------------------

SequenceElement makeNote(int pitch, const Modifiers& modifiers = {});
SequenceElement makeChord(std::vector<ChordNote> notes, const Modifiers& modifiers = {});
SequenceElement makeRest(std::optional<Rational> duration = std::nullopt);
SequenceElement makeGrouping(Voice content, const Modifiers& modifiers = {});
SequenceElement makeRepetition(Voice content, int repeat, const Modifiers& modifiers = {});

}  // namespace tonelang

#endif  // TONELANG_NOTATION_SEQUENCE_ELEMENT_H
