// Pass 1 of the notation compiler: top-down modifier inheritance.

#ifndef TONELANG_NOTATION_MODIFIER_RESOLVER_H
#define TONELANG_NOTATION_MODIFIER_RESOLVER_H

#include "notation/sequence_element.h"

namespace tonelang {

/// @brief Fill each unset field of own from inherited.
/// @param own Modifiers written on the node.
/// @param inherited Modifiers resolved on the nearest ancestor.
/// @return own.x if set, else inherited.x, for every field.
Modifiers mergeModifiers(const Modifiers& own, const Modifiers& inherited);

/// @brief Resolve one element against the modifiers inherited from its ancestors.
///
/// Returns a copy whose modifiers hold the explicit-or-inherited values:
///   - Note: all three fields.
///   - Rest: duration only (velocity and time_until_next are cleared).
///   - Chord: the chord's own fields first; then each inner note's velocity and
///     duration against the chord's resolved values.
///   - Grouping / Repetition: own fields, then the resolved set is inherited by
///     every child. A Repetition resolves once; each playback reuses it.
/// Fields still unset afterwards fall back to the global defaults in pass 2.
SequenceElement resolveElement(const SequenceElement& elem, const Modifiers& inherited);

/// @brief Resolve every element of a voice (nothing inherited at the top level).
Voice resolveModifiers(const Voice& voice);

}  // namespace tonelang

#endif  // TONELANG_NOTATION_MODIFIER_RESOLVER_H
