// Implementation of modifier inheritance (compiler pass 1).

#include "notation/modifier_resolver.h"

namespace tonelang {

namespace {

Voice resolveContent(const Voice& content, const Modifiers& inherited) {
  Voice resolved;
  resolved.reserve(content.size());
  for (const auto& child : content) {
    resolved.push_back(resolveElement(child, inherited));
  }
  return resolved;
}

}  // namespace

Modifiers mergeModifiers(const Modifiers& own, const Modifiers& inherited) {
  Modifiers merged;
  merged.velocity = own.velocity ? own.velocity : inherited.velocity;
  merged.duration = own.duration ? own.duration : inherited.duration;
  merged.time_until_next = own.time_until_next ? own.time_until_next : inherited.time_until_next;
  return merged;
}

SequenceElement resolveElement(const SequenceElement& elem, const Modifiers& inherited) {
  SequenceElement resolved = elem;

  switch (elem.type) {
    case ElementType::Note:
      resolved.modifiers = mergeModifiers(elem.modifiers, inherited);
      break;

    case ElementType::Rest:
      resolved.modifiers = Modifiers{};
      resolved.modifiers.duration =
          elem.modifiers.duration ? elem.modifiers.duration : inherited.duration;
      break;

    case ElementType::Chord:
      resolved.modifiers = mergeModifiers(elem.modifiers, inherited);
      // Inner notes see the chord's resolved values, not its raw fields.
      for (auto& note : resolved.chord_notes) {
        if (!note.velocity) note.velocity = resolved.modifiers.velocity;
        if (!note.duration) note.duration = resolved.modifiers.duration;
      }
      break;

    case ElementType::Grouping:
    case ElementType::Repetition:
      resolved.modifiers = mergeModifiers(elem.modifiers, inherited);
      resolved.content = resolveContent(elem.content, resolved.modifiers);
      break;
  }

  return resolved;
}

Voice resolveModifiers(const Voice& voice) {
  return resolveContent(voice, Modifiers{});
}

}  // namespace tonelang
