// Implementation of timeline flattening (compiler pass 2).

#include "notation/timeline.h"

namespace tonelang {

namespace {

Rational effectiveDuration(const std::optional<Rational>& duration) {
  return duration ? *duration : defaultDuration();
}

int effectiveVelocity(const std::optional<int>& velocity) {
  return velocity ? *velocity : kDefaultVelocity;
}

Rational flattenChord(const SequenceElement& chord, const Rational& cursor,
                      std::vector<Event>& out) {
  const Modifiers& mods = chord.modifiers;
  Rational longest;
  bool has_longest = false;

  for (const auto& note : chord.chord_notes) {
    Event event;
    event.pitch = note.pitch;
    event.start_time = cursor;
    event.duration = effectiveDuration(note.duration ? note.duration : mods.duration);
    event.velocity = effectiveVelocity(note.velocity ? note.velocity : mods.velocity);
    out.push_back(event);

    if (!has_longest || event.duration > longest) {
      longest = event.duration;
      has_longest = true;
    }
  }

  if (mods.time_until_next) return cursor + *mods.time_until_next;

  if (mods.duration && (!has_longest || *mods.duration > longest)) {
    longest = *mods.duration;
    has_longest = true;
  }
  return has_longest ? cursor + longest : cursor + defaultDuration();
}

Rational flattenRepetition(const SequenceElement& rep, const Rational& cursor,
                           const CompileOptions& options, std::vector<Event>& out) {
  if (rep.repeat < 1) return cursor;

  if (options.replay == ReplayMode::Recompute) {
    Rational pass_start = cursor;
    for (int pass = 0; pass < rep.repeat; ++pass) {
      pass_start = flattenSequence(rep.content, pass_start, options, out);
    }
    return pass_start;
  }

  std::vector<Event> first_pass;
  Rational span = flattenSequence(rep.content, cursor, options, first_pass) - cursor;

  out.reserve(out.size() + first_pass.size() * static_cast<size_t>(rep.repeat));
  for (int pass = 0; pass < rep.repeat; ++pass) {
    Rational shift = span * Rational(pass);
    for (const auto& event : first_pass) {
      Event shifted = event;
      shifted.start_time += shift;
      out.push_back(shifted);
    }
  }
  return cursor + span * Rational(rep.repeat);
}

/// @brief Emit one element at cursor.
/// @return Cursor position for the next element.
Rational flattenElement(const SequenceElement& elem, const Rational& cursor,
                        const CompileOptions& options, std::vector<Event>& out) {
  const Modifiers& mods = elem.modifiers;

  switch (elem.type) {
    case ElementType::Rest:
      return cursor + effectiveDuration(mods.duration);

    case ElementType::Note: {
      Event event;
      event.pitch = elem.pitch;
      event.start_time = cursor;
      event.duration = effectiveDuration(mods.duration);
      event.velocity = effectiveVelocity(mods.velocity);
      out.push_back(event);
      return cursor + (mods.time_until_next ? *mods.time_until_next : event.duration);
    }

    case ElementType::Chord:
      return flattenChord(elem, cursor, out);

    case ElementType::Grouping: {
      Rational end = flattenSequence(elem.content, cursor, options, out);
      if (options.honor_grouping_time_until_next && mods.time_until_next) {
        return cursor + *mods.time_until_next;
      }
      return end;
    }

    case ElementType::Repetition:
      return flattenRepetition(elem, cursor, options, out);
  }

  return cursor;
}

}  // namespace

Rational flattenSequence(const Voice& elements, const Rational& start,
                         const CompileOptions& options, std::vector<Event>& out) {
  Rational cursor = start;
  for (const auto& elem : elements) {
    cursor = flattenElement(elem, cursor, options, out);
  }
  return cursor;
}

std::vector<Event> flattenVoice(const Voice& resolved, const CompileOptions& options) {
  std::vector<Event> events;
  flattenSequence(resolved, Rational(0), options, events);
  return events;
}

}  // namespace tonelang
