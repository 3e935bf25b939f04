// Pass 2 of the notation compiler: flatten a resolved voice into timed events.

#ifndef TONELANG_NOTATION_TIMELINE_H
#define TONELANG_NOTATION_TIMELINE_H

#include <cstdint>
#include <vector>

#include "core/basic_types.h"
#include "notation/sequence_element.h"

namespace tonelang {

/// How a Repetition produces its playbacks.
enum class ReplayMode : uint8_t {
  TimeShift,  ///< Flatten the content once, then copy it shifted by i * span.
  Recompute   ///< Flatten the content again for every playback.
};

/// @brief Compiler switches.
struct CompileOptions {
  /// Let a Grouping's resolved time_until_next replace its natural span when
  /// advancing the cursor (historical behavior). Off: natural span always wins.
  bool honor_grouping_time_until_next = false;
  ReplayMode replay = ReplayMode::TimeShift;
};

/// @brief Flatten resolved elements starting at a cursor position.
///
/// Events are appended to out in textual order. Elements are expected to have
/// been through resolveModifiers(); unset fields take the global defaults
/// (duration 1, velocity 70). A Repetition with repeat < 1 emits nothing and
/// does not advance the cursor.
/// @param elements Resolved elements.
/// @param start Cursor position of the first element, in beats.
/// @param options Compiler switches.
/// @param out Destination event list.
/// @return Cursor position after the last element.
Rational flattenSequence(const Voice& elements, const Rational& start,
                         const CompileOptions& options, std::vector<Event>& out);

/// @brief Flatten a resolved voice from beat 0.
std::vector<Event> flattenVoice(const Voice& resolved, const CompileOptions& options = {});

}  // namespace tonelang

#endif  // TONELANG_NOTATION_TIMELINE_H
