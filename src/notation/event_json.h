// JSON rendering of compiled event lists.

#ifndef TONELANG_NOTATION_EVENT_JSON_H
#define TONELANG_NOTATION_EVENT_JSON_H

#include <string>
#include <vector>

#include "core/basic_types.h"
#include "notation/compiler.h"

namespace tonelang {

/// @brief Serialize events as a JSON array in emission order.
///
/// Each element is {"pitch","start_time","duration","velocity"}; beat values
/// are written as decimal numbers (integers without a fraction part).
/// @param events Events to serialize.
/// @param indent_size Spaces per nesting level, 0 for compact output.
std::string buildEventsJson(const std::vector<Event>& events, int indent_size = 0);

/// @brief Serialize a score summary: {"duration","note_count","notes":[...]}.
std::string buildScoreJson(const std::vector<Event>& events, const Rational& score_beats,
                           int indent_size = 0);

/// @brief Convenience overload for a compiled score.
std::string buildScoreJson(const CompiledScore& compiled, int indent_size = 0);

}  // namespace tonelang

#endif  // TONELANG_NOTATION_EVENT_JSON_H
