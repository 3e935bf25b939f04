// Notation compiler: notation tree -> resolved tree -> flat event timeline.

#ifndef TONELANG_NOTATION_COMPILER_H
#define TONELANG_NOTATION_COMPILER_H

#include <vector>

#include "core/basic_types.h"
#include "notation/sequence_element.h"
#include "notation/timeline.h"

namespace tonelang {

/// @brief Events of a whole score plus its length.
struct CompiledScore {
  std::vector<Event> events;  ///< Voice 0 events, then voice 1, ...
  Rational duration;          ///< Longest voice end position, trailing rests included.
};

/// @brief Compile one voice from beat 0 (pass 1 then pass 2).
std::vector<Event> compileVoice(const Voice& voice, const CompileOptions& options = {});

/// @brief Compile a score.
///
/// Each voice is timed independently from beat 0 and its events keep their
/// emission order; the per-voice lists are concatenated in voice order.
/// The input tree is not modified and is not validated.
/// @param score Voices to compile.
/// @param options Compiler switches.
/// @return CompiledScore owned by the caller.
CompiledScore compileScore(const Score& score, const CompileOptions& options = {});

/// @brief Compile a score and return only its events.
std::vector<Event> compile(const Score& score, const CompileOptions& options = {});

/// @brief Length of a score in beats (the largest voice end cursor).
Rational scoreDuration(const Score& score, const CompileOptions& options = {});

}  // namespace tonelang

#endif  // TONELANG_NOTATION_COMPILER_H
