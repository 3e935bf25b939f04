// Pitch utilities -- pitch-class tables, note-name <-> MIDI conversion and
// the typed errors those conversions report.

#ifndef TONELANG_CORE_PITCH_UTILS_H
#define TONELANG_CORE_PITCH_UTILS_H

#include <cstdint>
#include <string>

#include "core/basic_types.h"

namespace tonelang {

// ---------------------------------------------------------------------------
// Pitch constants
// ---------------------------------------------------------------------------

/// Number of pitch classes per octave.
constexpr int kPitchClassCount = 12;

/// Octave offset of the C3 convention: MIDI 0 is "C-2".
constexpr int kOctaveOffset = 2;

// ---------------------------------------------------------------------------
// Pitch-class name tables
// ---------------------------------------------------------------------------

/// Canonical pitch-class names (flats), index = semitones above C.
constexpr const char* kPitchClassNames[kPitchClassCount] = {
    "C", "Db", "D", "Eb", "E", "F", "Gb", "G", "Ab", "A", "Bb", "B"};

/// One accepted input spelling.
struct PitchClassSpelling {
  const char* name;  ///< Lower-case spelling.
  int semitone;      ///< 0-11.
};

/// Accepted input spellings (naturals, sharps, flats), lower-cased.
constexpr PitchClassSpelling kPitchClassSpellings[] = {
    {"c", 0},   {"c#", 1}, {"db", 1},  {"d", 2},   {"d#", 3}, {"eb", 3},
    {"e", 4},   {"f", 5},  {"f#", 6},  {"gb", 6},  {"g", 7},  {"g#", 8},
    {"ab", 8},  {"a", 9},  {"a#", 10}, {"bb", 10}, {"b", 11}};

// ---------------------------------------------------------------------------
// Errors
// ---------------------------------------------------------------------------

/// Failure classification for pitch conversions.
enum class PitchError : uint8_t {
  None,
  InvalidPitchClass,        ///< Name is not a recognized pitch-class spelling.
  InvalidPitchClassNumber,  ///< Number outside 0-11.
  InvalidMidi,              ///< Number outside 0-127.
  InvalidPitchName,         ///< Text is not <letter><accidental?><octave>.
  OutOfRange                ///< Well-formed name whose MIDI value is outside 0-127.
};

/// @brief Convert PitchError to its taxonomy name (e.g. "InvalidMidi").
const char* pitchErrorToString(PitchError error);

/// @brief Numeric conversion result.
struct PitchResult {
  int value = 0;
  PitchError error = PitchError::None;
  std::string input;          ///< Offending input, echoed on failure.
  std::string error_message;  ///< Human-readable description.

  bool ok() const { return error == PitchError::None; }
};

/// @brief Text conversion result.
struct NameResult {
  std::string name;
  PitchError error = PitchError::None;
  std::string input;
  std::string error_message;

  bool ok() const { return error == PitchError::None; }
};

// ---------------------------------------------------------------------------
// Pitch utility functions
// ---------------------------------------------------------------------------

/// @brief Pitch class (0-11) of any integer pitch, negative values included.
inline int getPitchClass(int pitch) {
  return ((pitch % kPitchClassCount) + kPitchClassCount) % kPitchClassCount;
}

/// @brief Octave number in the C3 convention (MIDI 60 -> 3, MIDI 0 -> -2).
inline int getOctave(int pitch) {
  int floor_div = pitch >= 0 ? pitch / kPitchClassCount
                             : -((-pitch + kPitchClassCount - 1) / kPitchClassCount);
  return floor_div - kOctaveOffset;
}

/// @brief Check if a value is a valid MIDI pitch (0-127).
inline bool isValidMidi(int midi) {
  return midi >= kMidiPitchMin && midi <= kMidiPitchMax;
}

/// @brief Check if text is a pitch-class name (case-insensitive, no octave).
bool isValidPitchClassName(const std::string& name);

/// @brief Check if text is a note name in range (e.g. "C3", "f#4", "Bb-1").
bool isValidNoteName(const std::string& name);

/// @brief Pitch-class name to semitone number.
///
/// Leading/trailing whitespace is ignored and matching is case-insensitive;
/// both sharp and flat spellings are accepted ("C#" and "Db" -> 1).
/// @param name Pitch-class name.
/// @return value 0-11, or PitchError::InvalidPitchClass.
PitchResult nameToSemitone(const std::string& name);

/// @brief Semitone number to canonical (flat) pitch-class name.
/// @param semitone 0-11.
/// @return Name such as "Eb", or PitchError::InvalidPitchClassNumber.
NameResult semitoneToName(int semitone);

/// @brief MIDI pitch to note name with octave (60 -> "C3", 0 -> "C-2").
/// @param midi 0-127.
/// @return Name, or PitchError::InvalidMidi.
NameResult midiToName(int midi);

/// @brief Note name to MIDI pitch ("C3" -> 60, "Bb-1" -> 22).
///
/// Accepts <letter A-G><optional # or b><optional '-'><digits>, any case.
/// @param text Note name.
/// @return value 0-127, PitchError::InvalidPitchName for malformed text, or
///         PitchError::OutOfRange when the pitch falls outside 0-127.
PitchResult nameToMidi(const std::string& text);

}  // namespace tonelang

#endif  // TONELANG_CORE_PITCH_UTILS_H
