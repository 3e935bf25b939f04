// Basic types shared by the notation compiler and the pitch engine.

#ifndef TONELANG_CORE_BASIC_TYPES_H
#define TONELANG_CORE_BASIC_TYPES_H

#include <cstdint>
#include <iosfwd>
#include <string>

#include "core/rational.h"

namespace tonelang {

/// Tick type for hosts that schedule in integer ticks.
using Tick = uint32_t;

/// Fundamental timing constants.
constexpr Tick kTicksPerBeat = 480;

// ---------------------------------------------------------------------------
// MIDI ranges
// ---------------------------------------------------------------------------

constexpr int kMidiPitchMin = 0;
constexpr int kMidiPitchMax = 127;
constexpr int kVelocityMin = 1;
constexpr int kVelocityMax = 127;

constexpr uint8_t kMidiC3 = 60;  ///< Middle C in the C3 naming convention.

// ---------------------------------------------------------------------------
// Defaults applied when no explicit or inherited modifier exists
// ---------------------------------------------------------------------------

constexpr int kDefaultVelocity = 70;
constexpr int64_t kDefaultDurationBeats = 1;

/// @brief Default note / rest duration (1 beat).
inline Rational defaultDuration() { return Rational(kDefaultDurationBeats); }

// ---------------------------------------------------------------------------
// Tick / beat conversions
// ---------------------------------------------------------------------------

/// @brief Convert a non-negative beat value to ticks, rounding half up.
///
/// Values past the Tick range saturate at its maximum.
Tick beatsToTicks(const Rational& beats);

/// @brief Convert ticks back to an exact beat value.
inline Rational ticksToBeats(Tick ticks) {
  return Rational(static_cast<int64_t>(ticks), static_cast<int64_t>(kTicksPerBeat));
}

// ---------------------------------------------------------------------------
// Scale presets
// ---------------------------------------------------------------------------

/// Named interval sets usable with the scale engine.
enum class ScaleType : uint8_t {
  Major,
  NaturalMinor,
  HarmonicMinor,
  MelodicMinor,
  Dorian,
  Mixolydian,
  Chromatic
};

/// @brief Convert ScaleType to its config-file name (e.g. "natural_minor").
const char* scaleTypeToString(ScaleType scale);

/// @brief Parse ScaleType from a config-file name.
/// @param str Name such as "major", "natural_minor", "dorian", "chromatic".
/// @param out Parsed value (unchanged when the name is not recognized).
/// @return True if the name was recognized.
bool scaleTypeFromString(const std::string& str, ScaleType& out);

/// @brief Parse ScaleType from a name, falling back to Major.
ScaleType scaleTypeFromString(const std::string& str);

// ---------------------------------------------------------------------------
// Data structures
// ---------------------------------------------------------------------------

/// Note event -- the flat output unit of the compiler.
struct Event {
  int pitch = 0;
  Rational start_time;
  Rational duration = Rational(kDefaultDurationBeats);
  int velocity = kDefaultVelocity;

  /// @brief End position (start_time + duration).
  Rational endTime() const { return start_time + duration; }
};

inline bool operator==(const Event& lhs, const Event& rhs) {
  return lhs.pitch == rhs.pitch && lhs.start_time == rhs.start_time &&
         lhs.duration == rhs.duration && lhs.velocity == rhs.velocity;
}

inline bool operator!=(const Event& lhs, const Event& rhs) { return !(lhs == rhs); }

/// @brief gtest / iostream printing: {pitch, start, duration, velocity}.
std::ostream& operator<<(std::ostream& os, const Event& event);

}  // namespace tonelang

#endif  // TONELANG_CORE_BASIC_TYPES_H
