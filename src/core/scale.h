// Scale mask utilities -- mask construction, membership testing, pitch
// quantization and scale-step transposition.

#ifndef TONELANG_CORE_SCALE_H
#define TONELANG_CORE_SCALE_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/pitch_utils.h"

namespace tonelang {

/// 12-bit pitch-class set: bit N set means pitch class N is in the scale.
using ScaleMask = uint16_t;

/// Bits that carry pitch classes; higher bits are ignored.
constexpr ScaleMask kScaleMaskBits = 0x0FFF;

/// All 12 pitch classes.
constexpr ScaleMask kChromaticScaleMask = 0x0FFF;

// ---------------------------------------------------------------------------
// Scale interval arrays (semitones from root, 7 degrees)
// ---------------------------------------------------------------------------

constexpr int kScaleMajor[7] = {0, 2, 4, 5, 7, 9, 11};
constexpr int kScaleNaturalMinor[7] = {0, 2, 3, 5, 7, 8, 10};
constexpr int kScaleHarmonicMinor[7] = {0, 2, 3, 5, 7, 8, 11};
constexpr int kScaleMelodicMinor[7] = {0, 2, 3, 5, 7, 9, 11};
constexpr int kScaleDorian[7] = {0, 2, 3, 5, 7, 9, 10};
constexpr int kScaleMixolydian[7] = {0, 2, 4, 5, 7, 9, 10};

namespace scale_util {

/// @brief Get the interval list for a preset scale.
/// @param scale Scale type.
/// @return Semitone intervals from the root (12 entries for Chromatic).
std::vector<int> getScaleIntervals(ScaleType scale);

/// @brief Build a scale mask from a root and signed semitone intervals.
///
/// Sets bit ((root + interval) mod 12) for every interval, using a
/// non-negative modulo. Duplicate pitch classes collapse.
/// @param root Root pitch class (0 = C).
/// @param intervals Semitone intervals from the root (e.g. {0, 2, 4, 5, 7, 9, 11}).
/// @return Mask (C major -> 0xAB5).
ScaleMask buildScaleMask(int root, const std::vector<int>& intervals);

/// @brief Build the mask of a preset scale on a root.
ScaleMask scaleMaskFor(ScaleType scale, int root);

/// @brief Check if an integer pitch's class is in the mask.
inline bool isInScale(int pitch, ScaleMask mask) {
  return ((mask & kScaleMaskBits) >> getPitchClass(pitch)) & 1u;
}

/// @brief Convert intervals on a root to canonical pitch-class names.
/// @param intervals Semitone intervals from the root.
/// @param root Root pitch class (0-11).
/// @return Names in interval order (e.g. {"C", "D", "E", ...}).
std::vector<std::string> intervalsToPitchClasses(const std::vector<int>& intervals, int root);

/// @brief Snap a pitch to the nearest in-scale MIDI pitch.
///
/// The pitch is rounded half up, then candidates are searched outward at
/// distance 0..11, testing rounded+d before rounded-d so ties resolve to the
/// higher pitch. A candidate outside 0-127 is replaced by the in-scale pitch
/// nearest the crossed boundary (scanning down from 127 or up from 0).
///
/// An empty mask returns the rounded pitch clamped to 0-127. Non-finite input
/// is clamped to the nearest boundary; NaN is treated as 0.
/// @param pitch Input pitch (fractional allowed).
/// @param mask Scale mask.
/// @return In-scale pitch in 0-127.
int quantizeToScale(double pitch, ScaleMask mask);

/// @brief Move a pitch by N scale steps.
///
/// The base pitch is quantized first; then |steps| semitone moves are made in
/// the direction of steps, counting only moves that land in the scale. If the
/// walk would leave 0-127 it stops at the in-scale pitch nearest the boundary.
/// With an empty mask the quantized anchor is returned unchanged.
/// @param base_pitch Starting pitch (fractional allowed).
/// @param steps Scale steps (negative = down).
/// @param mask Scale mask.
/// @return In-scale pitch in 0-127.
int stepInScale(double base_pitch, int steps, ScaleMask mask);

}  // namespace scale_util
}  // namespace tonelang

#endif  // TONELANG_CORE_SCALE_H
