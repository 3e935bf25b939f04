/// @file
/// @brief Scale mask construction, quantization and scale-step utilities.

#include "core/scale.h"

#include <cmath>
#include <cstdint>

namespace tonelang {
namespace scale_util {

namespace {

/// Farthest distance the quantizer searches (covers any non-empty mask).
constexpr int kMaxSearchDistance = 11;

/// @brief Round half up, clamped into a safe integer band around 0-127.
int roundPitch(double pitch) {
  if (std::isnan(pitch)) return 0;
  // Anything this far out behaves like the boundary it crossed.
  if (pitch < -1000.0) return -1000;
  if (pitch > 1000.0) return 1000;
  return static_cast<int>(std::floor(pitch + 0.5));
}

/// @brief Replace an out-of-range pitch with the nearest in-scale pitch inside 0-127.
/// @param pitch Candidate pitch (in range pitches pass through unchanged).
/// @param mask Non-empty scale mask.
int clampToScaleBounds(int pitch, ScaleMask mask) {
  if (pitch > kMidiPitchMax) {
    for (int candidate = kMidiPitchMax; candidate >= kMidiPitchMin; --candidate) {
      if (isInScale(candidate, mask)) return candidate;
    }
  }
  if (pitch < kMidiPitchMin) {
    for (int candidate = kMidiPitchMin; candidate <= kMidiPitchMax; ++candidate) {
      if (isInScale(candidate, mask)) return candidate;
    }
  }
  return pitch;
}

int clampMidi(int pitch) {
  if (pitch < kMidiPitchMin) return kMidiPitchMin;
  if (pitch > kMidiPitchMax) return kMidiPitchMax;
  return pitch;
}

}  // namespace

std::vector<int> getScaleIntervals(ScaleType scale) {
  const int* intervals = kScaleMajor;
  switch (scale) {
    case ScaleType::Major:         intervals = kScaleMajor; break;
    case ScaleType::NaturalMinor:  intervals = kScaleNaturalMinor; break;
    case ScaleType::HarmonicMinor: intervals = kScaleHarmonicMinor; break;
    case ScaleType::MelodicMinor:  intervals = kScaleMelodicMinor; break;
    case ScaleType::Dorian:        intervals = kScaleDorian; break;
    case ScaleType::Mixolydian:    intervals = kScaleMixolydian; break;
    case ScaleType::Chromatic: {
      std::vector<int> chromatic;
      for (int semitone = 0; semitone < kPitchClassCount; ++semitone) {
        chromatic.push_back(semitone);
      }
      return chromatic;
    }
  }
  return std::vector<int>(intervals, intervals + 7);
}

ScaleMask buildScaleMask(int root, const std::vector<int>& intervals) {
  ScaleMask mask = 0;
  for (int step : intervals) {
    mask |= static_cast<ScaleMask>(1u << getPitchClass(root + step));
  }
  return mask;
}

ScaleMask scaleMaskFor(ScaleType scale, int root) {
  return buildScaleMask(root, getScaleIntervals(scale));
}

std::vector<std::string> intervalsToPitchClasses(const std::vector<int>& intervals, int root) {
  std::vector<std::string> names;
  names.reserve(intervals.size());
  for (int step : intervals) {
    names.emplace_back(kPitchClassNames[getPitchClass(root + step)]);
  }
  return names;
}

int quantizeToScale(double pitch, ScaleMask mask) {
  mask &= kScaleMaskBits;
  int rounded = roundPitch(pitch);
  if (mask == 0) return clampMidi(rounded);

  // Search outward; the higher candidate is tested first for tie-breaking.
  for (int distance = 0; distance <= kMaxSearchDistance; ++distance) {
    int higher = rounded + distance;
    if (isInScale(higher, mask)) {
      return clampToScaleBounds(higher, mask);
    }
    if (distance > 0) {
      int lower = rounded - distance;
      if (isInScale(lower, mask)) {
        return clampToScaleBounds(lower, mask);
      }
    }
  }

  return clampMidi(rounded);
}

int stepInScale(double base_pitch, int steps, ScaleMask mask) {
  mask &= kScaleMaskBits;
  int start = quantizeToScale(base_pitch, mask);
  if (steps == 0 || mask == 0) return start;

  int direction = steps > 0 ? 1 : -1;
  int64_t remaining = steps > 0 ? static_cast<int64_t>(steps) : -static_cast<int64_t>(steps);
  int current = start;

  while (remaining > 0) {
    current += direction;
    if (current < kMidiPitchMin || current > kMidiPitchMax) {
      return clampToScaleBounds(current, mask);
    }
    if (isInScale(current, mask)) {
      --remaining;
    }
  }

  return current;
}

}  // namespace scale_util
}  // namespace tonelang
