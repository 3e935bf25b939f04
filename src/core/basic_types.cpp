// Implementation of tick conversion and scale-name lookups.

#include "core/basic_types.h"

#include <limits>
#include <ostream>

namespace tonelang {

Tick beatsToTicks(const Rational& beats) {
  if (!beats.isPositive()) return 0;
  // round(num * 480 / den) with halves rounded up
  __int128 scaled = static_cast<__int128>(beats.numerator()) * kTicksPerBeat * 2 +
                    beats.denominator();
  __int128 ticks = scaled / (static_cast<__int128>(beats.denominator()) * 2);
  if (ticks > std::numeric_limits<Tick>::max()) return std::numeric_limits<Tick>::max();
  return static_cast<Tick>(ticks);
}

const char* scaleTypeToString(ScaleType scale) {
  switch (scale) {
    case ScaleType::Major:         return "major";
    case ScaleType::NaturalMinor:  return "natural_minor";
    case ScaleType::HarmonicMinor: return "harmonic_minor";
    case ScaleType::MelodicMinor:  return "melodic_minor";
    case ScaleType::Dorian:        return "dorian";
    case ScaleType::Mixolydian:    return "mixolydian";
    case ScaleType::Chromatic:     return "chromatic";
  }
  return "unknown";
}

bool scaleTypeFromString(const std::string& str, ScaleType& out) {
  if (str == "major")               out = ScaleType::Major;
  else if (str == "minor")          out = ScaleType::NaturalMinor;
  else if (str == "natural_minor")  out = ScaleType::NaturalMinor;
  else if (str == "harmonic_minor") out = ScaleType::HarmonicMinor;
  else if (str == "melodic_minor")  out = ScaleType::MelodicMinor;
  else if (str == "dorian")         out = ScaleType::Dorian;
  else if (str == "mixolydian")     out = ScaleType::Mixolydian;
  else if (str == "chromatic")      out = ScaleType::Chromatic;
  else return false;
  return true;
}

ScaleType scaleTypeFromString(const std::string& str) {
  ScaleType scale = ScaleType::Major;
  if (!scaleTypeFromString(str, scale)) return ScaleType::Major;  // Default
  return scale;
}

std::ostream& operator<<(std::ostream& os, const Event& event) {
  return os << "{pitch=" << event.pitch << ", start=" << event.start_time
            << ", duration=" << event.duration << ", velocity=" << event.velocity << "}";
}

}  // namespace tonelang
