// Implementation of pitch utility functions.

#include "core/pitch_utils.h"

#include <cctype>
#include <cstring>

namespace tonelang {

namespace {

/// Octave digits beyond this count always land outside 0-127.
constexpr size_t kMaxOctaveDigits = 6;

std::string toLower(const std::string& text) {
  std::string lowered = text;
  for (char& chr : lowered) {
    chr = static_cast<char>(std::tolower(static_cast<unsigned char>(chr)));
  }
  return lowered;
}

std::string trim(const std::string& text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
  return text.substr(begin, end - begin);
}

/// @brief Look up a lower-case spelling in kPitchClassSpellings.
/// @return Semitone 0-11, or -1 if the spelling is unknown.
int lookupSpelling(const std::string& lowered) {
  for (const auto& spelling : kPitchClassSpellings) {
    if (std::strcmp(spelling.name, lowered.c_str()) == 0) {
      return spelling.semitone;
    }
  }
  return -1;
}

/// @brief Split a note name into pitch class and octave without range checks.
/// @param text Note name.
/// @param out_semitone Pitch class 0-11.
/// @param out_octave Signed octave (saturates for absurd digit counts).
/// @return False if the text is malformed.
bool splitNoteName(const std::string& text, int& out_semitone, long long& out_octave) {
  if (text.size() < 2) return false;

  size_t pos = 0;
  char letter = static_cast<char>(std::tolower(static_cast<unsigned char>(text[pos])));
  if (letter < 'a' || letter > 'g') return false;
  std::string spelling(1, letter);
  ++pos;

  if (pos < text.size() && (text[pos] == '#' || text[pos] == 'b' || text[pos] == 'B')) {
    spelling += (text[pos] == '#') ? '#' : 'b';
    ++pos;
  }

  bool negative = false;
  if (pos < text.size() && text[pos] == '-') {
    negative = true;
    ++pos;
  }

  size_t digit_start = pos;
  long long octave = 0;
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
    if (pos - digit_start < kMaxOctaveDigits) {
      octave = octave * 10 + (text[pos] - '0');
    }
    ++pos;
  }
  if (pos == digit_start || pos != text.size()) return false;
  if (pos - digit_start > kMaxOctaveDigits) octave = 1000000;  // Saturate

  int semitone = lookupSpelling(spelling);
  if (semitone < 0) return false;  // E#, Cb, etc.

  out_semitone = semitone;
  out_octave = negative ? -octave : octave;
  return true;
}

}  // namespace

const char* pitchErrorToString(PitchError error) {
  switch (error) {
    case PitchError::None:                    return "None";
    case PitchError::InvalidPitchClass:       return "InvalidPitchClass";
    case PitchError::InvalidPitchClassNumber: return "InvalidPitchClassNumber";
    case PitchError::InvalidMidi:             return "InvalidMidi";
    case PitchError::InvalidPitchName:        return "InvalidPitchName";
    case PitchError::OutOfRange:              return "OutOfRange";
  }
  return "Unknown";
}

bool isValidPitchClassName(const std::string& name) {
  return lookupSpelling(toLower(name)) >= 0;
}

bool isValidNoteName(const std::string& name) {
  return nameToMidi(name).ok();
}

PitchResult nameToSemitone(const std::string& name) {
  PitchResult result;
  int semitone = lookupSpelling(toLower(trim(name)));
  if (semitone < 0) {
    result.error = PitchError::InvalidPitchClass;
    result.input = name;
    result.error_message = "Invalid pitch class '" + name +
                           "' (expected C, C#, Db, D, ... B, any case)";
    return result;
  }
  result.value = semitone;
  return result;
}

NameResult semitoneToName(int semitone) {
  NameResult result;
  if (semitone < 0 || semitone >= kPitchClassCount) {
    result.error = PitchError::InvalidPitchClassNumber;
    result.input = std::to_string(semitone);
    result.error_message =
        "Invalid pitch class number " + result.input + " (expected 0-11)";
    return result;
  }
  result.name = kPitchClassNames[semitone];
  return result;
}

NameResult midiToName(int midi) {
  NameResult result;
  if (!isValidMidi(midi)) {
    result.error = PitchError::InvalidMidi;
    result.input = std::to_string(midi);
    result.error_message = "Invalid MIDI pitch " + result.input + " (expected 0-127)";
    return result;
  }
  result.name = std::string(kPitchClassNames[getPitchClass(midi)]) +
                std::to_string(getOctave(midi));
  return result;
}

PitchResult nameToMidi(const std::string& text) {
  PitchResult result;
  int semitone = 0;
  long long octave = 0;
  if (!splitNoteName(text, semitone, octave)) {
    result.error = PitchError::InvalidPitchName;
    result.input = text;
    result.error_message = "Invalid pitch name '" + text +
                           "' (expected <letter><accidental?><octave>, e.g. C3, F#4, Bb-1)";
    return result;
  }

  // MIDI = (octave + 2) * 12 + pitch class; C3 = 5 * 12 + 0 = 60.
  long long midi = (octave + kOctaveOffset) * kPitchClassCount + semitone;
  if (midi < kMidiPitchMin || midi > kMidiPitchMax) {
    result.error = PitchError::OutOfRange;
    result.input = text;
    result.error_message = "Pitch '" + text + "' is outside valid range 0-127 (C-2 to G8)";
    return result;
  }

  result.value = static_cast<int>(midi);
  return result;
}

}  // namespace tonelang
