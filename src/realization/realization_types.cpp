// Chord/voicing helpers and progression text parsing.

#include "realization/realization_types.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace continuo {

ChordSpec ChordSpec::fromPitches(uint8_t bass_pitch, const std::vector<uint8_t>& tones) {
  ChordSpec spec;
  spec.bass = Pitch(bass_pitch);
  for (uint8_t tone : tones) {
    int pc = Pitch(tone).pitchClass();
    if (std::find(spec.pitch_classes.begin(), spec.pitch_classes.end(), pc) ==
        spec.pitch_classes.end()) {
      spec.pitch_classes.push_back(pc);
    }
  }
  return spec;
}

Pitch Voicing::at(VoicePart part) const {
  switch (part) {
    case VoicePart::Soprano: return soprano;
    case VoicePart::Alto:    return alto;
    case VoicePart::Tenor:   return tenor;
    case VoicePart::Bass:    return bass;
  }
  return bass;
}

std::string voicingToString(const Voicing& voicing) {
  return "S:" + voicing.soprano.name() + " A:" + voicing.alto.name() +
         " T:" + voicing.tenor.name() + " B:" + voicing.bass.name();
}

namespace {

/// @brief Parse a MIDI note number (0-127) from a whole string.
bool parseMidiNumber(const std::string& str, uint8_t& out) {
  if (str.empty()) return false;
  for (char chr : str) {
    if (!std::isdigit(static_cast<unsigned char>(chr))) return false;
  }
  if (str.size() > 3) return false;
  long value = std::strtol(str.c_str(), nullptr, 10);
  if (value > 127) return false;
  out = static_cast<uint8_t>(value);
  return true;
}

/// @brief Parse one "BASS:TONE,TONE" token.
bool parseChordToken(const std::string& token, ChordSpec& out) {
  auto colon = token.find(':');
  if (colon == std::string::npos) return false;

  uint8_t bass = 0;
  if (!parseMidiNumber(token.substr(0, colon), bass)) return false;

  std::vector<uint8_t> tones;
  std::string rest = token.substr(colon + 1);
  size_t start = 0;
  while (start <= rest.size()) {
    size_t comma = rest.find(',', start);
    if (comma == std::string::npos) comma = rest.size();
    uint8_t tone = 0;
    if (!parseMidiNumber(rest.substr(start, comma - start), tone)) return false;
    tones.push_back(tone);
    start = comma + 1;
  }
  if (tones.empty()) return false;

  out = ChordSpec::fromPitches(bass, tones);
  return true;
}

}  // namespace

bool parseProgression(const std::string& text, std::vector<ChordSpec>& out,
                      std::string* error) {
  out.clear();
  std::string token;
  size_t chord_number = 0;

  auto flush = [&]() -> bool {
    if (token.empty()) return true;
    ++chord_number;
    ChordSpec spec;
    if (!parseChordToken(token, spec)) {
      if (error) {
        *error = "invalid chord " + std::to_string(chord_number) + " '" + token +
                 "' (expected BASS:TONE,TONE,... with MIDI numbers 0-127)";
      }
      return false;
    }
    out.push_back(spec);
    token.clear();
    return true;
  };

  for (char chr : text) {
    if (chr == ';' || std::isspace(static_cast<unsigned char>(chr))) {
      if (!flush()) {
        out.clear();
        return false;
      }
    } else {
      token += chr;
    }
  }
  if (!flush()) {
    out.clear();
    return false;
  }

  if (out.empty()) {
    if (error) *error = "progression is empty";
    return false;
  }
  return true;
}

}  // namespace continuo
