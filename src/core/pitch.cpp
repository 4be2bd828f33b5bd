// Pitch naming.

#include "core/pitch.h"

namespace continuo {

std::string pitchToNoteName(uint8_t midi_number) {
  return Pitch(midi_number).name();
}

std::string Pitch::name() const {
  return std::string(kNoteNames[pitchClass()]) + std::to_string(octave());
}

}  // namespace continuo
