// Absolute pitch value type and pitch-class arithmetic.

#ifndef CONTINUO_CORE_PITCH_H
#define CONTINUO_CORE_PITCH_H

#include <cstdint>
#include <string>

namespace continuo {

// ---------------------------------------------------------------------------
// Interval constants (semitones)
// ---------------------------------------------------------------------------

namespace interval {

constexpr int kPerfect5th = 7;
constexpr int kOctave = 12;

}  // namespace interval

/// Middle C.
constexpr uint8_t kMidiC4 = 60;

/// Note names for pitch classes 0-11 (C=0).
constexpr const char* kNoteNames[] = {
    "C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B"};

/// @brief Immutable absolute pitch on the MIDI note-number scale (C4 = 60).
///
/// Construction performs no range validation: whether a pitch suits a voice
/// is decided by the voicing generator, not by the type.
class Pitch {
 public:
  constexpr Pitch() = default;
  constexpr explicit Pitch(uint8_t midi_number) : midi_number_(midi_number) {}

  /// @brief MIDI note number.
  constexpr uint8_t midiNumber() const { return midi_number_; }

  /// @brief Signed semitone value, for interval arithmetic.
  constexpr int semitones() const { return static_cast<int>(midi_number_); }

  /// @brief Pitch class (0-11), C=0.
  constexpr int pitchClass() const { return static_cast<int>(midi_number_) % 12; }

  /// @brief Octave number (C4 = octave 4).
  constexpr int octave() const { return static_cast<int>(midi_number_) / 12 - 1; }

  /// @brief Display name such as "C4" or "F#3".
  std::string name() const;

  constexpr bool operator==(const Pitch& other) const {
    return midi_number_ == other.midi_number_;
  }
  constexpr bool operator!=(const Pitch& other) const {
    return midi_number_ != other.midi_number_;
  }
  constexpr bool operator<(const Pitch& other) const {
    return midi_number_ < other.midi_number_;
  }
  constexpr bool operator>(const Pitch& other) const {
    return midi_number_ > other.midi_number_;
  }
  constexpr bool operator<=(const Pitch& other) const {
    return midi_number_ <= other.midi_number_;
  }
  constexpr bool operator>=(const Pitch& other) const {
    return midi_number_ >= other.midi_number_;
  }

 private:
  uint8_t midi_number_ = kMidiC4;
};

// ---------------------------------------------------------------------------
// Pitch utility functions
// ---------------------------------------------------------------------------

/// @brief Normalize any integer to a pitch class (0-11), handling negatives.
inline int normalizePitchClass(int value) {
  return ((value % 12) + 12) % 12;
}

/// @brief Convert a MIDI note number to a note name ("C4", "F#3").
/// @param midi_number MIDI note number (0-127).
std::string pitchToNoteName(uint8_t midi_number);

/// @brief Absolute interval between two pitches in semitones.
inline int absoluteInterval(Pitch pitch_a, Pitch pitch_b) {
  int diff = pitch_a.semitones() - pitch_b.semitones();
  return diff < 0 ? -diff : diff;
}

/// @brief Directed interval from `from` to `to`.
/// @return Positive if ascending, negative if descending, 0 if held.
inline int directedInterval(Pitch from, Pitch to) {
  return to.semitones() - from.semitones();
}

/// @brief Sign of a motion amount: -1, 0 or +1.
inline int motionDirection(int motion) {
  return (motion > 0) - (motion < 0);
}

}  // namespace continuo

#endif  // CONTINUO_CORE_PITCH_H
