// Chord and voicing types shared by the realization engine.

#ifndef CONTINUO_REALIZATION_REALIZATION_TYPES_H
#define CONTINUO_REALIZATION_REALIZATION_TYPES_H

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "core/pitch.h"
#include "core/voice_range.h"

namespace continuo {

/// @brief One chord of the progression, already resolved from its figures.
///
/// The engine only reads the bass pitch and the pitch classes of the chord
/// tones; it never reinterprets figures.
struct ChordSpec {
  Pitch bass;
  std::vector<int> pitch_classes;  ///< Required chord-tone pitch classes (0-11).

  /// @brief Build a ChordSpec from a bass note and absolute chord tones.
  /// Chord tones are reduced to pitch classes; duplicates are kept once.
  static ChordSpec fromPitches(uint8_t bass_pitch, const std::vector<uint8_t>& tones);
};

/// @brief A complete four-voice pitch assignment for one chord.
struct Voicing {
  Pitch soprano;
  Pitch alto;
  Pitch tenor;
  Pitch bass;

  /// @brief Pitches ordered soprano, alto, tenor, bass.
  std::array<Pitch, kNumVoiceParts> pitches() const {
    return {soprano, alto, tenor, bass};
  }

  /// @brief Pitch sounded by the given voice.
  Pitch at(VoicePart part) const;

  bool operator==(const Voicing& other) const {
    return soprano == other.soprano && alto == other.alto &&
           tenor == other.tenor && bass == other.bass;
  }
  bool operator!=(const Voicing& other) const { return !(*this == other); }
};

/// @brief Format as "S:C5 A:G4 T:E4 B:C3".
std::string voicingToString(const Voicing& voicing);

/// @brief Parse a progression from text.
///
/// Chords are separated by whitespace or ';'. Each chord is
/// "BASS:TONE,TONE,..." with MIDI note numbers, e.g. "48:48,52,55".
///
/// @param text Progression text.
/// @param out Receives the parsed chords (cleared first).
/// @param error If non-null, receives a description of the first bad token.
/// @return True on success.
bool parseProgression(const std::string& text, std::vector<ChordSpec>& out,
                      std::string* error);

}  // namespace continuo

#endif  // CONTINUO_REALIZATION_REALIZATION_TYPES_H
