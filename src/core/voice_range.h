// Per-voice pitch ranges for four-part writing.

#ifndef CONTINUO_CORE_VOICE_RANGE_H
#define CONTINUO_CORE_VOICE_RANGE_H

#include <cstdint>
#include <string>

#include "core/pitch.h"

namespace continuo {

// ---------------------------------------------------------------------------
// SATB pitch ranges (MIDI note numbers)
// ---------------------------------------------------------------------------

namespace satb_range {

// Soprano: C4-G5
constexpr uint8_t kSopranoLow = 60;
constexpr uint8_t kSopranoHigh = 79;

// Alto: G3-C5
constexpr uint8_t kAltoLow = 55;
constexpr uint8_t kAltoHigh = 72;

// Tenor: C3-G4
constexpr uint8_t kTenorLow = 48;
constexpr uint8_t kTenorHigh = 67;

// Bass: E2-C4
constexpr uint8_t kBassLow = 40;
constexpr uint8_t kBassHigh = 60;

}  // namespace satb_range

/// Voice parts of a four-voice texture, highest first.
enum class VoicePart : uint8_t {
  Soprano,
  Alto,
  Tenor,
  Bass
};

constexpr uint8_t kNumVoiceParts = 4;

/// @brief Convert VoicePart to human-readable string.
const char* voicePartToString(VoicePart part);

/// @brief Inclusive pitch range of one voice.
struct VoiceRange {
  uint8_t low = 0;
  uint8_t high = 127;

  /// @brief True if the pitch lies within [low, high].
  bool contains(Pitch pitch) const {
    return pitch.midiNumber() >= low && pitch.midiNumber() <= high;
  }

  /// @brief Integer average of low and high.
  int midpoint() const {
    return (static_cast<int>(low) + static_cast<int>(high)) / 2;
  }
};

/// @brief Ranges for all four voices. Passed explicitly into generation and
/// scoring; there is no process-wide range state.
struct VoiceRangeConfig {
  VoiceRange soprano = {satb_range::kSopranoLow, satb_range::kSopranoHigh};
  VoiceRange alto = {satb_range::kAltoLow, satb_range::kAltoHigh};
  VoiceRange tenor = {satb_range::kTenorLow, satb_range::kTenorHigh};
  VoiceRange bass = {satb_range::kBassLow, satb_range::kBassHigh};

  /// @brief Range for the given voice part.
  const VoiceRange& forPart(VoicePart part) const;
};

/// @brief Check that every range is well-formed (low <= high, high <= 127).
/// @param config Ranges to check.
/// @param error If non-null, receives a description of the first bad range.
/// @return True if all four ranges are usable.
bool validateVoiceRanges(const VoiceRangeConfig& config, std::string* error);

}  // namespace continuo

#endif  // CONTINUO_CORE_VOICE_RANGE_H
