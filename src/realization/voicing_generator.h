// Exhaustive four-voice candidate generation for a single chord.

#ifndef CONTINUO_REALIZATION_VOICING_GENERATOR_H
#define CONTINUO_REALIZATION_VOICING_GENERATOR_H

#include <cstddef>
#include <optional>
#include <vector>

#include "core/voice_range.h"
#include "realization/realization_types.h"

namespace continuo {

/// Largest allowed gap between adjacent upper voices (soprano-alto, alto-tenor).
constexpr int kMaxUpperVoiceGap = interval::kOctave;

/// @brief Every pitch of the given pitch classes inside an inclusive range.
///
/// Each pitch class is raised by octaves until it first reaches range.low, then
/// octaves are added while the pitch stays <= range.high. The result is sorted
/// ascending without duplicates.
///
/// @param pitch_classes Pitch classes (0-11) to place.
/// @param range Inclusive range.
/// @return Sorted, deduplicated pitches.
std::vector<Pitch> pitchesInRange(const std::vector<int>& pitch_classes,
                                  const VoiceRange& range);

/// @brief Check the structural invariants of a candidate voicing.
///
/// Soprano >= alto >= tenor >= bass, soprano-alto and alto-tenor at most an
/// octave, and the pitch classes of all four voices cover every required
/// chord tone.
bool isValidVoicing(const Voicing& voicing, const ChordSpec& chord);

/// @brief Lazy enumeration of the valid voicings of one chord.
///
/// Walks soprano x alto x tenor over the sorted per-voice pitch lists
/// (soprano outermost, tenor innermost) with the bass fixed to chord.bass, and
/// yields only combinations passing isValidVoicing(). The walk order is the
/// canonical generation order used for tie-breaking.
class VoicingEnumerator {
 public:
  VoicingEnumerator(const ChordSpec& chord, const VoiceRangeConfig& ranges);

  /// @brief Advance to the next valid voicing.
  /// @return The voicing, or std::nullopt once the product is exhausted.
  std::optional<Voicing> next();

  /// @brief Size of the unfiltered soprano x alto x tenor product.
  size_t combinationCount() const;

  const std::vector<Pitch>& sopranoCandidates() const { return soprano_; }
  const std::vector<Pitch>& altoCandidates() const { return alto_; }
  const std::vector<Pitch>& tenorCandidates() const { return tenor_; }

 private:
  ChordSpec chord_;
  std::vector<Pitch> soprano_;
  std::vector<Pitch> alto_;
  std::vector<Pitch> tenor_;
  size_t sop_idx_ = 0;
  size_t alto_idx_ = 0;
  size_t tenor_idx_ = 0;
};

/// @brief All valid voicings of a chord, in canonical generation order.
/// An empty result means the chord cannot be voiced within the ranges.
std::vector<Voicing> generateVoicings(const ChordSpec& chord,
                                      const VoiceRangeConfig& ranges);

}  // namespace continuo

#endif  // CONTINUO_REALIZATION_VOICING_GENERATOR_H
