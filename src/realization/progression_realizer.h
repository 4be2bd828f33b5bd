// Sequential greedy realization of a chord progression into four voices.

#ifndef CONTINUO_REALIZATION_PROGRESSION_REALIZER_H
#define CONTINUO_REALIZATION_PROGRESSION_REALIZER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "core/voice_range.h"
#include "realization/realization_types.h"
#include "realization/voicing_scorer.h"

namespace continuo {

/// @brief Configuration for progression realization.
struct RealizerConfig {
  VoiceRangeConfig ranges;
  ScoringWeights weights;
  bool verbose = false;  ///< Log per-chord selection to stderr.
};

/// Failure kinds of a realization.
enum class RealizationError : uint8_t {
  None,
  NoValidVoicing  ///< A chord has no structurally valid voicing.
};

/// @brief Convert RealizationError to human-readable string.
const char* realizationErrorToString(RealizationError error);

/// @brief Outcome of realizing a progression.
///
/// On success, voicings[i] answers chord i. On failure, voicings is empty
/// (no partial output) and failed_chord_index names the offending chord.
struct RealizationResult {
  std::vector<Voicing> voicings;
  std::vector<float> scores;            ///< Winning score per chord.
  std::vector<size_t> candidate_counts; ///< Valid candidates per chord.
  bool success = false;
  RealizationError error = RealizationError::None;
  size_t failed_chord_index = 0;
  std::string error_message;
};

/// @brief Drives generation, scoring and selection chord by chord.
///
/// The only state carried between chords is the previously selected voicing,
/// so chords are processed strictly in order. For each chord the candidate
/// with the highest score wins; ties go to the candidate generated first.
class ProgressionRealizer {
 public:
  explicit ProgressionRealizer(const RealizerConfig& config = {});

  /// @brief Realize a whole progression.
  /// @param progression Chords in order.
  /// @return Voicings for every chord, or a NoValidVoicing failure.
  RealizationResult realize(const std::vector<ChordSpec>& progression) const;

  /// @brief Pick the best voicing among candidates.
  /// @param candidates Candidates in canonical generation order (non-empty).
  /// @param prev Previously selected voicing, or nullptr.
  /// @param root Root pitch for the doubling term.
  /// @param best_score If non-null, receives the winning score.
  /// @return Index of the winning candidate.
  size_t selectBest(const std::vector<Voicing>& candidates, const Voicing* prev,
                    Pitch root, float* best_score = nullptr) const;

  const RealizerConfig& config() const { return config_; }

 private:
  RealizerConfig config_;
};

/// @brief Convenience wrapper: realize with the given configuration.
RealizationResult realizeProgression(const std::vector<ChordSpec>& progression,
                                     const RealizerConfig& config = {});

/// @brief Serialize a realization result as a JSON object.
/// @param result Realization outcome.
/// @return JSON with "success", per-chord "voicings" (MIDI numbers, names,
///         score, candidate count) and, on failure, "error" details.
std::string buildRealizationJson(const RealizationResult& result);

}  // namespace continuo

#endif  // CONTINUO_REALIZATION_PROGRESSION_REALIZER_H
