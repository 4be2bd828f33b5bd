// Post-hoc voice-leading report for a realized progression.

#ifndef CONTINUO_ANALYSIS_PROGRESSION_ANALYZER_H
#define CONTINUO_ANALYSIS_PROGRESSION_ANALYZER_H

#include <cstddef>
#include <string>
#include <vector>

#include "core/voice_range.h"
#include "realization/realization_types.h"

namespace continuo {

/// A parallel fifth or octave between chord `chord_index` and the next chord.
struct ParallelMotionIssue {
  size_t chord_index = 0;  ///< 0-based index of the first chord of the pair.
  VoicePart upper = VoicePart::Soprano;
  VoicePart lower = VoicePart::Alto;
  int interval = 0;        ///< 7 or 12.
};

/// @brief Voice-leading statistics of a realized progression.
struct ProgressionReport {
  size_t num_chords = 0;
  std::vector<ParallelMotionIssue> parallel_issues;
  int total_voice_motion = 0;      ///< Sum of |dS|+|dA|+|dT| over chord changes.
  size_t contrary_outer_motions = 0; ///< Chord changes with contrary soprano/bass motion.

  /// @brief True if no consecutive pair moves in parallel fifths or octaves.
  bool isClean() const { return parallel_issues.empty(); }

  /// @brief Human-readable summary, one line per finding.
  std::string toTextSummary() const;

  /// @brief Write the report as a JSON object.
  std::string toJson() const;
};

/// @brief Analyze consecutive voicings for parallels and overall motion.
/// @param voicings Realized progression.
/// @return Report; empty statistics for fewer than two voicings.
ProgressionReport analyzeProgression(const std::vector<Voicing>& voicings);

}  // namespace continuo

#endif  // CONTINUO_ANALYSIS_PROGRESSION_ANALYZER_H
