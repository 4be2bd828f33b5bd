// Heuristic desirability score for a candidate voicing.

#ifndef CONTINUO_REALIZATION_VOICING_SCORER_H
#define CONTINUO_REALIZATION_VOICING_SCORER_H

#include <optional>

#include "core/voice_range.h"
#include "realization/realization_types.h"

namespace continuo {

/// @brief Weights of the scoring terms. Selection depends on their exact
/// relative sizes.
struct ScoringWeights {
  float root_doubling_bonus = 10.0f;    ///< Per voice sounding the root's pitch class.
  int spacing_threshold = 7;            ///< Upper-voice gap tolerated without penalty.
  float spacing_penalty = 2.0f;         ///< Per semitone of gap beyond the threshold.
  float range_comfort_penalty = 0.1f;   ///< Per semitone from the range midpoint.
  float parallel_penalty = -1000.0f;    ///< Applied once for any parallel 5th/8ve.
  float voice_motion_penalty = 0.5f;    ///< Per semitone of upper-voice motion.
  float contrary_motion_bonus = 5.0f;   ///< Soprano and bass move in opposite directions.
};

/// @brief Individual scoring terms of one candidate.
///
/// Transition terms stay zero when there is no previous voicing.
struct ScoreBreakdown {
  float doubling = 0.0f;
  float spacing = 0.0f;
  float range_comfort = 0.0f;
  float parallel_motion = 0.0f;
  float voice_motion = 0.0f;
  float contrary_motion = 0.0f;

  /// @brief Sum of all terms, static terms first.
  float total() const;
};

/// @brief A parallel perfect interval between two voices across a chord change.
struct ParallelMotion {
  VoicePart upper = VoicePart::Soprano;
  VoicePart lower = VoicePart::Alto;
  int interval = 0;  ///< 7 (fifth) or 12 (octave).
};

/// @brief Find the first voice pair moving in parallel fifths or octaves.
///
/// Pairs are checked in order (S,A) (S,T) (S,B) (A,T) (A,B) (T,B). A pair is
/// parallel when its absolute interval is exactly 7 or exactly 12 in both
/// voicings and both voices move by a nonzero amount in the same direction.
/// Compound intervals are not reduced.
///
/// @param prev Previous voicing.
/// @param curr Current voicing.
/// @return The first offending pair, or std::nullopt.
std::optional<ParallelMotion> findParallelMotion(const Voicing& prev,
                                                 const Voicing& curr);

// ---------------------------------------------------------------------------
// Static terms
// ---------------------------------------------------------------------------

/// @brief Bonus for each voice sounding the root's pitch class.
float doublingScore(const Voicing& voicing, Pitch root,
                    const ScoringWeights& weights = {});

/// @brief Penalty for soprano-alto and alto-tenor gaps wider than a fifth.
float spacingScore(const Voicing& voicing, const ScoringWeights& weights = {});

/// @brief Penalty for upper voices far from the middle of their ranges.
float rangeComfortScore(const Voicing& voicing, const VoiceRangeConfig& ranges,
                        const ScoringWeights& weights = {});

// ---------------------------------------------------------------------------
// Transition terms
// ---------------------------------------------------------------------------

/// @brief weights.parallel_penalty if findParallelMotion() reports a pair, else 0.
float parallelMotionPenalty(const Voicing& prev, const Voicing& curr,
                            const ScoringWeights& weights = {});

/// @brief Penalty proportional to total soprano, alto and tenor motion.
float voiceMotionScore(const Voicing& prev, const Voicing& curr,
                       const ScoringWeights& weights = {});

/// @brief Bonus when soprano and bass both move, in opposite directions.
float contraryMotionBonus(const Voicing& prev, const Voicing& curr,
                          const ScoringWeights& weights = {});

// ---------------------------------------------------------------------------
// Combined score
// ---------------------------------------------------------------------------

/// @brief Evaluate every term for a candidate.
/// @param candidate Voicing under evaluation.
/// @param prev Previously selected voicing, or nullptr for the first chord.
/// @param root Pitch whose class earns the doubling bonus (the chord's bass).
/// @param ranges Voice ranges used for the comfort term.
/// @param weights Term weights.
ScoreBreakdown scoreVoicingTerms(const Voicing& candidate, const Voicing* prev,
                                 Pitch root, const VoiceRangeConfig& ranges,
                                 const ScoringWeights& weights = {});

/// @brief Total desirability of a candidate; higher is better, unbounded.
float scoreVoicing(const Voicing& candidate, const Voicing* prev, Pitch root,
                   const VoiceRangeConfig& ranges,
                   const ScoringWeights& weights = {});

}  // namespace continuo

#endif  // CONTINUO_REALIZATION_VOICING_SCORER_H
