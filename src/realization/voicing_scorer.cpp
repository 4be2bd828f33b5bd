// Voicing scoring implementation.

#include "realization/voicing_scorer.h"

#include <cstdlib>

namespace continuo {

float ScoreBreakdown::total() const {
  float score = 0.0f;
  score += doubling;
  score += spacing;
  score += range_comfort;
  score += parallel_motion;
  score += voice_motion;
  score += contrary_motion;
  return score;
}

std::optional<ParallelMotion> findParallelMotion(const Voicing& prev,
                                                 const Voicing& curr) {
  const auto prev_pitches = prev.pitches();
  const auto curr_pitches = curr.pitches();

  for (uint8_t upper = 0; upper < kNumVoiceParts; ++upper) {
    for (uint8_t lower = upper + 1; lower < kNumVoiceParts; ++lower) {
      int prev_iv = absoluteInterval(prev_pitches[upper], prev_pitches[lower]);
      int curr_iv = absoluteInterval(curr_pitches[upper], curr_pitches[lower]);

      bool is_perfect = prev_iv == interval::kPerfect5th || prev_iv == interval::kOctave;
      if (!is_perfect || prev_iv != curr_iv) continue;

      int motion_upper = directedInterval(prev_pitches[upper], curr_pitches[upper]);
      int motion_lower = directedInterval(prev_pitches[lower], curr_pitches[lower]);
      if (motion_upper == 0 || motion_lower == 0) continue;
      if (motionDirection(motion_upper) != motionDirection(motion_lower)) continue;

      ParallelMotion found;
      found.upper = static_cast<VoicePart>(upper);
      found.lower = static_cast<VoicePart>(lower);
      found.interval = curr_iv;
      return found;
    }
  }
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// Static terms
// ---------------------------------------------------------------------------

float doublingScore(const Voicing& voicing, Pitch root, const ScoringWeights& weights) {
  const int root_pc = root.pitchClass();
  float score = 0.0f;
  for (Pitch pitch : voicing.pitches()) {
    if (pitch.pitchClass() == root_pc) {
      score += weights.root_doubling_bonus;
    }
  }
  return score;
}

float spacingScore(const Voicing& voicing, const ScoringWeights& weights) {
  float score = 0.0f;
  int sop_alto_gap = voicing.soprano.semitones() - voicing.alto.semitones();
  int alto_tenor_gap = voicing.alto.semitones() - voicing.tenor.semitones();

  if (sop_alto_gap > weights.spacing_threshold) {
    score -= static_cast<float>(sop_alto_gap - weights.spacing_threshold) *
             weights.spacing_penalty;
  }
  if (alto_tenor_gap > weights.spacing_threshold) {
    score -= static_cast<float>(alto_tenor_gap - weights.spacing_threshold) *
             weights.spacing_penalty;
  }
  return score;
}

float rangeComfortScore(const Voicing& voicing, const VoiceRangeConfig& ranges,
                        const ScoringWeights& weights) {
  float score = 0.0f;
  score -= static_cast<float>(std::abs(voicing.soprano.semitones() - ranges.soprano.midpoint())) *
           weights.range_comfort_penalty;
  score -= static_cast<float>(std::abs(voicing.alto.semitones() - ranges.alto.midpoint())) *
           weights.range_comfort_penalty;
  score -= static_cast<float>(std::abs(voicing.tenor.semitones() - ranges.tenor.midpoint())) *
           weights.range_comfort_penalty;
  return score;
}

// ---------------------------------------------------------------------------
// Transition terms
// ---------------------------------------------------------------------------

float parallelMotionPenalty(const Voicing& prev, const Voicing& curr,
                            const ScoringWeights& weights) {
  return findParallelMotion(prev, curr) ? weights.parallel_penalty : 0.0f;
}

float voiceMotionScore(const Voicing& prev, const Voicing& curr,
                       const ScoringWeights& weights) {
  int total_motion = absoluteInterval(prev.soprano, curr.soprano) +
                     absoluteInterval(prev.alto, curr.alto) +
                     absoluteInterval(prev.tenor, curr.tenor);
  return -weights.voice_motion_penalty * static_cast<float>(total_motion);
}

float contraryMotionBonus(const Voicing& prev, const Voicing& curr,
                          const ScoringWeights& weights) {
  int sop_motion = directedInterval(prev.soprano, curr.soprano);
  int bass_motion = directedInterval(prev.bass, curr.bass);
  if (sop_motion != 0 && bass_motion != 0 &&
      motionDirection(sop_motion) != motionDirection(bass_motion)) {
    return weights.contrary_motion_bonus;
  }
  return 0.0f;
}

// ---------------------------------------------------------------------------
// Combined score
// ---------------------------------------------------------------------------

ScoreBreakdown scoreVoicingTerms(const Voicing& candidate, const Voicing* prev,
                                 Pitch root, const VoiceRangeConfig& ranges,
                                 const ScoringWeights& weights) {
  ScoreBreakdown terms;
  terms.doubling = doublingScore(candidate, root, weights);
  terms.spacing = spacingScore(candidate, weights);
  terms.range_comfort = rangeComfortScore(candidate, ranges, weights);

  if (prev != nullptr) {
    terms.parallel_motion = parallelMotionPenalty(*prev, candidate, weights);
    terms.voice_motion = voiceMotionScore(*prev, candidate, weights);
    terms.contrary_motion = contraryMotionBonus(*prev, candidate, weights);
  }
  return terms;
}

float scoreVoicing(const Voicing& candidate, const Voicing* prev, Pitch root,
                   const VoiceRangeConfig& ranges, const ScoringWeights& weights) {
  return scoreVoicingTerms(candidate, prev, root, ranges, weights).total();
}

}  // namespace continuo
