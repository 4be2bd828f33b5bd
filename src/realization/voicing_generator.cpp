// Voicing candidate generation implementation.

#include "realization/voicing_generator.h"

#include <algorithm>

namespace continuo {

std::vector<Pitch> pitchesInRange(const std::vector<int>& pitch_classes,
                                  const VoiceRange& range) {
  std::vector<Pitch> pitches;
  const int low = static_cast<int>(range.low);
  const int high = static_cast<int>(range.high);

  for (int pc : pitch_classes) {
    int midi = normalizePitchClass(pc);
    while (midi < low) midi += interval::kOctave;
    while (midi <= high) {
      pitches.push_back(Pitch(static_cast<uint8_t>(midi)));
      midi += interval::kOctave;
    }
  }

  std::sort(pitches.begin(), pitches.end());
  pitches.erase(std::unique(pitches.begin(), pitches.end()), pitches.end());
  return pitches;
}

bool isValidVoicing(const Voicing& voicing, const ChordSpec& chord) {
  // No voice crossing.
  if (voicing.soprano < voicing.alto) return false;
  if (voicing.alto < voicing.tenor) return false;
  if (voicing.tenor < voicing.bass) return false;

  // Upper voices stay within an octave of their neighbour.
  if (voicing.soprano.semitones() - voicing.alto.semitones() > kMaxUpperVoiceGap) {
    return false;
  }
  if (voicing.alto.semitones() - voicing.tenor.semitones() > kMaxUpperVoiceGap) {
    return false;
  }

  // Every chord tone is sounded by at least one voice.
  const auto pitches = voicing.pitches();
  for (int required : chord.pitch_classes) {
    int pc = normalizePitchClass(required);
    bool present = std::any_of(pitches.begin(), pitches.end(),
                               [pc](Pitch pitch) { return pitch.pitchClass() == pc; });
    if (!present) return false;
  }
  return true;
}

VoicingEnumerator::VoicingEnumerator(const ChordSpec& chord,
                                     const VoiceRangeConfig& ranges)
    : chord_(chord),
      soprano_(pitchesInRange(chord.pitch_classes, ranges.soprano)),
      alto_(pitchesInRange(chord.pitch_classes, ranges.alto)),
      tenor_(pitchesInRange(chord.pitch_classes, ranges.tenor)) {}

std::optional<Voicing> VoicingEnumerator::next() {
  if (alto_.empty() || tenor_.empty()) return std::nullopt;

  while (sop_idx_ < soprano_.size()) {
    Voicing candidate;
    candidate.soprano = soprano_[sop_idx_];
    candidate.alto = alto_[alto_idx_];
    candidate.tenor = tenor_[tenor_idx_];
    candidate.bass = chord_.bass;

    // Advance tenor fastest, then alto, then soprano.
    if (++tenor_idx_ == tenor_.size()) {
      tenor_idx_ = 0;
      if (++alto_idx_ == alto_.size()) {
        alto_idx_ = 0;
        ++sop_idx_;
      }
    }

    if (isValidVoicing(candidate, chord_)) return candidate;
  }
  return std::nullopt;
}

size_t VoicingEnumerator::combinationCount() const {
  return soprano_.size() * alto_.size() * tenor_.size();
}

std::vector<Voicing> generateVoicings(const ChordSpec& chord,
                                      const VoiceRangeConfig& ranges) {
  std::vector<Voicing> voicings;
  VoicingEnumerator enumerator(chord, ranges);
  while (auto candidate = enumerator.next()) {
    voicings.push_back(*candidate);
  }
  return voicings;
}

}  // namespace continuo
