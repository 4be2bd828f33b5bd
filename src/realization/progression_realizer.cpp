// Progression realization implementation.

#include "realization/progression_realizer.h"

#include <cstdio>

#include "core/json_helpers.h"
#include "realization/voicing_generator.h"

namespace continuo {

const char* realizationErrorToString(RealizationError error) {
  switch (error) {
    case RealizationError::None:           return "none";
    case RealizationError::NoValidVoicing: return "no_valid_voicing";
  }
  return "unknown";
}

ProgressionRealizer::ProgressionRealizer(const RealizerConfig& config)
    : config_(config) {}

size_t ProgressionRealizer::selectBest(const std::vector<Voicing>& candidates,
                                       const Voicing* prev, Pitch root,
                                       float* best_score) const {
  size_t best_idx = 0;
  float best = 0.0f;
  for (size_t idx = 0; idx < candidates.size(); ++idx) {
    float score = scoreVoicing(candidates[idx], prev, root, config_.ranges,
                               config_.weights);
    // Strict comparison keeps the earliest candidate on ties.
    if (idx == 0 || score > best) {
      best = score;
      best_idx = idx;
    }
  }
  if (best_score) *best_score = best;
  return best_idx;
}

RealizationResult ProgressionRealizer::realize(
    const std::vector<ChordSpec>& progression) const {
  RealizationResult result;
  result.voicings.reserve(progression.size());

  for (size_t idx = 0; idx < progression.size(); ++idx) {
    const ChordSpec& chord = progression[idx];
    std::vector<Voicing> candidates = generateVoicings(chord, config_.ranges);

    if (candidates.empty()) {
      result.voicings.clear();
      result.scores.clear();
      result.candidate_counts.clear();
      result.error = RealizationError::NoValidVoicing;
      result.failed_chord_index = idx;
      result.error_message = "No valid voicings found for chord " + std::to_string(idx) +
                             " (bass " + chord.bass.name() + ")";
      if (config_.verbose) {
        std::fprintf(stderr, "[Realizer] %s\n", result.error_message.c_str());
      }
      return result;
    }

    const Voicing* prev = result.voicings.empty() ? nullptr : &result.voicings.back();
    float best_score = 0.0f;
    size_t best_idx = selectBest(candidates, prev, chord.bass, &best_score);

    if (config_.verbose) {
      std::fprintf(stderr, "[Realizer] chord %zu: %zu candidates, best #%zu score %.1f -> %s\n",
                   idx, candidates.size(), best_idx, best_score,
                   voicingToString(candidates[best_idx]).c_str());
    }

    result.voicings.push_back(candidates[best_idx]);
    result.scores.push_back(best_score);
    result.candidate_counts.push_back(candidates.size());
  }

  result.success = true;
  return result;
}

RealizationResult realizeProgression(const std::vector<ChordSpec>& progression,
                                     const RealizerConfig& config) {
  ProgressionRealizer realizer(config);
  return realizer.realize(progression);
}

std::string buildRealizationJson(const RealizationResult& result) {
  JsonWriter writer;
  writer.beginObject();
  writer.key("success");
  writer.value(result.success);

  writer.key("voicings");
  writer.beginArray();
  for (size_t idx = 0; idx < result.voicings.size(); ++idx) {
    const Voicing& voicing = result.voicings[idx];
    writer.beginObject();
    writer.key("index");
    writer.value(idx);
    writer.key("soprano");
    writer.value(voicing.soprano.semitones());
    writer.key("alto");
    writer.value(voicing.alto.semitones());
    writer.key("tenor");
    writer.value(voicing.tenor.semitones());
    writer.key("bass");
    writer.value(voicing.bass.semitones());
    writer.key("names");
    writer.value(voicingToString(voicing));
    if (idx < result.scores.size()) {
      writer.key("score");
      writer.value(static_cast<double>(result.scores[idx]));
    }
    if (idx < result.candidate_counts.size()) {
      writer.key("candidates");
      writer.value(result.candidate_counts[idx]);
    }
    writer.endObject();
  }
  writer.endArray();

  if (!result.success) {
    writer.key("error");
    writer.beginObject();
    writer.key("kind");
    writer.value(realizationErrorToString(result.error));
    writer.key("chord_index");
    writer.value(result.failed_chord_index);
    writer.key("message");
    writer.value(result.error_message);
    writer.endObject();
  }
  writer.endObject();
  return writer.toString();
}

}  // namespace continuo
