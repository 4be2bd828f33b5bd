// Progression voice-leading analysis.

#include "analysis/progression_analyzer.h"

#include <cstdio>

#include "core/json_helpers.h"
#include "realization/voicing_scorer.h"

namespace continuo {
namespace {

const char* parallelIntervalName(int interval) {
  return interval == interval::kOctave ? "octaves" : "fifths";
}

}  // namespace

ProgressionReport analyzeProgression(const std::vector<Voicing>& voicings) {
  ProgressionReport report;
  report.num_chords = voicings.size();

  for (size_t idx = 1; idx < voicings.size(); ++idx) {
    const Voicing& prev = voicings[idx - 1];
    const Voicing& curr = voicings[idx];

    if (auto parallel = findParallelMotion(prev, curr)) {
      ParallelMotionIssue issue;
      issue.chord_index = idx - 1;
      issue.upper = parallel->upper;
      issue.lower = parallel->lower;
      issue.interval = parallel->interval;
      report.parallel_issues.push_back(issue);
    }

    report.total_voice_motion += absoluteInterval(prev.soprano, curr.soprano) +
                                 absoluteInterval(prev.alto, curr.alto) +
                                 absoluteInterval(prev.tenor, curr.tenor);

    int sop_motion = directedInterval(prev.soprano, curr.soprano);
    int bass_motion = directedInterval(prev.bass, curr.bass);
    if (sop_motion != 0 && bass_motion != 0 &&
        motionDirection(sop_motion) != motionDirection(bass_motion)) {
      ++report.contrary_outer_motions;
    }
  }
  return report;
}

std::string ProgressionReport::toTextSummary() const {
  std::string text = "--- Analysis ---\n";
  char line[160];
  for (const auto& issue : parallel_issues) {
    // Chords are numbered from 1 in user-facing text.
    std::snprintf(line, sizeof(line),
                  "Warning: Parallel motion detected between chords %zu and %zu "
                  "(%s/%s %s)\n",
                  issue.chord_index + 1, issue.chord_index + 2,
                  voicePartToString(issue.upper), voicePartToString(issue.lower),
                  parallelIntervalName(issue.interval));
    text += line;
  }
  std::snprintf(line, sizeof(line), "Total voice motion: %d semitones\n",
                total_voice_motion);
  text += line;
  std::snprintf(line, sizeof(line), "Contrary outer-voice motion: %zu of %zu changes\n",
                contrary_outer_motions, num_chords > 0 ? num_chords - 1 : 0);
  text += line;
  return text;
}

std::string ProgressionReport::toJson() const {
  JsonWriter writer;
  writer.beginObject();
  writer.key("num_chords");
  writer.value(num_chords);
  writer.key("parallel_issues");
  writer.beginArray();
  for (const auto& issue : parallel_issues) {
    writer.beginObject();
    writer.key("chord_index");
    writer.value(issue.chord_index);
    writer.key("upper");
    writer.value(voicePartToString(issue.upper));
    writer.key("lower");
    writer.value(voicePartToString(issue.lower));
    writer.key("interval");
    writer.value(issue.interval);
    writer.endObject();
  }
  writer.endArray();
  writer.key("total_voice_motion");
  writer.value(total_voice_motion);
  writer.key("contrary_outer_motions");
  writer.value(contrary_outer_motions);
  writer.endObject();
  return writer.toString();
}

}  // namespace continuo
