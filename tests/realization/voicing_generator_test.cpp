// Tests for realization/voicing_generator.h -- candidate enumeration.

#include "realization/voicing_generator.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

#include "test_helpers.h"

namespace continuo {
namespace {

using test_helpers::coversChordTones;
using test_helpers::makeVoicing;

std::vector<int> midiNumbers(const std::vector<Pitch>& pitches) {
  std::vector<int> out;
  for (Pitch pitch : pitches) out.push_back(pitch.semitones());
  return out;
}

// ---------------------------------------------------------------------------
// pitchesInRange
// ---------------------------------------------------------------------------

TEST(PitchesInRangeTest, CMajorInSopranoRange) {
  auto pitches = pitchesInRange({0, 4, 7}, VoiceRange{60, 79});
  EXPECT_EQ(midiNumbers(pitches), (std::vector<int>{60, 64, 67, 72, 76, 79}));
}

TEST(PitchesInRangeTest, IncludesRangeMinimum) {
  auto pitches = pitchesInRange({0}, VoiceRange{60, 79});
  EXPECT_EQ(midiNumbers(pitches), (std::vector<int>{60, 72}));
}

TEST(PitchesInRangeTest, IncludesRangeMaximum) {
  auto pitches = pitchesInRange({7}, VoiceRange{60, 79});
  EXPECT_EQ(midiNumbers(pitches), (std::vector<int>{67, 79}));
}

TEST(PitchesInRangeTest, SinglePitchRange) {
  EXPECT_EQ(midiNumbers(pitchesInRange({0, 4}, VoiceRange{60, 60})),
            (std::vector<int>{60}));
  EXPECT_TRUE(pitchesInRange({1}, VoiceRange{60, 60}).empty());
}

TEST(PitchesInRangeTest, SortedAndDeduplicated) {
  // Pitch class 0 listed twice and out of order with 7.
  auto pitches = pitchesInRange({7, 0, 0}, VoiceRange{55, 72});
  EXPECT_EQ(midiNumbers(pitches), (std::vector<int>{55, 60, 67, 72}));
}

// ---------------------------------------------------------------------------
// isValidVoicing
// ---------------------------------------------------------------------------

TEST(IsValidVoicingTest, AcceptsCloseRootPosition) {
  ChordSpec c_major = ChordSpec::fromPitches(48, {48, 52, 55});
  EXPECT_TRUE(isValidVoicing(makeVoicing(67, 64, 60, 48), c_major));
}

TEST(IsValidVoicingTest, RejectsVoiceCrossing) {
  ChordSpec c_major = ChordSpec::fromPitches(48, {48, 52, 55});
  EXPECT_FALSE(isValidVoicing(makeVoicing(64, 67, 60, 48), c_major));
  EXPECT_FALSE(isValidVoicing(makeVoicing(67, 60, 64, 48), c_major));
  EXPECT_FALSE(isValidVoicing(makeVoicing(67, 64, 60, 64), c_major));
}

TEST(IsValidVoicingTest, UnisonsAreNotCrossings) {
  ChordSpec c_major = ChordSpec::fromPitches(48, {48, 52, 55});
  EXPECT_TRUE(isValidVoicing(makeVoicing(64, 55, 48, 48), c_major));
}

TEST(IsValidVoicingTest, UpperGapLimitedToOctave) {
  ChordSpec c_major = ChordSpec::fromPitches(48, {48, 52, 55});
  EXPECT_TRUE(isValidVoicing(makeVoicing(76, 64, 55, 48), c_major));   // 12 and 9
  EXPECT_FALSE(isValidVoicing(makeVoicing(79, 64, 60, 48), c_major));  // 15
  EXPECT_FALSE(isValidVoicing(makeVoicing(72, 67, 52, 48), c_major));  // alto-tenor 15
}

TEST(IsValidVoicingTest, TenorBassGapIsUnbounded) {
  ChordSpec c_major = ChordSpec::fromPitches(40, {40, 43, 48});
  EXPECT_TRUE(isValidVoicing(makeVoicing(72, 67, 64, 40), c_major));
}

TEST(IsValidVoicingTest, RequiresEveryChordTone) {
  ChordSpec c_major = ChordSpec::fromPitches(48, {48, 52, 55});
  EXPECT_FALSE(isValidVoicing(makeVoicing(72, 67, 60, 48), c_major));  // no E
}

TEST(IsValidVoicingTest, BassCountsTowardCoverage) {
  // First inversion: E in the bass only.
  ChordSpec c_first_inversion = ChordSpec::fromPitches(52, {48, 52, 55});
  EXPECT_TRUE(isValidVoicing(makeVoicing(72, 67, 60, 52), c_first_inversion));
}

// ---------------------------------------------------------------------------
// VoicingEnumerator / generateVoicings
// ---------------------------------------------------------------------------

TEST(VoicingGeneratorTest, CMajorCandidateCount) {
  ChordSpec c_major = ChordSpec::fromPitches(48, {48, 52, 55});
  auto voicings = generateVoicings(c_major, VoiceRangeConfig{});
  EXPECT_EQ(voicings.size(), 23u);
}

TEST(VoicingGeneratorTest, CanonicalOrderSopranoOuterTenorInner) {
  ChordSpec c_major = ChordSpec::fromPitches(48, {48, 52, 55});
  auto voicings = generateVoicings(c_major, VoiceRangeConfig{});
  ASSERT_GE(voicings.size(), 3u);
  EXPECT_EQ(voicings[0], makeVoicing(60, 55, 52, 48));
  EXPECT_EQ(voicings[1], makeVoicing(64, 55, 48, 48));
  EXPECT_EQ(voicings[2], makeVoicing(64, 55, 52, 48));
  EXPECT_EQ(voicings.back(), makeVoicing(79, 72, 64, 48));

  // Lexicographic by (soprano, alto, tenor).
  for (size_t idx = 1; idx < voicings.size(); ++idx) {
    const Voicing& prev = voicings[idx - 1];
    const Voicing& curr = voicings[idx];
    bool ordered = prev.soprano < curr.soprano ||
                   (prev.soprano == curr.soprano &&
                    (prev.alto < curr.alto ||
                     (prev.alto == curr.alto && prev.tenor < curr.tenor)));
    EXPECT_TRUE(ordered) << "index " << idx;
  }
}

TEST(VoicingGeneratorTest, EveryCandidateSatisfiesInvariants) {
  VoiceRangeConfig ranges;
  for (const ChordSpec& chord : test_helpers::cadenceProgression()) {
    for (const Voicing& voicing : generateVoicings(chord, ranges)) {
      EXPECT_GE(voicing.soprano, voicing.alto);
      EXPECT_GE(voicing.alto, voicing.tenor);
      EXPECT_GE(voicing.tenor, voicing.bass);
      EXPECT_LE(voicing.soprano.semitones() - voicing.alto.semitones(), 12);
      EXPECT_LE(voicing.alto.semitones() - voicing.tenor.semitones(), 12);
      EXPECT_TRUE(coversChordTones(voicing, chord));
      EXPECT_TRUE(ranges.soprano.contains(voicing.soprano));
      EXPECT_TRUE(ranges.alto.contains(voicing.alto));
      EXPECT_TRUE(ranges.tenor.contains(voicing.tenor));
      EXPECT_EQ(voicing.bass, chord.bass);
    }
  }
}

TEST(VoicingGeneratorTest, BoundaryPitchesAppearInCandidateLists) {
  VoiceRangeConfig ranges;
  ChordSpec g_major = ChordSpec::fromPitches(55, {55, 59, 62});
  VoicingEnumerator g_enum(g_major, ranges);
  EXPECT_EQ(midiNumbers(g_enum.sopranoCandidates()),
            (std::vector<int>{62, 67, 71, 74, 79}));

  ChordSpec c_major = ChordSpec::fromPitches(48, {48, 52, 55});
  VoicingEnumerator c_enum(c_major, ranges);
  EXPECT_EQ(c_enum.altoCandidates().front(), Pitch(55));   // alto minimum
  EXPECT_EQ(c_enum.altoCandidates().back(), Pitch(72));    // alto maximum
  EXPECT_EQ(c_enum.tenorCandidates().front(), Pitch(48));  // tenor minimum
  EXPECT_EQ(c_enum.tenorCandidates().back(), Pitch(67));   // tenor maximum

  // A soprano top G must be usable in an actual voicing.
  auto voicings = generateVoicings(g_major, ranges);
  bool has_top = std::any_of(voicings.begin(), voicings.end(),
                             [](const Voicing& v) { return v.soprano == Pitch(79); });
  EXPECT_TRUE(has_top);
}

TEST(VoicingGeneratorTest, EnumeratorMatchesGenerateVoicings) {
  ChordSpec f_major = ChordSpec::fromPitches(53, {53, 57, 60});
  VoiceRangeConfig ranges;
  VoicingEnumerator enumerator(f_major, ranges);
  std::vector<Voicing> lazy;
  while (auto voicing = enumerator.next()) lazy.push_back(*voicing);

  EXPECT_EQ(lazy, generateVoicings(f_major, ranges));
  EXPECT_EQ(lazy.size(), 15u);
  EXPECT_EQ(enumerator.combinationCount(), 5u * 5u * 5u);
  EXPECT_FALSE(enumerator.next().has_value());
}

TEST(VoicingGeneratorTest, TooManyPitchClassesYieldsNothing) {
  // Five distinct pitch classes cannot fit into four voices.
  ChordSpec cluster = ChordSpec::fromPitches(48, {48, 49, 50, 51, 52});
  EXPECT_TRUE(generateVoicings(cluster, VoiceRangeConfig{}).empty());
}

TEST(VoicingGeneratorTest, PitchClassOutsideEveryRangeYieldsNothing) {
  VoiceRangeConfig ranges;
  ranges.soprano = {60, 62};
  ranges.alto = {60, 62};
  ranges.tenor = {60, 62};
  // F# (6) is not reachable in any upper voice and not in the bass.
  ChordSpec chord = ChordSpec::fromPitches(48, {48, 54});
  EXPECT_TRUE(generateVoicings(chord, ranges).empty());
}

TEST(VoicingGeneratorTest, CustomRangesAreRespected) {
  VoiceRangeConfig ranges;
  ranges.soprano = {72, 79};
  ChordSpec c_major = ChordSpec::fromPitches(48, {48, 52, 55});
  auto voicings = generateVoicings(c_major, ranges);
  ASSERT_FALSE(voicings.empty());
  for (const Voicing& voicing : voicings) {
    EXPECT_GE(voicing.soprano, Pitch(72));
  }
}

}  // namespace
}  // namespace continuo
