// Tests for core/voice_range.h -- SATB range configuration.

#include "core/voice_range.h"

#include <gtest/gtest.h>

#include <string>

namespace continuo {
namespace {

TEST(VoiceRangeTest, DefaultRanges) {
  VoiceRangeConfig ranges;
  EXPECT_EQ(ranges.soprano.low, 60);
  EXPECT_EQ(ranges.soprano.high, 79);
  EXPECT_EQ(ranges.alto.low, 55);
  EXPECT_EQ(ranges.alto.high, 72);
  EXPECT_EQ(ranges.tenor.low, 48);
  EXPECT_EQ(ranges.tenor.high, 67);
  EXPECT_EQ(ranges.bass.low, 40);
  EXPECT_EQ(ranges.bass.high, 60);
}

TEST(VoiceRangeTest, MidpointIsIntegerAverage) {
  VoiceRangeConfig ranges;
  EXPECT_EQ(ranges.soprano.midpoint(), 69);
  EXPECT_EQ(ranges.alto.midpoint(), 63);
  EXPECT_EQ(ranges.tenor.midpoint(), 57);
  EXPECT_EQ(ranges.bass.midpoint(), 50);
}

TEST(VoiceRangeTest, ContainsIsInclusive) {
  VoiceRange range{55, 72};
  EXPECT_TRUE(range.contains(Pitch(55)));
  EXPECT_TRUE(range.contains(Pitch(72)));
  EXPECT_FALSE(range.contains(Pitch(54)));
  EXPECT_FALSE(range.contains(Pitch(73)));
}

TEST(VoiceRangeTest, ForPartReturnsMatchingRange) {
  VoiceRangeConfig ranges;
  EXPECT_EQ(ranges.forPart(VoicePart::Soprano).low, 60);
  EXPECT_EQ(ranges.forPart(VoicePart::Alto).low, 55);
  EXPECT_EQ(ranges.forPart(VoicePart::Tenor).low, 48);
  EXPECT_EQ(ranges.forPart(VoicePart::Bass).low, 40);
}

TEST(VoiceRangeTest, PartNames) {
  EXPECT_STREQ(voicePartToString(VoicePart::Soprano), "soprano");
  EXPECT_STREQ(voicePartToString(VoicePart::Bass), "bass");
}

TEST(VoiceRangeTest, ValidateAcceptsDefaults) {
  std::string error;
  EXPECT_TRUE(validateVoiceRanges(VoiceRangeConfig{}, &error));
  EXPECT_TRUE(error.empty());
}

TEST(VoiceRangeTest, ValidateRejectsInvertedRange) {
  VoiceRangeConfig ranges;
  ranges.tenor = {70, 50};
  std::string error;
  EXPECT_FALSE(validateVoiceRanges(ranges, &error));
  EXPECT_NE(error.find("tenor"), std::string::npos);
}

TEST(VoiceRangeTest, ValidateRejectsAboveMidiRange) {
  VoiceRangeConfig ranges;
  ranges.soprano = {60, 200};
  EXPECT_FALSE(validateVoiceRanges(ranges, nullptr));
}

}  // namespace
}  // namespace continuo
