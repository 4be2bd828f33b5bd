// Voice range helpers.

#include "core/voice_range.h"

namespace continuo {

const char* voicePartToString(VoicePart part) {
  switch (part) {
    case VoicePart::Soprano: return "soprano";
    case VoicePart::Alto:    return "alto";
    case VoicePart::Tenor:   return "tenor";
    case VoicePart::Bass:    return "bass";
  }
  return "unknown";
}

const VoiceRange& VoiceRangeConfig::forPart(VoicePart part) const {
  switch (part) {
    case VoicePart::Soprano: return soprano;
    case VoicePart::Alto:    return alto;
    case VoicePart::Tenor:   return tenor;
    case VoicePart::Bass:    return bass;
  }
  return bass;
}

bool validateVoiceRanges(const VoiceRangeConfig& config, std::string* error) {
  for (uint8_t idx = 0; idx < kNumVoiceParts; ++idx) {
    VoicePart part = static_cast<VoicePart>(idx);
    const VoiceRange& range = config.forPart(part);
    if (range.low > range.high || range.high > 127) {
      if (error) {
        *error = std::string(voicePartToString(part)) + " range is invalid (" +
                 std::to_string(range.low) + "-" + std::to_string(range.high) + ")";
      }
      return false;
    }
  }
  return true;
}

}  // namespace continuo
