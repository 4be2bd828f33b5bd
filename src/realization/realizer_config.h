// Loading RealizerConfig from a flat JSON object.

#ifndef CONTINUO_REALIZATION_REALIZER_CONFIG_H
#define CONTINUO_REALIZATION_REALIZER_CONFIG_H

#include <string>

#include "realization/progression_realizer.h"

namespace continuo {

/// @brief Apply a flat JSON configuration on top of `config`.
///
/// Recognized keys (all optional; unknown keys are ignored):
///   soprano_low, soprano_high, alto_low, alto_high, tenor_low, tenor_high,
///   bass_low, bass_high                       -- MIDI numbers 0-127
///   root_doubling_bonus, spacing_threshold, spacing_penalty,
///   range_comfort_penalty, parallel_penalty, voice_motion_penalty,
///   contrary_motion_bonus                     -- scoring weights
///   verbose                                   -- bool
///   progression                               -- progression text
///
/// @param json JSON text.
/// @param config In/out configuration; keys present in json override it.
/// @param progression If non-null and the "progression" key is present,
///        receives its text.
/// @param error If non-null, receives a description of the failure.
/// @return False on malformed JSON, pitch values that are not integers in
///         0-127, ranges with low > high, a spacing_threshold that is not an
///         integer in 0-127, or weights outside the float range. config is
///         left unchanged on failure.
bool applyRealizerConfigJson(const std::string& json, RealizerConfig& config,
                             std::string* progression, std::string* error);

/// @brief Read a JSON file and apply it via applyRealizerConfigJson().
bool loadRealizerConfigFile(const std::string& path, RealizerConfig& config,
                            std::string* progression, std::string* error);

}  // namespace continuo

#endif  // CONTINUO_REALIZATION_REALIZER_CONFIG_H
