// RealizerConfig JSON loading.

#include "realization/realizer_config.h"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <limits>
#include <sstream>

#include "core/json_parser.h"

namespace continuo {
namespace {

/// Largest spacing threshold accepted from configuration (one MIDI range).
constexpr int kMaxSpacingThreshold = 127;

/// @brief Format a JSON number for an error message.
std::string numberText(double value) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%g", value);
  return buf;
}

/// @brief Read an optional integer member that must lie in [low, high].
bool readIntMember(const JsonObject& obj, const char* name, int low, int high,
                   int& out, std::string* error) {
  auto iter = obj.find(name);
  if (iter == obj.end()) return true;
  if (iter->second.type != JsonValue::Number) {
    if (error) *error = std::string(name) + " must be a number";
    return false;
  }
  double value = iter->second.number_val;
  if (value < low || value > high) {
    if (error) {
      *error = std::string(name) + " out of range " + std::to_string(low) + "-" +
               std::to_string(high) + ": " + numberText(value);
    }
    return false;
  }
  if (value != std::floor(value)) {
    if (error) *error = std::string(name) + " must be an integer: " + numberText(value);
    return false;
  }
  out = static_cast<int>(value);
  return true;
}

/// @brief Read an optional MIDI-number member into `out`.
bool readPitchMember(const JsonObject& obj, const char* name, uint8_t& out,
                     std::string* error) {
  int value = out;
  if (!readIntMember(obj, name, 0, 127, value, error)) return false;
  out = static_cast<uint8_t>(value);
  return true;
}

/// @brief Read an optional weight member; it must be a finite float.
bool readFloatMember(const JsonObject& obj, const char* name, float& out,
                     std::string* error) {
  auto iter = obj.find(name);
  if (iter == obj.end()) return true;
  if (iter->second.type != JsonValue::Number) {
    if (error) *error = std::string(name) + " must be a number";
    return false;
  }
  double value = iter->second.number_val;
  if (!std::isfinite(value) || std::fabs(value) > std::numeric_limits<float>::max()) {
    if (error) *error = std::string(name) + " out of float range: " + numberText(value);
    return false;
  }
  out = iter->second.asFloat(out);
  return true;
}

}  // namespace

bool applyRealizerConfigJson(const std::string& json, RealizerConfig& config,
                             std::string* progression, std::string* error) {
  JsonObject obj;
  std::string parse_error;
  if (!parseJsonObject(json.data(), json.size(), obj, &parse_error)) {
    if (error) *error = "invalid config JSON: " + parse_error;
    return false;
  }

  RealizerConfig updated = config;
  VoiceRangeConfig& ranges = updated.ranges;
  if (!readPitchMember(obj, "soprano_low", ranges.soprano.low, error) ||
      !readPitchMember(obj, "soprano_high", ranges.soprano.high, error) ||
      !readPitchMember(obj, "alto_low", ranges.alto.low, error) ||
      !readPitchMember(obj, "alto_high", ranges.alto.high, error) ||
      !readPitchMember(obj, "tenor_low", ranges.tenor.low, error) ||
      !readPitchMember(obj, "tenor_high", ranges.tenor.high, error) ||
      !readPitchMember(obj, "bass_low", ranges.bass.low, error) ||
      !readPitchMember(obj, "bass_high", ranges.bass.high, error)) {
    return false;
  }
  if (!validateVoiceRanges(ranges, error)) return false;

  ScoringWeights& weights = updated.weights;
  if (!readFloatMember(obj, "root_doubling_bonus", weights.root_doubling_bonus, error) ||
      !readFloatMember(obj, "spacing_penalty", weights.spacing_penalty, error) ||
      !readFloatMember(obj, "range_comfort_penalty", weights.range_comfort_penalty, error) ||
      !readFloatMember(obj, "parallel_penalty", weights.parallel_penalty, error) ||
      !readFloatMember(obj, "voice_motion_penalty", weights.voice_motion_penalty, error) ||
      !readFloatMember(obj, "contrary_motion_bonus", weights.contrary_motion_bonus, error) ||
      !readIntMember(obj, "spacing_threshold", 0, kMaxSpacingThreshold,
                     weights.spacing_threshold, error)) {
    return false;
  }

  auto verbose = obj.find("verbose");
  if (verbose != obj.end()) updated.verbose = verbose->second.asBool(updated.verbose);

  auto prog = obj.find("progression");
  if (progression && prog != obj.end() && prog->second.type == JsonValue::String) {
    *progression = prog->second.asString();
  }

  config = updated;
  return true;
}

bool loadRealizerConfigFile(const std::string& path, RealizerConfig& config,
                            std::string* progression, std::string* error) {
  std::ifstream file(path);
  if (!file.is_open()) {
    if (error) *error = "failed to open " + path;
    return false;
  }
  std::ostringstream contents;
  contents << file.rdbuf();
  return applyRealizerConfigJson(contents.str(), config, progression, error);
}

}  // namespace continuo
