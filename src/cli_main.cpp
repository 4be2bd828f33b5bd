/// @file
/// @brief CLI entry point for the four-voice figured-bass realizer.

#include <cstdio>
#include <string>
#include <vector>

#include "analysis/progression_analyzer.h"
#include "cli/cli_options.h"
#include "realization/progression_realizer.h"
#include "realization/realization_types.h"
#include "realization/realizer_config.h"

namespace {

/// C major, F major, G major, C major in root position.
constexpr const char* kDefaultProgression =
    "48:48,52,55 53:53,57,60 55:55,59,62 48:48,52,55";

/// @brief Print usage information to stdout.
void printUsage() {
  std::printf("continuo_cli - Four-voice figured-bass realizer\n\n");
  std::printf("Usage: continuo_cli [options]\n\n");
  std::printf("Options:\n");
  std::printf("  --progression TEXT  Chords as BASS:TONE,TONE,... (MIDI numbers),\n");
  std::printf("                      separated by spaces or ';'\n");
  std::printf("  --config FILE       Flat JSON config (voice ranges, weights, progression)\n");
  std::printf("  --json              JSON output\n");
  std::printf("  --analyze           Print voice-leading analysis\n");
  std::printf("  --verbose           Log candidate selection to stderr\n");
  std::printf("  --help              Show this help\n");
  std::printf("\nDefault progression: %s\n", kDefaultProgression);
}

}  // namespace

int main(int argc, char* argv[]) {
  continuo::CliOptions opts;
  std::string arg_error;
  switch (continuo::parseCliArgs(argc, argv, opts, &arg_error)) {
    case continuo::CliParseStatus::Help:
      printUsage();
      return 0;
    case continuo::CliParseStatus::Error:
      std::fprintf(stderr, "Error: %s\n", arg_error.c_str());
      return 1;
    case continuo::CliParseStatus::Run:
      break;
  }

  continuo::RealizerConfig config;
  std::string progression_text = kDefaultProgression;
  if (!opts.config_path.empty()) {
    std::string error;
    if (!continuo::loadRealizerConfigFile(opts.config_path, config, &progression_text,
                                          &error)) {
      std::fprintf(stderr, "Error: %s\n", error.c_str());
      return 1;
    }
  }
  if (!opts.progression.empty()) progression_text = opts.progression;
  if (opts.verbose) config.verbose = true;

  std::vector<continuo::ChordSpec> progression;
  std::string parse_error;
  if (!continuo::parseProgression(progression_text, progression, &parse_error)) {
    std::fprintf(stderr, "Error: %s\n", parse_error.c_str());
    return 1;
  }

  continuo::RealizationResult result = continuo::realizeProgression(progression, config);
  if (!result.success) {
    if (opts.json_output) {
      std::printf("%s\n", continuo::buildRealizationJson(result).c_str());
    }
    std::fprintf(stderr, "Error: %s\n", result.error_message.c_str());
    return 1;
  }

  continuo::ProgressionReport report = continuo::analyzeProgression(result.voicings);

  if (opts.json_output) {
    std::printf("{\"realization\":%s,\"analysis\":%s}\n",
                continuo::buildRealizationJson(result).c_str(), report.toJson().c_str());
    return 0;
  }

  std::printf("Realizing figured bass progression...\n\n");
  for (size_t idx = 0; idx < result.voicings.size(); ++idx) {
    std::printf("Chord %zu: %s\n", idx + 1,
                continuo::voicingToString(result.voicings[idx]).c_str());
  }
  if (opts.analyze) {
    std::printf("\n%s", report.toTextSummary().c_str());
  }
  return 0;
}
