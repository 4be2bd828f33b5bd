// Command-line option parsing for continuo_cli.

#ifndef CONTINUO_CLI_CLI_OPTIONS_H
#define CONTINUO_CLI_CLI_OPTIONS_H

#include <string>

namespace continuo {

/// @brief Command-line options parsed from argv.
struct CliOptions {
  std::string progression;
  std::string config_path;
  bool json_output = false;
  bool analyze = false;
  bool verbose = false;
};

/// Outcome of parseCliArgs().
enum class CliParseStatus {
  Run,   ///< Options parsed; realize the progression.
  Help,  ///< --help or -h given; print usage and exit 0.
  Error  ///< Unusable arguments; report and exit 1.
};

/// @brief Parse argv into CliOptions.
///
/// Unknown arguments are reported on stderr and skipped. An option that takes
/// a value (--progression, --config) but is the last argument is an error.
///
/// @param error If non-null, receives the message for CliParseStatus::Error.
CliParseStatus parseCliArgs(int argc, const char* const argv[], CliOptions& opts,
                            std::string* error);

}  // namespace continuo

#endif  // CONTINUO_CLI_CLI_OPTIONS_H
