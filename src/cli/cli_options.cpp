// Command-line option parsing.

#include "cli/cli_options.h"

#include <cstdio>
#include <cstring>

namespace continuo {

CliParseStatus parseCliArgs(int argc, const char* const argv[], CliOptions& opts,
                            std::string* error) {
  for (int idx = 1; idx < argc; ++idx) {
    const char* arg = argv[idx];
    if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
      return CliParseStatus::Help;
    }
    if (std::strcmp(arg, "--progression") == 0 || std::strcmp(arg, "--config") == 0) {
      if (idx + 1 >= argc) {
        if (error) *error = std::string(arg) + " requires a value";
        return CliParseStatus::Error;
      }
      std::string& target =
          std::strcmp(arg, "--progression") == 0 ? opts.progression : opts.config_path;
      target = argv[++idx];
    } else if (std::strcmp(arg, "--json") == 0) {
      opts.json_output = true;
    } else if (std::strcmp(arg, "--analyze") == 0) {
      opts.analyze = true;
    } else if (std::strcmp(arg, "--verbose") == 0) {
      opts.verbose = true;
    } else {
      std::fprintf(stderr, "Warning: ignoring unknown argument '%s'\n", arg);
    }
  }
  return CliParseStatus::Run;
}

}  // namespace continuo
