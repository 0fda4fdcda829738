#pragma once

#include <optional>
#include <string>

struct Options {
  std::string filename; // "-" reads standard input
  std::optional<char> delimiter;
  bool auto_delimiter = false;
  bool debug = false;
  bool show_help = false;
};

// Throws ConfigError on an unknown option, a missing option value, an invalid
// delimiter or more than one filename.
Options parse_args(int argc, const char *const argv[]);
