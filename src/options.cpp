#include "include/options.hpp"
#include "include/delim.hpp"
#include "include/errors.hpp"
#include <cstring>

Options parse_args(int argc, const char *const argv[]) {
  Options opts;

  for (int i = 1; i < argc; ++i) {
    const char *arg = argv[i];
    if (std::strcmp(arg, "-d") == 0 || std::strcmp(arg, "--delimiter") == 0) {
      if (i + 1 >= argc)
        throw ConfigError(std::string("Missing value for ") + arg);
      const char *value = argv[++i];
      if (std::strcmp(value, "auto") == 0) {
        opts.auto_delimiter = true;
        opts.delimiter.reset();
      } else {
        opts.delimiter = parse_delimiter(value);
        opts.auto_delimiter = false;
      }
    } else if (std::strcmp(arg, "--debug") == 0) {
      opts.debug = true;
    } else if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
      opts.show_help = true;
    } else if (arg[0] != '-' || std::strcmp(arg, "-") == 0) {
      if (!opts.filename.empty())
        throw ConfigError(std::string("Unexpected argument: ") + arg);
      opts.filename = arg;
    } else {
      throw ConfigError(std::string("Unknown option: ") + arg);
    }
  }

  return opts;
}
