#include "include/app.hpp"
#include "include/csv_reader.hpp"
#include "include/delim.hpp"
#include "include/errors.hpp"
#include "include/logging.hpp"
#include "include/options.hpp"
#include "include/pager.hpp"
#include "include/seekable_file.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <unistd.h>

// Window height until the first frame reports the real terminal size
static constexpr size_t kInitialRows = 50 - kNonDataLines;

static void print_usage() {
  std::cerr
      << "Usage: glimpse [options] <file.csv | ->\n"
      << "\n"
      << "Options:\n"
      << "  -d, --delimiter <c>  Field delimiter: one character, \\t, or auto\n"
      << "                       (default: ,)\n"
      << "  --debug              Show timings and log lines in the status bar\n"
      << "  -h, --help           Show this help\n"
      << "\n"
      << "Keys:\n"
      << "  j/k, arrows          Scroll one row\n"
      << "  space/b, PgDn/PgUp   Scroll one page\n"
      << "  g/G, Home/End        First/last row\n"
      << "  <n>G                 Go to line n\n"
      << "  h/l                  Scroll columns\n"
      << "  /<text>              Find, then n/N for next/previous match\n"
      << "  &<text>              Show only rows containing text\n"
      << "  Esc                  Clear find/filter\n"
      << "  q                    Quit\n"
      << "Stdin:   cat data.csv | glimpse -\n";
}

static char sniff_delimiter(const std::string &path) {
  FileHandle file(path);
  std::string sample(1 << 16, '\0');
  sample.resize(file.read_at(0, sample.data(), sample.size()));
  return detect_delimiter(sample);
}

int main(int argc, char *argv[]) {
  init_logging(false);

  Options opts;
  try {
    opts = parse_args(argc, argv);
  } catch (const ConfigError &e) {
    spdlog::error("{}", e.what());
    print_usage();
    return 1;
  }

  if (opts.show_help) {
    print_usage();
    return 0;
  }

  // Handle stdin: if no path and stdin is piped, read from stdin
  if (opts.filename.empty()) {
    if (isatty(STDIN_FILENO)) {
      print_usage();
      return 1;
    }
    opts.filename = "-";
  }

  init_logging(opts.debug);

  try {
    SeekableFile file(opts.filename == "-" ? "/dev/stdin" : opts.filename);

    char delim = opts.delimiter.value_or(kDefaultDelimiter);
    if (opts.auto_delimiter) {
      delim = sniff_delimiter(file.effective_path());
      spdlog::debug("detected delimiter '{}'", delim == '\t' ? "\\t"
                                                              : std::string(1, delim));
    }

    auto reader = std::make_shared<CsvReader>(file.effective_path(), delim);
    spdlog::debug("{}: {} columns, {} bytes", file.filename(),
                  reader->column_count(), reader->size());

    App app(reader, file.filename(), kInitialRows, opts.debug);
    run_pager(app);
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    return 1;
  }

  return 0;
}
