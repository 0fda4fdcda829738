#include "include/delim.hpp"
#include "include/errors.hpp"
#include <array>
#include <cmath>
#include <string>
#include <vector>

bool is_valid_delimiter(char c) {
  return c == '\t' || (c >= 0x20 && c <= 0x7e);
}

char parse_delimiter(std::string_view arg) {
  if (arg == "\\t")
    return '\t';
  if (arg.size() != 1 || !is_valid_delimiter(arg[0]))
    throw ConfigError("Delimiter should be one printable ascii character, got '" +
                      std::string(arg) + "'");
  return arg[0];
}

// A quote opens quoting only as the first byte of a field, or right after a
// closing quote ("" inside a quoted field).
static size_t count_fields(std::string_view line, char delim) {
  size_t count = 1;
  bool in_quotes = false;
  bool may_open = true;
  for (char c : line) {
    if (c == '"' && (in_quotes || may_open)) {
      in_quotes = !in_quotes;
      may_open = !in_quotes;
    } else if (!in_quotes && c == delim) {
      ++count;
      may_open = true;
    } else {
      may_open = false;
    }
  }
  return count;
}

static bool is_candidate(char c) {
  return c == ',' || c == '\t' || c == '|' || c == ';';
}

// Records (quote-aware, CR stripped, blank lines dropped) from the sample.
static std::vector<std::string_view> sample_records(std::string_view sample,
                                                    size_t limit) {
  std::vector<std::string_view> records;
  size_t pos = 0;
  while (pos < sample.size() && records.size() < limit) {
    size_t start = pos;
    bool in_quotes = false;
    bool may_open = true;
    for (; pos < sample.size(); ++pos) {
      char c = sample[pos];
      if (c == '"' && (in_quotes || may_open)) {
        in_quotes = !in_quotes;
        may_open = !in_quotes;
      } else if (!in_quotes && c == '\n') {
        break;
      } else {
        may_open = is_candidate(c);
      }
    }
    size_t end = pos;
    if (end > start && sample[end - 1] == '\r')
      --end;
    if (end > start)
      records.push_back(sample.substr(start, end - start));
    ++pos; // skip \n
  }
  return records;
}

char detect_delimiter(std::string_view sample, size_t sample_lines) {
  constexpr std::array<char, 4> candidates = {',', '\t', '|', ';'};

  auto records = sample_records(sample, sample_lines);
  if (records.empty())
    return kDefaultDelimiter;

  char best = kDefaultDelimiter;
  double best_score = -1.0;
  double n = static_cast<double>(records.size());

  for (char c : candidates) {
    double sum = 0;
    std::vector<double> counts;
    counts.reserve(records.size());
    for (auto rec : records) {
      counts.push_back(static_cast<double>(count_fields(rec, c)));
      sum += counts.back();
    }

    // Need at least 2 fields to be a valid delimiter
    double mean = sum / n;
    if (mean < 2.0)
      continue;

    double var = 0;
    for (double v : counts)
      var += (v - mean) * (v - mean);
    double score = mean / (1.0 + std::sqrt(var / n));
    if (score > best_score) {
      best_score = score;
      best = c;
    }
  }

  return best;
}
