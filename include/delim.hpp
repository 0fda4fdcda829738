#pragma once

#include <cstddef>
#include <string_view>

constexpr char kDefaultDelimiter = ',';

// Printable ASCII or TAB.
bool is_valid_delimiter(char c);

// Parses a -d/--delimiter argument: exactly one byte, or the two-character
// escape "\t". Throws ConfigError otherwise.
char parse_delimiter(std::string_view arg);

// Picks among , TAB | ; the candidate giving the most consistent field count
// over the first sample_lines records of sample.
char detect_delimiter(std::string_view sample, size_t sample_lines = 20);
