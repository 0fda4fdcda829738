#include <catch2/catch.hpp>
#include "include/delim.hpp"
#include "include/errors.hpp"
#include "include/seekable_file.hpp"
#include "test_helpers.hpp"

static std::string read_all(const std::string &path) {
  FileHandle file(path);
  std::string data(file.size(), '\0');
  data.resize(file.read_at(0, data.data(), data.size()));
  return data;
}

// --- parse_delimiter ---

TEST_CASE("parse_delimiter: single printable character", "[delim]") {
  REQUIRE(parse_delimiter(",") == ',');
  REQUIRE(parse_delimiter(";") == ';');
  REQUIRE(parse_delimiter("|") == '|');
}

TEST_CASE("parse_delimiter: tab as byte or escape", "[delim]") {
  REQUIRE(parse_delimiter("\t") == '\t');
  REQUIRE(parse_delimiter("\\t") == '\t');
}

TEST_CASE("parse_delimiter: two characters rejected", "[delim]") {
  REQUIRE_THROWS_AS(parse_delimiter("ab"), ConfigError);
}

TEST_CASE("parse_delimiter: empty and non-printable rejected", "[delim]") {
  REQUIRE_THROWS_AS(parse_delimiter(""), ConfigError);
  REQUIRE_THROWS_AS(parse_delimiter("\x01"), ConfigError);
  REQUIRE_THROWS_AS(parse_delimiter("\xc3\xa9"), ConfigError);
}

// --- detect_delimiter ---

TEST_CASE("detect_delimiter: comma-separated data", "[delim]") {
  REQUIRE(detect_delimiter(read_all(fixture_path("basic.csv"))) == ',');
}

TEST_CASE("detect_delimiter: tab-separated data", "[delim]") {
  REQUIRE(detect_delimiter(read_all(fixture_path("tabs.tsv"))) == '\t');
}

TEST_CASE("detect_delimiter: pipe-separated data", "[delim]") {
  REQUIRE(detect_delimiter(read_all(fixture_path("pipes.csv"))) == '|');
}

TEST_CASE("detect_delimiter: semicolon-separated data", "[delim]") {
  REQUIRE(detect_delimiter(read_all(fixture_path("semicolons.csv"))) == ';');
}

TEST_CASE("detect_delimiter: empty data returns comma", "[delim]") {
  REQUIRE(detect_delimiter("") == ',');
}

TEST_CASE("detect_delimiter: quoted commas in pipe-delimited data",
          "[delim]") {
  REQUIRE(detect_delimiter("a|b|c\n\"x,y\"|d|e\n1|2|3\n") == '|');
}

TEST_CASE("detect_delimiter: quote inside a field is literal", "[delim]") {
  REQUIRE(detect_delimiter("name;height\nann;5'11\"\nbob;6'0\nc;\"x;\"\"y\"\n") ==
          ';');
}

TEST_CASE("detect_delimiter: sample_lines parameter", "[delim]") {
  // 3 tab-delimited lines, then 10 comma-delimited lines
  std::string content = "a\tb\tc\n1\t2\t3\n4\t5\t6\n";
  for (int i = 0; i < 10; ++i)
    content += "x,y,z\n";
  // Sampling only 3 lines should detect tab
  REQUIRE(detect_delimiter(content, 3) == '\t');
}
