#include <catch2/catch.hpp>
#include "include/csv_reader.hpp"
#include "include/tui.hpp"
#include "test_helpers.hpp"
#include <string>

static size_t count_lines(const std::string &s) {
  size_t n = 0;
  for (char c : s)
    if (c == '\n')
      ++n;
  return n;
}

static bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

// The status bar is everything after the last newline.
static std::string status_bar(const std::string &frame) {
  return frame.substr(frame.rfind('\n') + 1);
}

static Row make_row(size_t index, std::vector<std::string> fields) {
  Row row;
  row.index = index;
  row.fields = std::move(fields);
  return row;
}

TEST_CASE("truncate_str", "[output]") {
  REQUIRE(truncate_str("hello", 10) == "hello");
  REQUIRE(truncate_str("hello", 5) == "hello");
  REQUIRE(truncate_str("hello world", 8) == "hello...");
  REQUIRE(truncate_str("hello", 2) == "..");
  // Multi-byte characters count as one column
  REQUIRE(truncate_str("\xc3\xa9t\xc3\xa9", 3) == "\xc3\xa9t\xc3\xa9");
  REQUIRE(truncate_str("\xc3\xa9\xc3\xa9\xc3\xa9\xc3\xa9\xc3\xa9", 4) ==
          "\xc3\xa9...");
}

TEST_CASE("TableState: column offset is clamped", "[output]") {
  TableState state("f.csv", 4);
  state.set_cols_offset(2);
  REQUIRE(state.cols_offset == 2);
  state.set_cols_offset(10);
  REQUIRE(state.cols_offset == 3);

  state.num_cols_rendered = 1;
  REQUIRE_FALSE(state.has_more_cols_to_show());
  state.set_cols_offset(0);
  REQUIRE(state.has_more_cols_to_show());
}

TEST_CASE("render_table: frame from basic.csv", "[output]") {
  CsvReader reader(fixture_path("basic.csv"));
  auto rows = reader.read_rows(0, 3);
  TableState state("basic.csv", reader.column_count());
  state.total_line_number = 10;

  std::string out = render_table(reader.headers(), rows, state, 20, 200);

  REQUIRE(out.rfind("\033[H", 0) == 0);
  // Borders, header and separator plus one line per viewport row
  REQUIRE(count_lines(out) == 20 - 1);
  REQUIRE(contains(out, "name"));
  REQUIRE(contains(out, "department"));
  REQUIRE(contains(out, "Alice"));
  REQUIRE(contains(out, "Charlie"));
  REQUIRE_FALSE(contains(out, "Diana"));
  REQUIRE(state.num_cols_rendered == 6);
  REQUIRE_FALSE(state.has_more_cols_to_show());
}

TEST_CASE("render_table: line numbers are 1-based row indices", "[output]") {
  std::vector<std::string> headers = {"a", "b"};
  std::vector<Row> rows = {make_row(41, {"x", "y"}), make_row(42, {"z", "w"})};
  TableState state("f.csv", 2);
  state.rows_offset = 41;

  std::string out = render_table(headers, rows, state, 10, 80);
  REQUIRE(contains(out, "42"));
  REQUIRE(contains(out, "43"));
}

TEST_CASE("render_table: narrow terminal shows a subset of columns",
          "[output]") {
  std::vector<std::string> headers = {"first_column", "second_column",
                                      "third_column"};
  std::vector<Row> rows = {make_row(0, {"1", "2", "3"})};
  TableState state("f.csv", 3);

  render_table(headers, rows, state, 10, 40);
  REQUIRE(state.num_cols_rendered == 2);
  REQUIRE(state.has_more_cols_to_show());

  state.set_cols_offset(1);
  std::string out = render_table(headers, rows, state, 10, 40);
  REQUIRE_FALSE(contains(out, "first_column"));
  REQUIRE(contains(out, "second_column"));
}

TEST_CASE("render_table: long values are truncated", "[output]") {
  std::vector<std::string> headers = {"text"};
  std::vector<Row> rows = {make_row(0, {std::string(200, 'x')})};
  TableState state("f.csv", 1);

  std::string out = render_table(headers, rows, state, 10, 300);
  REQUIRE(contains(out, std::string(57, 'x') + "..."));
  REQUIRE_FALSE(contains(out, std::string(61, 'x')));
}

TEST_CASE("render_table: status bar", "[output]") {
  std::vector<std::string> headers = {"a"};
  std::vector<Row> rows = {make_row(0, {"1"})};
  TableState state("data.csv", 1);

  SECTION("unknown total") {
    std::string bar = status_bar(render_table(headers, rows, state, 10, 120));
    REQUIRE(contains(bar, "data.csv [Row 1/?]"));
    REQUIRE(contains(bar, "q quit"));
  }
  SECTION("approximate total") {
    state.rows_offset = 9;
    state.total_line_number = 1200;
    state.total_is_approx = true;
    std::string bar = status_bar(render_table(headers, rows, state, 10, 120));
    REQUIRE(contains(bar, "[Row 10/~1200]"));
  }
  SECTION("exact total") {
    state.total_line_number = 1234;
    std::string bar = status_bar(render_table(headers, rows, state, 10, 120));
    REQUIRE(contains(bar, "[Row 1/1234]"));
  }
  SECTION("find in progress") {
    state.finder_state.active = true;
    state.finder_state.pattern = "foo";
    state.finder_state.count = 7;
    state.finder_state.cursor_index = 2;
    std::string bar = status_bar(render_table(headers, rows, state, 10, 120));
    REQUIRE(contains(bar, "[\"foo\": 3/7...]"));
  }
  SECTION("filter finished") {
    state.finder_state.active = true;
    state.finder_state.filter = true;
    state.finder_state.pattern = "foo";
    state.finder_state.count = 1;
    state.finder_state.done = true;
    std::string bar = status_bar(render_table(headers, rows, state, 10, 120));
    REQUIRE(contains(bar, "[Filter \"foo\": 1 match]"));
  }
  SECTION("prompts replace the position") {
    state.set_buffer(InputMode::GotoLine, "12");
    std::string bar = status_bar(render_table(headers, rows, state, 10, 120));
    REQUIRE(contains(bar, "Go to line: 12"));
    REQUIRE_FALSE(contains(bar, "[Row"));

    state.set_buffer(InputMode::Find, "ab");
    bar = status_bar(render_table(headers, rows, state, 10, 120));
    REQUIRE(contains(bar, "Find: ab"));

    state.reset_buffer();
    bar = status_bar(render_table(headers, rows, state, 10, 120));
    REQUIRE(contains(bar, "[Row 1/?]"));
  }
  SECTION("debug timings") {
    state.debug = true;
    state.elapsed = std::chrono::milliseconds(3);
    std::string bar = status_bar(render_table(headers, rows, state, 10, 200));
    REQUIRE(contains(bar, "[Window: 3ms]"));
  }
}

TEST_CASE("render_table: matches are highlighted", "[output]") {
  std::vector<std::string> headers = {"a", "b"};
  std::vector<Row> rows = {make_row(0, {"foo", "bar"}),
                           make_row(1, {"xx", "food"})};
  TableState state("f.csv", 2);
  state.finder_state.active = true;
  state.finder_state.pattern = "foo";
  state.finder_state.cursor = FoundRecord{1, 1};

  std::string out = render_table(headers, rows, state, 10, 80);
  REQUIRE(contains(out, "\033[33mfoo\033[0m"));
  REQUIRE(contains(out, "\033[7;33mfood\033[0m"));
  REQUIRE_FALSE(contains(out, "\033[33mbar"));
}

TEST_CASE("render_table: selected row number is reversed", "[output]") {
  std::vector<std::string> headers = {"a"};
  std::vector<Row> rows = {make_row(0, {"p"}), make_row(1, {"q"})};
  TableState state("f.csv", 1);
  state.selected = 1;

  std::string out = render_table(headers, rows, state, 10, 80);
  REQUIRE(contains(out, "\033[7m2\033[0m"));

  // A selection past the rows on screen is ignored
  state.selected = 7;
  REQUIRE_NOTHROW(render_table(headers, rows, state, 10, 80));
}

TEST_CASE("render_table: empty rows and tiny terminals", "[output]") {
  std::vector<std::string> headers = {"a", "b"};
  TableState state("f.csv", 2);

  std::string out = render_table(headers, {}, state, 10, 80);
  REQUIRE(contains(out, "a"));
  REQUIRE(count_lines(out) == 9);

  REQUIRE_NOTHROW(render_table(headers, {}, state, 3, 5));
}
