#pragma once

#include "include/csv_reader.hpp"
#include "include/find.hpp"
#include "include/input.hpp"
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Rows of the frame not used by data: top border, header, separator,
// bottom border, status bar.
constexpr size_t kNonDataLines = 5;

struct FinderState {
  bool active = false;
  bool filter = false;
  std::string pattern;
  size_t count = 0;
  bool done = false;
  std::optional<size_t> cursor_index;
  std::optional<FoundRecord> cursor;
  std::optional<std::chrono::milliseconds> elapsed;
};

struct TableState {
  std::string filename;
  size_t num_cols = 0;
  size_t cols_offset = 0;
  size_t num_cols_rendered = 0;
  size_t rows_offset = 0;
  std::optional<size_t> total_line_number;
  bool total_is_approx = false;
  std::optional<size_t> selected;
  InputMode buffer_mode = InputMode::Default;
  std::string buffer;
  FinderState finder_state;
  bool debug = false;
  std::optional<std::chrono::milliseconds> elapsed;

  TableState() = default;
  TableState(std::string filename, size_t num_cols)
      : filename(std::move(filename)), num_cols(num_cols) {}

  void set_cols_offset(size_t offset);
  bool has_more_cols_to_show() const {
    return cols_offset + num_cols_rendered < num_cols;
  }
  void set_buffer(InputMode mode, const std::string &content);
  void reset_buffer();
};

std::string truncate_str(std::string_view s, size_t max_w);

// One full frame as ANSI text, cursor-home first. Updates
// state.num_cols_rendered. Tolerates fewer rows than the window and a
// selected index past them.
std::string render_table(const std::vector<std::string> &headers,
                         const std::vector<Row> &rows, TableState &state,
                         size_t term_rows, size_t term_cols);
