#pragma once

#include "include/csv_reader.hpp"
#include "include/find.hpp"
#include "include/input.hpp"
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// The window of rows currently on screen. In filter mode rows_from and the
// window height count positions in the filter's match set, not raw rows.
class RowsView {
private:
  std::shared_ptr<const CsvReader> reader_;
  std::vector<Row> rows_;
  size_t num_rows_;
  size_t rows_from_ = 0;
  std::shared_ptr<const MatchStore> filter_;
  size_t filter_count_seen_ = 0;
  std::optional<size_t> selected_;
  std::optional<std::chrono::milliseconds> elapsed_;
  bool dirty_ = true;

  void fetch();
  void fetch_window();
  std::optional<size_t> bottom_rows_from() const;

public:
  RowsView(std::shared_ptr<const CsvReader> reader, size_t num_rows);

  const std::vector<std::string> &headers() const { return reader_->headers(); }

  const std::vector<Row> &rows();
  size_t rows_from() const { return rows_from_; }
  size_t num_rows() const { return num_rows_; }

  void set_num_rows(size_t num_rows);
  void set_rows_from(size_t rows_from);
  bool in_view(size_t row_index) const;

  void set_filter(const Finder &finder);
  void reset_filter();
  bool is_filter() const { return filter_ != nullptr; }

  void handle_control(const Control &control);

  std::optional<std::chrono::milliseconds> elapsed() const { return elapsed_; }
  std::optional<size_t> get_total_line_numbers() const;
  std::optional<size_t> get_total_line_numbers_approx() const;
  std::optional<size_t> selected() const { return selected_; }
};
