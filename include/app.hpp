#pragma once

#include "include/csv_reader.hpp"
#include "include/find.hpp"
#include "include/input.hpp"
#include "include/tui.hpp"
#include "include/view.hpp"
#include <cstddef>
#include <memory>
#include <string>

// Per-frame glue between the input state machine, the row window and the
// current search: render, take one command, apply it, then pull whatever the
// background search has produced into the view state.
class App {
private:
  std::shared_ptr<const CsvReader> reader_;
  RowsView rows_view_;
  TableState table_state_;
  InputHandler input_;
  std::unique_ptr<Finder> finder_;
  bool first_found_scrolled_ = false;

  void scroll_to_found_record(const FoundRecord &record);
  void sync();

public:
  App(std::shared_ptr<const CsvReader> reader, std::string filename,
      size_t num_rows, bool debug = false);

  // Full frame for a terminal of the given size.
  std::string render(size_t term_rows, size_t term_cols);

  // Both return false once the user quits.
  bool handle_key(int key);
  bool apply(const Control &control);

  RowsView &rows_view() { return rows_view_; }
  const TableState &table_state() const { return table_state_; }
  const Finder *finder() const { return finder_.get(); }
  const InputHandler &input() const { return input_; }
};

FinderState finder_state_from(const Finder &finder);
