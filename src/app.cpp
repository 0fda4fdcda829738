#include "include/app.hpp"
#include <spdlog/spdlog.h>
#include <utility>

FinderState finder_state_from(const Finder &finder) {
  FinderState fs;
  fs.active = true;
  fs.filter = finder.mode() == FindMode::Filter;
  fs.pattern = finder.pattern();
  fs.count = finder.count();
  fs.done = finder.done();
  fs.cursor_index = finder.cursor_index();
  fs.cursor = finder.current();
  fs.elapsed = finder.elapsed();
  return fs;
}

App::App(std::shared_ptr<const CsvReader> reader, std::string filename,
         size_t num_rows, bool debug)
    : reader_(reader), rows_view_(reader, num_rows),
      table_state_(std::move(filename), reader->column_count()) {
  table_state_.debug = debug;
  sync();
}

std::string App::render(size_t term_rows, size_t term_cols) {
  size_t num_rows =
      (term_rows > kNonDataLines) ? term_rows - kNonDataLines : 1;
  rows_view_.set_num_rows(num_rows);
  const auto &rows = rows_view_.rows();
  return render_table(rows_view_.headers(), rows, table_state_, term_rows,
                      term_cols);
}

bool App::handle_key(int key) { return apply(input_.handle_key(key)); }

void App::scroll_to_found_record(const FoundRecord &record) {
  if (!rows_view_.in_view(record.row_index))
    rows_view_.set_rows_from(record.row_index);

  size_t col = record.first_column;
  size_t first = table_state_.cols_offset;
  size_t last = first + table_state_.num_cols_rendered;
  if (col < first || col >= last)
    table_state_.set_cols_offset(col);
}

bool App::apply(const Control &control) {
  rows_view_.handle_control(control);

  switch (control.kind) {
  case ControlKind::Quit:
    return false;
  case ControlKind::ScrollTo:
    table_state_.reset_buffer();
    break;
  case ControlKind::ScrollLeft:
    if (table_state_.cols_offset > 0)
      table_state_.set_cols_offset(table_state_.cols_offset - 1);
    break;
  case ControlKind::ScrollRight:
    if (table_state_.has_more_cols_to_show())
      table_state_.set_cols_offset(table_state_.cols_offset + 1);
    break;
  case ControlKind::ScrollToNextFound:
    if (finder_ && !rows_view_.is_filter())
      if (auto found = finder_->next())
        scroll_to_found_record(*found);
    break;
  case ControlKind::ScrollToPrevFound:
    if (finder_ && !rows_view_.is_filter())
      if (auto found = finder_->prev())
        scroll_to_found_record(*found);
    break;
  case ControlKind::Find:
    finder_.reset();
    finder_ = std::make_unique<Finder>(reader_, control.text, FindMode::Find);
    first_found_scrolled_ = false;
    rows_view_.reset_filter();
    table_state_.reset_buffer();
    spdlog::info("find \"{}\"", control.text);
    break;
  case ControlKind::Filter:
    finder_.reset();
    finder_ =
        std::make_unique<Finder>(reader_, control.text, FindMode::Filter);
    table_state_.reset_buffer();
    rows_view_.set_rows_from(0);
    rows_view_.set_filter(*finder_);
    spdlog::info("filter \"{}\"", control.text);
    break;
  case ControlKind::BufferContent:
    table_state_.set_buffer(input_.mode(), control.text);
    break;
  case ControlKind::BufferReset:
    table_state_.reset_buffer();
    if (finder_) {
      finder_.reset();
      table_state_.finder_state = FinderState();
      rows_view_.reset_filter();
    }
    break;
  case ControlKind::Nothing:
  case ControlKind::ScrollUp:
  case ControlKind::ScrollDown:
  case ControlKind::ScrollPageUp:
  case ControlKind::ScrollPageDown:
  case ControlKind::ScrollTop:
  case ControlKind::ScrollBottom:
    break;
  }

  sync();
  return true;
}

void App::sync() {
  if (finder_) {
    if (!rows_view_.is_filter()) {
      // Scroll to the first result once there is one
      if (!first_found_scrolled_ && finder_->count() > 0) {
        finder_->set_row_hint(0);
        if (auto found = finder_->next())
          scroll_to_found_record(*found);
        first_found_scrolled_ = true;
      }

      // A cursor scrolled out of view re-anchors on the next n/N
      if (auto row = finder_->cursor_row_index())
        if (!rows_view_.in_view(*row))
          finder_->reset_cursor();

      finder_->set_row_hint(rows_view_.rows_from());
    } else {
      rows_view_.set_filter(*finder_);
    }
    table_state_.finder_state = finder_state_from(*finder_);
  }

  table_state_.elapsed = rows_view_.elapsed();
  table_state_.rows_offset = rows_view_.rows_from();
  table_state_.selected = rows_view_.selected();

  if (auto n = rows_view_.get_total_line_numbers()) {
    table_state_.total_line_number = n;
    table_state_.total_is_approx = false;
  } else {
    table_state_.total_line_number = rows_view_.get_total_line_numbers_approx();
    table_state_.total_is_approx = true;
  }
}
