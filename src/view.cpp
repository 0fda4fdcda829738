#include "include/view.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include <utility>

RowsView::RowsView(std::shared_ptr<const CsvReader> reader, size_t num_rows)
    : reader_(std::move(reader)), num_rows_(num_rows) {
  fetch();
}

const std::vector<Row> &RowsView::rows() {
  if (dirty_)
    fetch();
  return rows_;
}

void RowsView::fetch() {
  fetch_window();

  // A jump past the end (made on an estimate) saturates to the last full
  // window once the end is known
  if (rows_.empty() && rows_from_ > 0) {
    auto bottom = bottom_rows_from();
    if (bottom && rows_from_ > *bottom) {
      rows_from_ = *bottom;
      fetch_window();
    }
  }
}

void RowsView::fetch_window() {
  auto start = std::chrono::steady_clock::now();

  if (filter_) {
    filter_count_seen_ = filter_->count();
    std::vector<size_t> indices;
    for (const auto &found : filter_->slice(rows_from_, num_rows_))
      indices.push_back(found.row_index);
    rows_ = reader_->read_rows_at(indices);
  } else {
    rows_ = reader_->read_rows(rows_from_, num_rows_);
  }

  elapsed_ = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  dirty_ = false;
  spdlog::debug("fetched {} rows from {}{} in {} ms", rows_.size(), rows_from_,
                filter_ ? " (filtered)" : "", elapsed_->count());
}

std::optional<size_t> RowsView::bottom_rows_from() const {
  std::optional<size_t> total;
  if (filter_)
    total = filter_->count();
  else
    total = reader_->exact_total_rows();
  if (!total)
    return std::nullopt;
  return (*total > num_rows_) ? *total - num_rows_ : 0;
}

void RowsView::set_num_rows(size_t num_rows) {
  if (num_rows == num_rows_)
    return;
  num_rows_ = num_rows;
  dirty_ = true;
}

void RowsView::set_rows_from(size_t rows_from) {
  // A short window already past the bottom (reached before the total was
  // known) is left where it is; only moves toward the start apply there.
  if (auto bottom = bottom_rows_from())
    rows_from = std::min(rows_from, std::max(*bottom, rows_from_));
  if (rows_from == rows_from_)
    return;
  rows_from_ = rows_from;
  selected_.reset();
  dirty_ = true;
}

bool RowsView::in_view(size_t row_index) const {
  if (filter_)
    return std::any_of(rows_.begin(), rows_.end(),
                       [&](const Row &r) { return r.index == row_index; });
  return row_index >= rows_from_ && row_index - rows_from_ < num_rows_;
}

void RowsView::set_filter(const Finder &finder) {
  auto store = finder.store();
  if (store != filter_) {
    filter_ = std::move(store);
    selected_.reset();
    dirty_ = true;
    return;
  }
  // New matches only matter while the window still has room for them
  if (!dirty_ && rows_.size() < num_rows_ &&
      filter_->count() != filter_count_seen_)
    dirty_ = true;
}

void RowsView::reset_filter() {
  if (!filter_)
    return;
  rows_from_ = rows_.empty() ? 0 : rows_.front().index;
  filter_.reset();
  selected_.reset();
  dirty_ = true;
}

void RowsView::handle_control(const Control &control) {
  switch (control.kind) {
  case ControlKind::ScrollDown:
    set_rows_from(rows_from_ + 1);
    break;
  case ControlKind::ScrollUp:
    if (rows_from_ > 0)
      set_rows_from(rows_from_ - 1);
    break;
  case ControlKind::ScrollPageDown:
    set_rows_from(rows_from_ + num_rows_);
    break;
  case ControlKind::ScrollPageUp:
    set_rows_from(rows_from_ > num_rows_ ? rows_from_ - num_rows_ : 0);
    break;
  case ControlKind::ScrollTop:
    set_rows_from(0);
    break;
  case ControlKind::ScrollBottom: {
    auto total = get_total_line_numbers();
    if (!total)
      total = get_total_line_numbers_approx();
    if (total)
      set_rows_from(*total > num_rows_ ? *total - num_rows_ : 0);
    break;
  }
  case ControlKind::ScrollTo:
    set_rows_from(control.position);
    rows();
    if (control.position >= rows_from_ &&
        control.position - rows_from_ < num_rows_)
      selected_ = control.position - rows_from_;
    break;
  case ControlKind::Nothing:
  case ControlKind::Quit:
  case ControlKind::ScrollLeft:
  case ControlKind::ScrollRight:
  case ControlKind::ScrollToNextFound:
  case ControlKind::ScrollToPrevFound:
  case ControlKind::Find:
  case ControlKind::Filter:
  case ControlKind::BufferContent:
  case ControlKind::BufferReset:
    break;
  }

  if (dirty_)
    fetch();
}

std::optional<size_t> RowsView::get_total_line_numbers() const {
  if (filter_) {
    if (filter_->done())
      return filter_->count();
    return std::nullopt;
  }
  return reader_->exact_total_rows();
}

std::optional<size_t> RowsView::get_total_line_numbers_approx() const {
  if (filter_)
    return filter_->count();
  return reader_->approximate_total_rows();
}
