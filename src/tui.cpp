#include "include/tui.hpp"
#include "include/logging.hpp"
#include <algorithm>

static constexpr size_t kMaxColWidth = 60;

// --- TableState ---

void TableState::set_cols_offset(size_t offset) {
  cols_offset = (num_cols > 0) ? std::min(offset, num_cols - 1) : 0;
}

void TableState::set_buffer(InputMode mode, const std::string &content) {
  buffer_mode = mode;
  buffer = content;
}

void TableState::reset_buffer() {
  buffer_mode = InputMode::Default;
  buffer.clear();
}

// --- Text helpers ---

// Display width in code points; continuation bytes take no column.
static size_t display_width(std::string_view s) {
  size_t w = 0;
  for (unsigned char c : s)
    if ((c & 0xC0) != 0x80)
      ++w;
  return w;
}

// Longest prefix of s that is at most max_w columns wide.
static std::string_view display_prefix(std::string_view s, size_t max_w) {
  size_t w = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) {
      if (w == max_w)
        return s.substr(0, i);
      ++w;
    }
  }
  return s;
}

std::string truncate_str(std::string_view s, size_t max_w) {
  if (display_width(s) <= max_w)
    return std::string(s);
  if (max_w <= 3)
    return std::string(max_w, '.');
  return std::string(display_prefix(s, max_w - 3)) + "...";
}

static std::string cell_text(std::string_view s) {
  std::string out(s);
  for (char &ch : out)
    if (ch == '\n' || ch == '\r' || ch == '\t')
      ch = ' ';
  return out;
}

static size_t digits(size_t n) {
  size_t d = 1;
  while (n >= 10) {
    n /= 10;
    ++d;
  }
  return d;
}

// --- Status bar ---

static std::string finder_status(const FinderState &fs) {
  if (!fs.active)
    return "";
  std::string s = " [";
  if (fs.filter) {
    s += "Filter \"" + fs.pattern + "\": " + std::to_string(fs.count) +
         (fs.count == 1 ? " match" : " matches");
  } else {
    s += "\"" + fs.pattern + "\": ";
    s += fs.cursor_index ? std::to_string(*fs.cursor_index + 1) : "-";
    s += "/" + std::to_string(fs.count);
  }
  if (!fs.done)
    s += "...";
  return s + "]";
}

static std::string status_line(const TableState &st) {
  switch (st.buffer_mode) {
  case InputMode::GotoLine:
    return " Go to line: " + st.buffer;
  case InputMode::Find:
    return " Find: " + st.buffer + "\xe2\x96\x8b"; // cursor block
  case InputMode::Filter:
    return " Filter: " + st.buffer + "\xe2\x96\x8b";
  case InputMode::Default:
    break;
  }

  std::string total = "?";
  if (st.total_line_number)
    total = (st.total_is_approx ? "~" : "") +
            std::to_string(*st.total_line_number);

  std::string s = " " + st.filename + " [Row " +
                  std::to_string(st.rows_offset + 1) + "/" + total + "]";
  s += finder_status(st.finder_state);

  if (st.debug) {
    s += " [Window: ";
    s += st.elapsed ? std::to_string(st.elapsed->count()) + "ms" : "-";
    if (st.finder_state.elapsed)
      s += ", Find: " + std::to_string(st.finder_state.elapsed->count()) + "ms";
    s += "]";
    auto lines = recent_log_lines(1);
    if (!lines.empty()) {
      std::string last = lines.back();
      while (!last.empty() && (last.back() == '\n' || last.back() == '\r'))
        last.pop_back();
      s += " " + last;
    }
  }
  return s;
}

// --- Main render ---

std::string render_table(const std::vector<std::string> &headers,
                         const std::vector<Row> &rows, TableState &state,
                         size_t term_rows, size_t term_cols) {
  std::string buf;
  buf.reserve(term_rows * term_cols * 2);
  buf += "\033[H"; // cursor home

  size_t vp = (term_rows > kNonDataLines) ? term_rows - kNonDataLines : 1;
  size_t ncols = headers.size();
  const FinderState &fs = state.finder_state;
  bool highlight = fs.active && !fs.pattern.empty();

  // Line number column
  size_t last_line = rows.empty() ? state.rows_offset + 1 : rows.back().index + 1;
  size_t num_w = digits(last_line);

  // Columns that fit, starting at cols_offset: "│" + (" " + cell + " │")*
  std::vector<size_t> widths;
  size_t used = 1 + num_w + 3;
  for (size_t c = state.cols_offset; c < ncols; ++c) {
    size_t w = display_width(headers[c]);
    for (const auto &row : rows)
      if (c < row.fields.size())
        w = std::max(w, display_width(row.fields[c]));
    w = std::clamp(w, static_cast<size_t>(1), kMaxColWidth);
    if (used + w + 3 > term_cols) {
      // Always show at least part of one column
      if (widths.empty() && used + 4 <= term_cols)
        widths.push_back(term_cols - used - 3);
      break;
    }
    widths.push_back(w);
    used += w + 3;
  }
  state.num_cols_rendered = widths.size();

  auto hline = [&](const char *left, const char *mid, const char *right) {
    buf += left;
    for (size_t i = 0; i < num_w + 2; ++i)
      buf += "\xe2\x94\x80"; // ─
    for (size_t w : widths) {
      buf += mid;
      for (size_t i = 0; i < w + 2; ++i)
        buf += "\xe2\x94\x80";
    }
    buf += right;
    buf += "\033[K\n"; // clear to end of line
  };

  auto cell = [&](const std::string &display, size_t w, const char *style) {
    buf += " ";
    if (style)
      buf += style;
    buf += display;
    if (style)
      buf += "\033[0m";
    buf.append(w - display_width(display), ' ');
    buf += " \xe2\x94\x82"; // │
  };

  // Top border
  hline("\xe2\x94\x8c", "\xe2\x94\xac", "\xe2\x94\x90"); // ┌ ┬ ┐

  // Header row
  buf += "\xe2\x94\x82";
  cell(std::string(num_w, ' '), num_w, nullptr);
  for (size_t i = 0; i < widths.size(); ++i)
    cell(truncate_str(cell_text(headers[state.cols_offset + i]), widths[i]),
         widths[i], "\033[1m");
  buf += "\033[K\n";

  // Separator
  hline("\xe2\x94\x9c", "\xe2\x94\xbc", "\xe2\x94\xa4"); // ├ ┼ ┤

  // Data rows
  for (size_t r = 0; r < vp; ++r) {
    buf += "\xe2\x94\x82";
    if (r >= rows.size()) {
      buf.append(num_w + 2, ' ');
      buf += "\xe2\x94\x82";
      for (size_t w : widths) {
        buf.append(w + 2, ' ');
        buf += "\xe2\x94\x82";
      }
      buf += "\033[K\n";
      continue;
    }

    const Row &row = rows[r];
    std::string num = std::to_string(row.index + 1);
    num.insert(0, num_w - num.size(), ' ');
    bool is_selected = state.selected && *state.selected == r;
    cell(num, num_w, is_selected ? "\033[7m" : "\033[2m");

    for (size_t i = 0; i < widths.size(); ++i) {
      size_t c = state.cols_offset + i;
      std::string val = (c < row.fields.size()) ? cell_text(row.fields[c]) : "";
      const char *style = nullptr;
      if (highlight && val.find(fs.pattern) != std::string::npos) {
        bool is_cursor = fs.cursor && fs.cursor->row_index == row.index &&
                         fs.cursor->first_column == c;
        style = is_cursor ? "\033[7;33m" : "\033[33m"; // yellow for hits
      }
      cell(truncate_str(val, widths[i]), widths[i], style);
    }
    buf += "\033[K\n";
  }

  // Bottom border
  hline("\xe2\x94\x94", "\xe2\x94\xb4", "\xe2\x94\x98"); // └ ┴ ┘

  // Status bar
  std::string left = status_line(state);
  std::string right = "h/l cols  / find  & filter  q quit ";
  size_t left_w = display_width(left);
  size_t right_w = display_width(right);

  buf += "\033[7m"; // reverse video
  if (left_w + right_w < term_cols) {
    buf += left;
    buf.append(term_cols - left_w - right_w, ' ');
    buf += right;
  } else {
    std::string_view fitted = display_prefix(left, term_cols);
    buf += fitted;
    buf.append(term_cols - display_width(fitted), ' ');
  }
  buf += "\033[0m\033[K";

  return buf;
}
