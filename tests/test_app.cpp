#include <catch2/catch.hpp>
#include "include/app.hpp"
#include "test_helpers.hpp"
#include <memory>

static void type(App &app, const std::string &keys) {
  for (char c : keys)
    app.handle_key(static_cast<unsigned char>(c));
}

// Lets the background search finish, then pulls its results into the view.
static void settle(App &app) {
  REQUIRE(wait_for([&] { return app.finder() && app.finder()->done(); }));
  app.apply(Control::of(ControlKind::Nothing));
}

static std::vector<size_t> visible_rows(App &app) {
  std::vector<size_t> out;
  for (const auto &r : app.rows_view().rows())
    out.push_back(r.index);
  return out;
}

TEST_CASE("App: quit", "[app]") {
  TempCsv csv(numbered_csv(20));
  App app(std::make_shared<CsvReader>(csv.path()), "f.csv", 10);
  REQUIRE(app.handle_key('j'));
  REQUIRE(app.handle_key(KEY_NONE));
  REQUIRE_FALSE(app.handle_key('q'));
}

TEST_CASE("App: scrolling updates table state", "[app]") {
  TempCsv csv(numbered_csv(100));
  App app(std::make_shared<CsvReader>(csv.path()), "f.csv", 10);

  app.handle_key('j');
  app.handle_key(' ');
  REQUIRE(app.rows_view().rows_from() == 11);
  REQUIRE(app.table_state().rows_offset == 11);
  REQUIRE(app.table_state().total_is_approx);

  app.handle_key('g');
  REQUIRE(app.table_state().rows_offset == 0);
}

TEST_CASE("App: go to line selects the row", "[app]") {
  TempCsv csv(numbered_csv(100));
  App app(std::make_shared<CsvReader>(csv.path()), "f.csv", 10);

  type(app, "42");
  REQUIRE(app.table_state().buffer_mode == InputMode::GotoLine);
  REQUIRE(app.table_state().buffer == "42");

  app.handle_key('G');
  REQUIRE(app.table_state().rows_offset == 41);
  REQUIRE(app.table_state().selected == 0);
  REQUIRE(app.table_state().buffer_mode == InputMode::Default);
  REQUIRE(app.table_state().buffer.empty());
}

TEST_CASE("App: typed pattern shows in the buffer", "[app]") {
  TempCsv csv(numbered_csv(20));
  App app(std::make_shared<CsvReader>(csv.path()), "f.csv", 10);

  type(app, "/ab");
  REQUIRE(app.table_state().buffer_mode == InputMode::Find);
  REQUIRE(app.table_state().buffer == "ab");
  REQUIRE(app.finder() == nullptr);

  app.handle_key('\r');
  REQUIRE(app.finder() != nullptr);
  REQUIRE(app.finder()->pattern() == "ab");
  REQUIRE(app.table_state().buffer.empty());
}

TEST_CASE("App: find scrolls to the first result", "[app]") {
  TempCsv csv(numbered_csv(1000));
  App app(std::make_shared<CsvReader>(csv.path()), "f.csv", 10);

  app.apply(Control::with_text(ControlKind::Find, "b500"));
  settle(app);

  REQUIRE(app.rows_view().rows_from() == 500);
  auto &fs = app.table_state().finder_state;
  REQUIRE(fs.active);
  REQUIRE_FALSE(fs.filter);
  REQUIRE(fs.count == 1);
  REQUIRE(fs.done);
  REQUIRE(fs.cursor_index == 0);
  REQUIRE(fs.cursor == FoundRecord{500, 1});
}

TEST_CASE("App: n and N move between matches", "[app]") {
  // "a7" matches rows 7, 70-79 and 700-799
  TempCsv csv(numbered_csv(1000));
  App app(std::make_shared<CsvReader>(csv.path()), "f.csv", 10);

  app.apply(Control::with_text(ControlKind::Find, "a7"));
  settle(app);
  REQUIRE(app.table_state().finder_state.count == 111);
  // Row 7 is already on screen
  REQUIRE(app.rows_view().rows_from() == 0);
  REQUIRE(app.finder()->cursor_row_index() == 7);

  app.handle_key('n');
  REQUIRE(app.finder()->cursor_row_index() == 70);
  REQUIRE(app.rows_view().rows_from() == 70);

  app.handle_key('n');
  REQUIRE(app.finder()->cursor_row_index() == 71);
  REQUIRE(app.rows_view().rows_from() == 70);

  app.handle_key('N');
  app.handle_key('N');
  REQUIRE(app.finder()->cursor_row_index() == 7);
  REQUIRE(app.rows_view().rows_from() == 7);

  // Wraps backwards to the last match
  app.handle_key('N');
  REQUIRE(app.finder()->cursor_row_index() == 799);
  REQUIRE(app.rows_view().in_view(799));
}

TEST_CASE("App: next match after scrolling away starts from the view",
          "[app]") {
  TempCsv csv(numbered_csv(1000));
  App app(std::make_shared<CsvReader>(csv.path()), "f.csv", 10);

  app.apply(Control::with_text(ControlKind::Find, "a7"));
  settle(app);

  type(app, "300G");
  REQUIRE(app.rows_view().rows_from() == 299);
  // The cursor (row 7) left the view, so n searches from the view's top
  REQUIRE_FALSE(app.finder()->cursor_row_index());

  app.handle_key('n');
  REQUIRE(app.finder()->cursor_row_index() == 700);
}

TEST_CASE("App: find with no matches leaves the view alone", "[app]") {
  TempCsv csv(numbered_csv(200));
  App app(std::make_shared<CsvReader>(csv.path()), "f.csv", 10);
  app.handle_key(' ');

  app.apply(Control::with_text(ControlKind::Find, "nothing"));
  settle(app);
  app.handle_key('n');

  REQUIRE(app.rows_view().rows_from() == 10);
  REQUIRE(app.table_state().finder_state.count == 0);
  REQUIRE_FALSE(app.table_state().finder_state.cursor_index);
}

TEST_CASE("App: filter shows only matching rows", "[app]") {
  TempCsv csv(numbered_csv(1000));
  App app(std::make_shared<CsvReader>(csv.path()), "f.csv", 10);
  app.handle_key(' ');

  app.apply(Control::with_text(ControlKind::Filter, "a7"));
  settle(app);

  REQUIRE(app.rows_view().is_filter());
  REQUIRE(app.rows_view().rows_from() == 0);
  REQUIRE(visible_rows(app) ==
          std::vector<size_t>{7, 70, 71, 72, 73, 74, 75, 76, 77, 78});
  auto &state = app.table_state();
  REQUIRE(state.finder_state.filter);
  REQUIRE(state.total_line_number == 111);
  REQUIRE_FALSE(state.total_is_approx);

  // Paging moves through matches, not raw rows
  app.handle_key(' ');
  REQUIRE(visible_rows(app).front() == 79);

  // n/N have no effect while filtering
  app.handle_key('n');
  REQUIRE(visible_rows(app).front() == 79);
}

TEST_CASE("App: escape clears find and filter", "[app]") {
  TempCsv csv(numbered_csv(1000));
  App app(std::make_shared<CsvReader>(csv.path()), "f.csv", 10);

  app.apply(Control::with_text(ControlKind::Filter, "a7"));
  settle(app);
  app.handle_key(' ');
  REQUIRE(visible_rows(app).front() == 79);

  app.handle_key(KEY_ESC);
  REQUIRE(app.finder() == nullptr);
  REQUIRE_FALSE(app.rows_view().is_filter());
  REQUIRE_FALSE(app.table_state().finder_state.active);
  // The first row that was on screen stays on top
  REQUIRE(visible_rows(app).front() == 79);
  REQUIRE(visible_rows(app).back() == 88);
}

TEST_CASE("App: a new find replaces a filter", "[app]") {
  TempCsv csv(numbered_csv(1000));
  App app(std::make_shared<CsvReader>(csv.path()), "f.csv", 10);

  app.apply(Control::with_text(ControlKind::Filter, "a7"));
  settle(app);
  app.apply(Control::with_text(ControlKind::Find, "c123"));
  settle(app);

  REQUIRE_FALSE(app.rows_view().is_filter());
  REQUIRE(app.finder()->mode() == FindMode::Find);
  REQUIRE(app.rows_view().rows_from() == 123);
}

TEST_CASE("App: horizontal scrolling is bounded", "[app]") {
  TempCsv csv(numbered_csv(20));
  App app(std::make_shared<CsvReader>(csv.path()), "f.csv", 10);

  app.render(15, 200);
  REQUIRE(app.table_state().num_cols_rendered == 3);
  app.handle_key('l');
  REQUIRE(app.table_state().cols_offset == 0);

  app.render(15, 14);
  REQUIRE(app.table_state().num_cols_rendered == 1);
  app.handle_key('l');
  app.handle_key('l');
  app.handle_key('l');
  REQUIRE(app.table_state().cols_offset == 2);
  app.handle_key('h');
  REQUIRE(app.table_state().cols_offset == 1);
}

TEST_CASE("App: render sizes the window from the terminal", "[app]") {
  TempCsv csv(numbered_csv(100));
  App app(std::make_shared<CsvReader>(csv.path()), "data.csv", 10);

  std::string frame = app.render(25, 120);
  REQUIRE(app.rows_view().num_rows() == 20);
  REQUIRE(app.rows_view().rows().size() == 20);
  REQUIRE(frame.find("data.csv [Row 1/~") != std::string::npos);
}
