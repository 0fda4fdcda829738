#include "include/find.hpp"
#include "include/errors.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include <utility>

// --- MatchStore ---

void MatchStore::append(const FoundRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  records_.push_back(record);
}

void MatchStore::finish(std::chrono::milliseconds elapsed) {
  std::lock_guard<std::mutex> lock(mutex_);
  done_ = true;
  elapsed_ = elapsed;
}

size_t MatchStore::count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

bool MatchStore::done() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return done_;
}

std::optional<std::chrono::milliseconds> MatchStore::elapsed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return elapsed_;
}

std::optional<FoundRecord> MatchStore::at(size_t i) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (i >= records_.size())
    return std::nullopt;
  return records_[i];
}

std::vector<FoundRecord> MatchStore::slice(size_t from,
                                           size_t max_count) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (from >= records_.size())
    return {};
  size_t n = std::min(max_count, records_.size() - from);
  auto first = records_.begin() + static_cast<std::ptrdiff_t>(from);
  return {first, first + static_cast<std::ptrdiff_t>(n)};
}

size_t MatchStore::lower_bound(size_t row) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::lower_bound(
      records_.begin(), records_.end(), row,
      [](const FoundRecord &r, size_t v) { return r.row_index < v; });
  return static_cast<size_t>(it - records_.begin());
}

size_t MatchStore::upper_bound(size_t row) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::upper_bound(
      records_.begin(), records_.end(), row,
      [](size_t v, const FoundRecord &r) { return v < r.row_index; });
  return static_cast<size_t>(it - records_.begin());
}

// --- Matching ---

std::optional<size_t> find_in_row(const Row &row, const std::string &pattern) {
  for (size_t c = 0; c < row.fields.size(); ++c)
    if (row.fields[c].find(pattern) != std::string::npos)
      return c;
  return std::nullopt;
}

// --- Finder ---

Finder::Finder(std::shared_ptr<const CsvReader> reader, std::string pattern,
               FindMode mode)
    : reader_(std::move(reader)), pattern_(std::move(pattern)), mode_(mode),
      store_(std::make_shared<MatchStore>()) {
  // Own descriptor for the scan; opening it is the only failure reported here
  FileHandle file(reader_->path());
  worker_ = std::thread(run_scan, reader_, store_, std::move(file), pattern_);
}

Finder::~Finder() {
  store_->request_stop();
  if (worker_.joinable())
    worker_.join();
}

void Finder::run_scan(std::shared_ptr<const CsvReader> reader,
                      std::shared_ptr<MatchStore> store, FileHandle file,
                      std::string pattern) {
  auto start = std::chrono::steady_clock::now();
  spdlog::debug("scan for \"{}\" started", pattern);

  ScanStats stats;
  try {
    stats = reader->scan(
        file,
        [&](const Row &row) {
          if (auto col = find_in_row(row, pattern))
            store->append({row.index, *col});
          return true;
        },
        &store->stop_flag());
  } catch (const IOError &e) {
    spdlog::error("scan for \"{}\" failed: {}", pattern, e.what());
  }

  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  store->finish(elapsed);

  if (stats.completed)
    spdlog::debug("scan for \"{}\" done: {} matches in {} rows, {} malformed "
                  "skipped, {} ms",
                  pattern, store->count(), stats.rows + stats.malformed,
                  stats.malformed, elapsed.count());
  else
    spdlog::debug("scan for \"{}\" stopped after {} rows", pattern,
                  stats.rows + stats.malformed);
}

std::optional<FoundRecord> Finder::next() {
  size_t n = store_->count();
  if (n == 0)
    return std::nullopt;

  if (cursor_) {
    cursor_ = (*cursor_ + 1) % n;
  } else {
    size_t i = store_->lower_bound(row_hint_);
    cursor_ = (i < n) ? i : 0;
  }
  return store_->at(*cursor_);
}

std::optional<FoundRecord> Finder::prev() {
  size_t n = store_->count();
  if (n == 0)
    return std::nullopt;

  if (cursor_) {
    cursor_ = (*cursor_ == 0) ? n - 1 : *cursor_ - 1;
  } else {
    size_t i = store_->upper_bound(row_hint_);
    cursor_ = (i > 0) ? i - 1 : n - 1;
  }
  return store_->at(*cursor_);
}

std::optional<FoundRecord> Finder::current() const {
  if (!cursor_)
    return std::nullopt;
  return store_->at(*cursor_);
}

std::optional<size_t> Finder::cursor_row_index() const {
  if (auto rec = current())
    return rec->row_index;
  return std::nullopt;
}
