#pragma once

#include "include/csv_reader.hpp"
#include <atomic>
#include <chrono>
#include <compare>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct FoundRecord {
  size_t row_index = 0;
  size_t first_column = 0;

  bool operator==(const FoundRecord &) const = default;
  auto operator<=>(const FoundRecord &) const = default;
};

// Matches produced by one background scan. Append-only, so an index handed
// out to the foreground stays valid while the scan keeps adding records.
class MatchStore {
private:
  mutable std::mutex mutex_;
  std::vector<FoundRecord> records_;
  bool done_ = false;
  std::optional<std::chrono::milliseconds> elapsed_;
  std::atomic<bool> stop_{false};

public:
  void append(const FoundRecord &record);
  void finish(std::chrono::milliseconds elapsed);

  void request_stop() { stop_.store(true, std::memory_order_relaxed); }
  const std::atomic<bool> &stop_flag() const { return stop_; }

  size_t count() const;
  bool done() const;
  std::optional<std::chrono::milliseconds> elapsed() const;

  std::optional<FoundRecord> at(size_t i) const;
  std::vector<FoundRecord> slice(size_t from, size_t max_count) const;

  // Index of the first match with row_index >= row (count() if none).
  size_t lower_bound(size_t row) const;
  // Index of the first match with row_index > row (count() if none).
  size_t upper_bound(size_t row) const;
};

enum class FindMode { Find, Filter };

// One search request: scans the whole file on its own thread and exposes a
// cursor over whatever has been found so far. Queries never wait on the scan.
class Finder {
private:
  std::shared_ptr<const CsvReader> reader_;
  std::string pattern_;
  FindMode mode_;
  std::shared_ptr<MatchStore> store_;
  std::optional<size_t> cursor_;
  size_t row_hint_ = 0;
  std::thread worker_;

  static void run_scan(std::shared_ptr<const CsvReader> reader,
                       std::shared_ptr<MatchStore> store, FileHandle file,
                       std::string pattern);

public:
  Finder(std::shared_ptr<const CsvReader> reader, std::string pattern,
         FindMode mode = FindMode::Find);
  ~Finder();
  Finder(const Finder &) = delete;
  Finder &operator=(const Finder &) = delete;

  const std::string &pattern() const { return pattern_; }
  FindMode mode() const { return mode_; }
  std::shared_ptr<const MatchStore> store() const { return store_; }

  size_t count() const { return store_->count(); }
  bool done() const { return store_->done(); }
  std::optional<std::chrono::milliseconds> elapsed() const {
    return store_->elapsed();
  }

  void set_row_hint(size_t row_index) { row_hint_ = row_index; }
  size_t row_hint() const { return row_hint_; }

  std::optional<FoundRecord> next();
  std::optional<FoundRecord> prev();
  std::optional<FoundRecord> current() const;
  std::optional<size_t> cursor_index() const { return cursor_; }
  std::optional<size_t> cursor_row_index() const;
  void reset_cursor() { cursor_.reset(); }
};

// First column of row whose field contains pattern, case-sensitive.
std::optional<size_t> find_in_row(const Row &row, const std::string &pattern);
