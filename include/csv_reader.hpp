#pragma once

#include "include/delim.hpp"
#include "include/seekable_file.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

std::string unquote(std::string_view field);

// Splits one record into unquoted fields. Broken quoting sets *malformed and
// stops at the offending field, keeping the fields parsed so far.
std::vector<std::string> split_record(std::string_view record, char delimiter,
                                      bool *malformed);

struct Row {
  size_t index = 0;    // 0-based, header excluded
  uint64_t offset = 0; // byte span of the record in the source
  uint64_t length = 0;
  std::vector<std::string> fields;
  bool malformed = false;
};

struct ScanStats {
  size_t rows = 0;
  size_t malformed = 0;
  bool completed = false;
};

// On-demand parser over a seekable delimited file. Reads are positioned, so
// one reader can serve the foreground view and a background scan at the same
// time; the only shared state is the sparse row offset index.
class CsvReader {
public:
  static constexpr size_t kIndexStride = 1024;

private:
  FileHandle file_;
  char delimiter_;
  uint64_t file_size_ = 0;
  uint64_t data_offset_ = 0; // first byte after the header record
  std::vector<std::string> headers_;

  mutable std::mutex index_mutex_;
  mutable std::map<size_t, uint64_t> row_offsets_;
  mutable size_t rows_seen_ = 0;
  mutable uint64_t bytes_seen_ = 0;
  mutable std::optional<size_t> total_rows_;

  struct Progress {
    std::vector<std::pair<size_t, uint64_t>> marks;
    size_t next_row = 0;
    uint64_t next_offset = 0;
    bool at_eof = false;
  };

  void parse_header();
  std::pair<size_t, uint64_t> nearest_indexed(size_t row) const;
  void commit(Progress &progress) const;
  Row make_row(size_t index, uint64_t offset, uint64_t length,
               std::string_view text, bool unterminated) const;

public:
  CsvReader() = delete;
  explicit CsvReader(const std::string &path,
                     char delimiter = kDefaultDelimiter);
  CsvReader(const CsvReader &) = delete;
  CsvReader &operator=(const CsvReader &) = delete;

  const std::string &path() const { return file_.path(); }
  char delimiter() const { return delimiter_; }
  uint64_t size() const { return file_size_; }
  size_t column_count() const { return headers_.size(); }
  const std::vector<std::string> &headers() const { return headers_; }

  std::vector<Row> read_rows(size_t from, size_t max_count) const;
  std::optional<Row> read_row_at(size_t index) const;
  // indices must be ascending
  std::vector<Row> read_rows_at(const std::vector<size_t> &indices) const;

  std::optional<size_t> approximate_total_rows() const;
  std::optional<size_t> exact_total_rows() const;

  // Sequential pass over every row through the caller's own handle. Malformed
  // rows are skipped. visit returns false to stop early; so does setting
  // *stop, which is checked before every record, skipped ones included.
  ScanStats scan(const FileHandle &file,
                 const std::function<bool(const Row &)> &visit,
                 const std::atomic<bool> *stop = nullptr) const;
};
