#include "include/csv_reader.hpp"
#include "include/errors.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <spdlog/spdlog.h>

// --- Utility ---

std::string unquote(std::string_view field) {
  if (field.size() >= 2 && field.front() == '"' && field.back() == '"') {
    field.remove_prefix(1);
    field.remove_suffix(1);
    std::string result;
    result.reserve(field.size());
    for (size_t i = 0; i < field.size(); ++i) {
      if (field[i] == '"' && i + 1 < field.size() && field[i + 1] == '"') {
        result += '"';
        ++i;
      } else {
        result += field[i];
      }
    }
    return result;
  }
  return std::string(field);
}

std::vector<std::string> split_record(std::string_view record, char delimiter,
                                      bool *malformed) {
  std::vector<std::string> fields;
  bool bad = false;
  size_t i = 0;
  size_t end = record.size();

  for (;;) {
    if (i < end && record[i] == '"') {
      size_t fs = i++;
      bool closed = false;
      while (i < end) {
        if (record[i] == '"') {
          if (i + 1 < end && record[i + 1] == '"') {
            i += 2;
          } else {
            closed = true;
            ++i;
            break;
          }
        } else {
          ++i;
        }
      }
      if (!closed) {
        fields.emplace_back(record.substr(fs + 1));
        bad = true;
        break;
      }
      fields.push_back(unquote(record.substr(fs, i - fs)));
      if (i == end)
        break;
      if (record[i] != delimiter) {
        bad = true; // junk after the closing quote
        break;
      }
      ++i;
    } else {
      size_t fs = i;
      while (i < end && record[i] != delimiter)
        ++i;
      fields.emplace_back(record.substr(fs, i - fs));
      if (i == end)
        break;
      ++i;
    }
  }

  if (malformed)
    *malformed = bad;
  return fields;
}

// --- Record stream ---

namespace {

struct RawRecord {
  uint64_t offset = 0;
  uint64_t length = 0; // including the line terminator
  std::string_view text;
  bool unterminated = false; // quote still open at end of file
};

// Position of the first quote in [from, stop) that opens a field, or stop.
// A quote anywhere else in an unquoted field is an ordinary byte.
size_t find_opening_quote(const char *base, size_t record_start,
                          size_t from, size_t stop, char delim) {
  while (from < stop) {
    const void *q = memchr(base + from, '"', stop - from);
    if (!q)
      return stop;
    size_t qi = static_cast<size_t>(static_cast<const char *>(q) - base);
    if (qi == record_start || base[qi - 1] == delim)
      return qi;
    from = qi + 1;
  }
  return stop;
}

// Buffered forward iteration over records starting at a record boundary.
// The text of a record is valid until the next call to next().
class RecordStream {
private:
  static constexpr size_t kChunk = 1 << 16; // 64KB

  const FileHandle &file_;
  char delim_;
  std::string buf_;
  uint64_t buf_offset_; // file offset of buf_[0]
  uint64_t offset_;     // file offset of the next unread record
  bool eof_ = false;

  bool fill() {
    if (eof_)
      return false;
    size_t old = buf_.size();
    buf_.resize(old + kChunk);
    size_t n = file_.read_at(buf_offset_ + old, buf_.data() + old, kChunk);
    buf_.resize(old + n);
    if (n == 0)
      eof_ = true;
    return n > 0;
  }

public:
  RecordStream(const FileHandle &file, uint64_t offset, char delim)
      : file_(file), delim_(delim), buf_offset_(offset), offset_(offset) {}

  uint64_t offset() const { return offset_; }

  // Next non-blank record; false at end of file.
  bool next(RawRecord &rec) {
    for (;;) {
      size_t start = static_cast<size_t>(offset_ - buf_offset_);
      if (start > 0 && start >= buf_.size() / 2) {
        buf_.erase(0, start);
        buf_offset_ = offset_;
        start = 0;
      }

      size_t i = start;
      bool in_quotes = false;
      bool found_nl = false;
      for (;;) {
        if (i == buf_.size()) {
          if (!fill())
            break;
          continue;
        }
        const char *base = buf_.data();
        size_t len = buf_.size();
        if (!in_quotes) {
          // Fast: find next \n, then check for an opening quote before it
          const void *nl = memchr(base + i, '\n', len - i);
          size_t stop =
              nl ? static_cast<size_t>(static_cast<const char *>(nl) - base)
                 : len;
          size_t q = find_opening_quote(base, start, i, stop, delim_);
          if (q == stop) {
            i = stop;
            if (nl) {
              found_nl = true;
              break;
            }
            continue;
          }
          i = q + 1;
          in_quotes = true;
        } else {
          const void *q = memchr(base + i, '"', len - i);
          if (!q) {
            i = len;
            continue;
          }
          size_t qi = static_cast<size_t>(static_cast<const char *>(q) - base);
          // The byte after the quote decides between "" and a closing quote
          if (qi + 1 == buf_.size())
            fill();
          if (qi + 1 < buf_.size() && buf_[qi + 1] == '"') {
            i = qi + 2;
          } else {
            i = qi + 1;
            in_quotes = false;
          }
        }
      }

      if (i == start && !found_nl)
        return false;

      size_t text_end = i;
      if (text_end > start && buf_[text_end - 1] == '\r')
        --text_end;
      uint64_t rec_offset = buf_offset_ + start;
      offset_ = buf_offset_ + i + (found_nl ? 1 : 0);

      if (text_end == start)
        continue; // blank line

      rec.offset = rec_offset;
      rec.length = offset_ - rec_offset;
      rec.text = std::string_view(buf_.data() + start, text_end - start);
      rec.unterminated = in_quotes;
      return true;
    }
  }
};

} // namespace

// --- CsvReader implementation ---

CsvReader::CsvReader(const std::string &path, char delimiter)
    : delimiter_(delimiter) {
  if (!is_valid_delimiter(delimiter))
    throw ConfigError("Delimiter should be one printable ascii character");

  file_ = FileHandle(path);
  file_size_ = file_.size();
  parse_header();
}

void CsvReader::parse_header() {
  RecordStream stream(file_, 0, delimiter_);
  RawRecord rec;
  if (!stream.next(rec))
    throw ParseError("No header row found in " + file_.path());

  bool malformed = false;
  headers_ = split_record(rec.text, delimiter_, &malformed);
  if (malformed || rec.unterminated)
    throw ParseError("Malformed header row in " + file_.path());

  data_offset_ = stream.offset();
  bytes_seen_ = data_offset_;
  row_offsets_[0] = data_offset_;
}

std::pair<size_t, uint64_t> CsvReader::nearest_indexed(size_t row) const {
  std::lock_guard<std::mutex> lock(index_mutex_);
  auto it = row_offsets_.upper_bound(row);
  --it; // row 0 is always present
  return {it->first, it->second};
}

void CsvReader::commit(Progress &progress) const {
  std::lock_guard<std::mutex> lock(index_mutex_);
  for (auto &[row, offset] : progress.marks)
    row_offsets_.emplace(row, offset);
  progress.marks.clear();

  if (progress.next_row > rows_seen_) {
    rows_seen_ = progress.next_row;
    bytes_seen_ = progress.next_offset;
  }
  if (progress.at_eof && !total_rows_) {
    total_rows_ = progress.next_row;
    spdlog::debug("{}: {} rows", file_.path(), progress.next_row);
  }
}

Row CsvReader::make_row(size_t index, uint64_t offset, uint64_t length,
                        std::string_view text, bool unterminated) const {
  Row row;
  row.index = index;
  row.offset = offset;
  row.length = length;
  row.fields = split_record(text, delimiter_, &row.malformed);
  row.malformed = row.malformed || unterminated;
  if (row.fields.size() < headers_.size())
    row.fields.resize(headers_.size());
  return row;
}

std::vector<Row> CsvReader::read_rows(size_t from, size_t max_count) const {
  std::vector<Row> rows;
  if (max_count == 0)
    return rows;
  if (auto total = exact_total_rows(); total && from >= *total)
    return rows;

  auto [row, offset] = nearest_indexed(from);
  RecordStream stream(file_, offset, delimiter_);
  RawRecord rec;
  Progress progress;
  rows.reserve(std::min(max_count, static_cast<size_t>(4096)));

  while (rows.size() < max_count) {
    if (!stream.next(rec)) {
      progress.at_eof = true;
      break;
    }
    if (row % kIndexStride == 0)
      progress.marks.emplace_back(row, rec.offset);
    if (row >= from)
      rows.push_back(
          make_row(row, rec.offset, rec.length, rec.text, rec.unterminated));
    ++row;
  }

  // A full window that ends exactly at end of file still reveals the total
  if (!progress.at_eof) {
    if (stream.next(rec)) {
      if (row % kIndexStride == 0)
        progress.marks.emplace_back(row, rec.offset);
      ++row;
    } else {
      progress.at_eof = true;
    }
  }

  progress.next_row = row;
  progress.next_offset = stream.offset();
  commit(progress);
  return rows;
}

std::optional<Row> CsvReader::read_row_at(size_t index) const {
  auto rows = read_rows(index, 1);
  if (rows.empty())
    return std::nullopt;
  return std::move(rows.front());
}

std::vector<Row>
CsvReader::read_rows_at(const std::vector<size_t> &indices) const {
  std::vector<Row> rows;
  rows.reserve(indices.size());

  std::optional<RecordStream> stream;
  size_t row = 0;
  RawRecord rec;
  Progress progress;

  for (size_t target : indices) {
    auto [irow, ioffset] = nearest_indexed(target);
    if (!stream || row > target || irow > row) {
      if (stream) {
        progress.next_row = row;
        progress.next_offset = stream->offset();
        commit(progress);
      }
      stream.emplace(file_, ioffset, delimiter_);
      row = irow;
    }

    bool found = false;
    while (row <= target) {
      if (!stream->next(rec)) {
        progress.at_eof = true;
        break;
      }
      if (row % kIndexStride == 0)
        progress.marks.emplace_back(row, rec.offset);
      if (row == target) {
        rows.push_back(
            make_row(row, rec.offset, rec.length, rec.text, rec.unterminated));
        found = true;
      }
      ++row;
    }
    if (!found)
      break;
  }

  if (stream) {
    progress.next_row = row;
    progress.next_offset = stream->offset();
    commit(progress);
  }
  return rows;
}

std::optional<size_t> CsvReader::approximate_total_rows() const {
  std::lock_guard<std::mutex> lock(index_mutex_);
  if (total_rows_)
    return total_rows_;
  if (rows_seen_ == 0 || bytes_seen_ <= data_offset_)
    return std::nullopt;

  double data_bytes = static_cast<double>(file_size_ - data_offset_);
  double seen = static_cast<double>(bytes_seen_ - data_offset_);
  auto estimate = static_cast<size_t>(
      std::llround(static_cast<double>(rows_seen_) * data_bytes / seen));
  return std::max(estimate, rows_seen_);
}

std::optional<size_t> CsvReader::exact_total_rows() const {
  std::lock_guard<std::mutex> lock(index_mutex_);
  return total_rows_;
}

ScanStats CsvReader::scan(const FileHandle &file,
                          const std::function<bool(const Row &)> &visit,
                          const std::atomic<bool> *stop) const {
  ScanStats stats;
  RecordStream stream(file, data_offset_, delimiter_);
  RawRecord rec;
  Progress progress;
  size_t row = 0;

  for (;;) {
    if (stop && stop->load(std::memory_order_relaxed))
      break;
    if (!stream.next(rec)) {
      progress.at_eof = true;
      stats.completed = true;
      break;
    }
    if (row % kIndexStride == 0) {
      progress.marks.emplace_back(row, rec.offset);
      progress.next_row = row;
      progress.next_offset = rec.offset;
      commit(progress);
    }

    Row parsed =
        make_row(row, rec.offset, rec.length, rec.text, rec.unterminated);
    ++row;
    if (parsed.malformed) {
      ++stats.malformed;
      spdlog::debug("{}: skipping malformed row {}", file.path(), parsed.index);
      continue;
    }
    ++stats.rows;
    if (!visit(parsed))
      break;
  }

  progress.next_row = row;
  progress.next_offset = stream.offset();
  commit(progress);
  return stats;
}
