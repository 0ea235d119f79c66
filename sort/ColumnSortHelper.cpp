#include "sort/ColumnSortHelper.hpp"

#include <thread>

#include <boost/format.hpp>

#include "base/ColrecException.hpp"
#include "base/Logging.hpp"

namespace colrec {
namespace sort {

namespace {

int default_pool_capacity() {
  int n = static_cast<int>(std::thread::hardware_concurrency()) * 2;
  return n < 2 ? 2 : n;
}

}  // namespace

int SORT_HELPER_POOL_CAPACITY = default_pool_capacity();

ColumnSortHelperPool &ColumnSortHelper::pool() {
  static ColumnSortHelperPool p(SORT_HELPER_POOL_CAPACITY > 0
                                    ? SORT_HELPER_POOL_CAPACITY
                                    : default_pool_capacity());
  return p;
}

ColumnSortHelperPool::ptr_type ColumnSortHelper::acquire() {
  return pool().acquire();
}

void ColumnSortHelper::check(const record::Record &rec) const {
  int rows = rec.row_nums();
  std::string msg;
  if (rec.col_vals.size() != rec.schema.size())
    msg = (boost::format("%d fields but %d columns") % rec.schema.size() %
           rec.col_vals.size())
              .str();
  else if (rec.col_vals.back().nil_count != 0)
    msg = "null in time column";
  for (size_t i = 0; msg.empty() && i < rec.col_vals.size(); ++i) {
    if (rec.col_vals[i].len != rows) {
      msg = (boost::format("column %d has %d rows, time has %d") % i %
             rec.col_vals[i].len % rows)
                .str();
    } else {
      error::Error err = rec.col_vals[i].check(rec.schema[i].type);
      if (err) msg = (boost::format("column %d: %s") % i % err.error()).str();
    }
  }
  if (msg.empty()) return;

  LOG_ERROR << "msg=\"cannot sort record\" err=\"" << msg << "\"";
  throw base::ColrecException("cannot sort record: " + msg);
}

record::Record &ColumnSortHelper::sort(record::Record &rec) {
  if (rec.row_nums() == 0) return rec;
  check(rec);

  sort_rec_.reset_with_schema(rec.schema);
  aux_.init(rec.times());
  aux_.sort();
  aux_.init_sections();

  const std::vector<int64_t> &times = aux_.times;
  for (int i = 0; i < rec.len() - 1; ++i) {
    const record::ColVal &col = *rec.column(i);
    init_nil_count(col, static_cast<int>(times.size()) + 1);
    sort_column(col, i);
  }

  sort_rec_.append_time(times[0]);
  for (size_t i = 1; i < times.size(); ++i) {
    if (times[i] != times[i - 1]) sort_rec_.append_time(times[i]);
  }

  rec.swap(sort_rec_);
  return rec;
}

void ColumnSortHelper::init_nil_count(const record::ColVal &col, int size) {
  nil_count_.init(col.nil_count, size);
  if (col.nil_count == 0) return;

  for (int j = 1; j < size; ++j) {
    nil_count_.value[j] = nil_count_.value[j - 1];
    if (col.is_nil(j - 1)) ++nil_count_.value[j];
  }
}

void ColumnSortHelper::sort_column(const record::ColVal &col, int n) {
  const std::vector<int64_t> &times = aux_.times;
  record::ColVal *dst = sort_rec_.column(n);
  record::FieldType type = sort_rec_.schema[n].type;

  for (int i = 0; i < aux_.section_len(); ++i) {
    int idx, row_start, row_end;
    std::tie(idx, row_start, row_end) = aux_.row_index(i);

    // Same timestamp as the row appended last.
    if (idx > 0 && times[idx] == times[idx - 1]) {
      replace(col, dst, type, row_start);
      ++row_start;
    }

    if (row_start >= row_end) continue;

    dst->append_with_nil_count(col, type, row_start, row_end, nil_count_);
  }
}

// A null never overwrites a value.
void ColumnSortHelper::replace(const record::ColVal &col, record::ColVal *dst,
                               record::FieldType type, int idx) {
  if (col.is_nil(idx)) return;

  dst->delete_last(type);
  dst->append_with_nil_count(col, type, idx, idx + 1, nil_count_);
}

record::Record &sort_record(record::Record &rec) {
  ColumnSortHelperPool::ptr_type helper = ColumnSortHelper::acquire();
  return helper->sort(rec);
}

}  // namespace sort
}  // namespace colrec
