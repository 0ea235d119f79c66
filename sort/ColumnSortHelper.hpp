#ifndef COLUMNSORTHELPER_H
#define COLUMNSORTHELPER_H

#include <boost/noncopyable.hpp>

#include "base/ObjectPool.hpp"
#include "record/NilCount.hpp"
#include "record/Record.hpp"
#include "sort/SortAux.hpp"

namespace colrec {
namespace sort {

// Capacity of the process-wide helper pool, read when the pool is first used.
extern int SORT_HELPER_POOL_CAPACITY;

class ColumnSortHelper;
typedef base::BoundedObjectPool<ColumnSortHelper> ColumnSortHelperPool;

// ColumnSortHelper sorts the rows of a record by time and keeps one row per
// timestamp. For rows sharing a timestamp, each column independently takes
// the value of the last appended non-null row.
//
// The helper owns a scratch record. sort() builds the result there and then
// swaps buffers with the input, so the scratch keeps the old buffers for the
// next call. Get helpers from acquire(), one helper per thread at a time.
class ColumnSortHelper : boost::noncopyable {
 public:
  ColumnSortHelper() = default;

  // Returns rec. A record without rows is left untouched.
  // Throws base::ColrecException if the columns do not line up with the
  // schema or a column has a type without value storage.
  record::Record &sort(record::Record &rec);

  const SortAux &aux() const { return aux_; }

  static ColumnSortHelperPool &pool();

  // Checks a helper out of pool(), it goes back when the handle is destroyed.
  static ColumnSortHelperPool::ptr_type acquire();

 private:
  void check(const record::Record &rec) const;
  void init_nil_count(const record::ColVal &col, int size);
  void sort_column(const record::ColVal &col, int n);
  void replace(const record::ColVal &col, record::ColVal *dst,
               record::FieldType type, int idx);

  SortAux aux_;
  record::NilCount nil_count_;
  record::Record sort_rec_;
};

// Sorts rec with a pooled helper.
record::Record &sort_record(record::Record &rec);

}  // namespace sort
}  // namespace colrec

#endif
