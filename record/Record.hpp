#ifndef RECORD_H
#define RECORD_H

#include <stdint.h>

#include <initializer_list>
#include <string>
#include <vector>

#include "base/Error.hpp"
#include "record/ColVal.hpp"
#include "record/Field.hpp"

namespace colrec {
namespace record {

// Record is a batch of rows stored column by column. col_vals[i] holds the
// values of schema[i]; the last field is always TIME_FIELD.
// Not safe for concurrent mutation.
class Record {
 public:
  std::vector<ColVal> col_vals;
  Schemas schema;

  Record() = default;
  explicit Record(const Schemas &schema);

  // Number of fields.
  int len() const { return static_cast<int>(schema.size()); }

  ColVal *column(int i) { return &col_vals[i]; }
  const ColVal *column(int i) const { return &col_vals[i]; }

  // Column order: by name, TIME_FIELD last.
  bool less(int i, int j) const;
  void swap_columns(int i, int j);

  // Checks the record before it is serialized. Columns that are not sorted by
  // name are reordered in place together with their schema.
  error::Error validate();

  // Rows of the time column, 0 without columns.
  int row_nums() const;
  std::vector<int64_t> times() const;
  void append_time(int64_t t);
  void append_times(std::initializer_list<int64_t> ts);

  void reset();
  void reset_with_schema(const Schemas &s);
  // Appends size empty columns.
  void reserve_col_val(int size);
  void init_col_val(int start, int end);

  // Exchanges all buffers with r.
  void swap(Record &r);

  // One "field(name):[values]" line per column.
  std::string string() const;

  // ┌──────────────────────────────────────────┐
  // │ n = len(schema) <4b>                     │
  // ├──────────────────┬───────────────────────┤
  // │ size(f_1) <4b>   │ field_1               │
  // ├──────────────────┴───────────────────────┤
  // │ ...                                      │
  // ├──────────────────────────────────────────┤
  // │ m = len(col_vals) <4b>                   │
  // ├──────────────────┬───────────────────────┤
  // │ size(c_1) <4b>   │ colval_1              │
  // ├──────────────────┴───────────────────────┤
  // │ ...                                      │
  // └──────────────────────────────────────────┘
  error::Error marshal(std::vector<uint8_t> &buf) const;
  int size() const;

  // Replaces the content of the record with the decoded one.
  error::Error unmarshal(const uint8_t *buf, int length);
  error::Error unmarshal(const std::vector<uint8_t> &buf);

  bool operator==(const Record &r) const {
    return schema == r.schema && col_vals == r.col_vals;
  }
  bool operator!=(const Record &r) const { return !(*this == r); }

 private:
  void sort_columns();
};

}  // namespace record
}  // namespace colrec

#endif
