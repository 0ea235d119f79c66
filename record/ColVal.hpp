#ifndef COLVAL_H
#define COLVAL_H

#include <stdint.h>

#include <string>
#include <vector>

#include "base/Error.hpp"
#include "record/Field.hpp"
#include "record/NilCount.hpp"

namespace colrec {

namespace codec {
class DecBuf;
}  // namespace codec

namespace record {

extern const uint8_t BIT_MASK[8];
extern const uint8_t FLIPPED_BIT_MASK[8];

// ColVal holds the values of one column for a batch of rows.
//
// val            packed non-null values in row order. Fixed-width types take
//                type_size(type) bytes each, strings are concatenated.
// offset         start of each row's bytes in val, string/tag columns only.
//                A null row shares its offset with the next row.
// bitmap         validity bits, 1 = present, row r at bit bit_map_offset + r.
// bit_map_offset lets bitmap point into a shared, unaligned byte range.
// len            rows including nulls.
// nil_count      null rows.
class ColVal {
 public:
  std::vector<uint8_t> val;
  std::vector<uint32_t> offset;
  std::vector<uint8_t> bitmap;
  int bit_map_offset;
  int len;
  int nil_count;

  ColVal() : bit_map_offset(0), len(0), nil_count(0) {}

  // Empties the buffer, keeps the allocated storage.
  void init();

  void append_integer(int64_t v);
  void append_float(double v);
  void append_boolean(bool v);
  void append_integers(const std::vector<int64_t> &values);
  void append_floats(const std::vector<double> &values);
  void append_booleans(const std::vector<bool> &values);

  // Null for fixed-width columns.
  void append_null();
  void append_nulls(int count);

  void append_string(const std::string &v);
  void append_strings(const std::vector<std::string> &values);
  void append_string_null();
  void append_string_nulls(int count);

  // A row past the end or a column without bitmap counts as null.
  bool is_nil(int i) const;

  // Physical values, nulls are not represented.
  std::vector<int64_t> integer_values() const;
  std::vector<double> float_values() const;
  std::vector<bool> boolean_values() const;
  // Appends the non-null strings to dst.
  void string_values(std::vector<std::string> &dst) const;

  // Copies rows [start, end) of src. nc must be the NilCount of src (total 0
  // when src has no null). Throws base::ColrecException on a type without
  // value storage.
  void append_with_nil_count(const ColVal &src, FieldType type, int start,
                             int end, const NilCount &nc);

  // Takes all rows of src, only valid on an empty buffer.
  void append_all(const ColVal &src);

  // Appends validity bits [start, end) of a column whose bitmap is bm with
  // rows starting at bit_offset.
  void append_bitmap(const std::vector<uint8_t> &bm, int bit_offset, int rows,
                     int start, int end);

  // Removes the last row.
  void delete_last(FieldType type);

  // ┌───────────────────────────────┐
  // │ len <8b zig-zag>              │
  // ├───────────────────────────────┤
  // │ nil_count <8b zig-zag>        │
  // ├───────────────────────────────┤
  // │ bit_map_offset <8b zig-zag>   │
  // ├───────────────────────────────┤
  // │ len(val) <4b> │ val           │
  // ├───────────────────────────────┤
  // │ len(bitmap) <4b> │ bitmap     │
  // ├───────────────────────────────┤
  // │ n <4b> │ offset <n * 4b>      │
  // └───────────────────────────────┘
  error::Error marshal(std::vector<uint8_t> &buf) const;
  int size() const;

  // Type-independent sanity checks only; check() covers the rest.
  error::Error unmarshal(codec::DecBuf &dec);

  // Checks that the buffers hold len rows of the given type: counts, bitmap
  // coverage, val byte length for fixed-width types, and one in-bounds,
  // non-decreasing offset per row for string and tag types.
  error::Error check(FieldType type) const;

  bool operator==(const ColVal &c) const;
  bool operator!=(const ColVal &c) const { return !(*this == c); }

 private:
  void set_bitmap(int index);
  void reset_bitmap(int index);
  void append_value(const void *v, int size);
  void append_string_range(const ColVal &src, int start, int end);
  error::Error check_header() const;
  error::Error check_offsets() const;
};

}  // namespace record
}  // namespace colrec

#endif
