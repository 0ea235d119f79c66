#include "record/ColVal.hpp"

#include <cstring>

#include <boost/format.hpp>

#include "base/ColrecException.hpp"
#include "codec/Codec.hpp"
#include "codec/DecBuf.hpp"

namespace colrec {
namespace record {

const uint8_t BIT_MASK[8] = {1, 2, 4, 8, 16, 32, 64, 128};
const uint8_t FLIPPED_BIT_MASK[8] = {254, 253, 251, 247, 239, 223, 191, 127};

namespace {

// First byte and the bit offset inside it of rows [0, length) of a bitmap
// whose row 0 sits at bit_offset. *nbytes gets the bytes covering the rows.
const uint8_t *sub_bitmap_bytes(const std::vector<uint8_t> &bm, int bit_offset,
                                int length, int *nbytes, int *sub_offset) {
  int first = bit_offset >> 3;
  int last = (bit_offset + length) >> 3;
  if (((bit_offset + length) & 0x7) != 0) ++last;
  *nbytes = last - first;
  *sub_offset = bit_offset & 0x7;
  return bm.data() + first;
}

}  // namespace

void ColVal::init() {
  val.clear();
  offset.clear();
  bitmap.clear();
  bit_map_offset = 0;
  len = 0;
  nil_count = 0;
}

void ColVal::set_bitmap(int index) {
  index += bit_map_offset;
  while (static_cast<size_t>(index >> 3) >= bitmap.size()) bitmap.push_back(0);
  bitmap[index >> 3] |= BIT_MASK[index & 0x07];
}

void ColVal::reset_bitmap(int index) {
  index += bit_map_offset;
  while (static_cast<size_t>(index >> 3) >= bitmap.size()) bitmap.push_back(0);
  bitmap[index >> 3] &= FLIPPED_BIT_MASK[index & 0x07];
}

void ColVal::append_value(const void *v, int size) {
  size_t index = val.size();
  val.resize(index + size);
  memcpy(&val[index], v, size);
  set_bitmap(len);
  ++len;
}

void ColVal::append_integer(int64_t v) { append_value(&v, sizeof(v)); }

void ColVal::append_float(double v) { append_value(&v, sizeof(v)); }

void ColVal::append_boolean(bool v) { append_value(&v, sizeof(v)); }

void ColVal::append_integers(const std::vector<int64_t> &values) {
  for (int64_t v : values) append_integer(v);
}

void ColVal::append_floats(const std::vector<double> &values) {
  for (double v : values) append_float(v);
}

void ColVal::append_booleans(const std::vector<bool> &values) {
  for (bool v : values) append_boolean(v);
}

void ColVal::append_null() {
  reset_bitmap(len);
  ++len;
  ++nil_count;
}

void ColVal::append_nulls(int count) {
  for (int i = 0; i < count; ++i) append_null();
}

void ColVal::append_string(const std::string &v) {
  offset.push_back(static_cast<uint32_t>(val.size()));
  val.insert(val.end(), v.begin(), v.end());
  set_bitmap(len);
  ++len;
}

void ColVal::append_strings(const std::vector<std::string> &values) {
  for (const std::string &v : values) append_string(v);
}

void ColVal::append_string_null() {
  offset.push_back(static_cast<uint32_t>(val.size()));
  append_null();
}

void ColVal::append_string_nulls(int count) {
  for (int i = 0; i < count; ++i) append_string_null();
}

bool ColVal::is_nil(int i) const {
  if (i >= len || bitmap.empty()) return true;
  if (nil_count == 0) return false;
  int idx = bit_map_offset + i;
  return (bitmap[idx >> 3] & BIT_MASK[idx & 0x07]) == 0;
}

std::vector<int64_t> ColVal::integer_values() const {
  std::vector<int64_t> r(val.size() / sizeof(int64_t));
  if (!r.empty()) memcpy(r.data(), val.data(), r.size() * sizeof(int64_t));
  return r;
}

std::vector<double> ColVal::float_values() const {
  std::vector<double> r(val.size() / sizeof(double));
  if (!r.empty()) memcpy(r.data(), val.data(), r.size() * sizeof(double));
  return r;
}

std::vector<bool> ColVal::boolean_values() const {
  std::vector<bool> r;
  r.reserve(val.size());
  for (uint8_t b : val) r.push_back(b != 0);
  return r;
}

void ColVal::string_values(std::vector<std::string> &dst) const {
  for (size_t i = 0; i < offset.size(); ++i) {
    if (is_nil(static_cast<int>(i))) continue;
    uint32_t from = offset[i];
    uint32_t to = i == offset.size() - 1 ? static_cast<uint32_t>(val.size())
                                         : offset[i + 1];
    dst.emplace_back(reinterpret_cast<const char *>(val.data()) + from,
                     to - from);
  }
}

void ColVal::append_all(const ColVal &src) {
  val.assign(src.val.begin(), src.val.end());
  offset.assign(src.offset.begin(), src.offset.end());
  int nbytes, sub_offset;
  const uint8_t *p = sub_bitmap_bytes(src.bitmap, src.bit_map_offset, src.len,
                                      &nbytes, &sub_offset);
  bitmap.assign(p, p + nbytes);
  bit_map_offset = sub_offset;
  len = src.len;
  nil_count = src.nil_count;
}

void ColVal::append_string_range(const ColVal &src, int start, int end) {
  uint32_t off = static_cast<uint32_t>(val.size());
  for (int i = start; i < end; ++i) {
    if (i != start) off += src.offset[i] - src.offset[i - 1];
    offset.push_back(off);
  }

  uint32_t from = src.offset[start];
  uint32_t to = end == src.len ? static_cast<uint32_t>(src.val.size())
                               : src.offset[end];
  val.insert(val.end(), src.val.begin() + from, src.val.begin() + to);
}

void ColVal::append_with_nil_count(const ColVal &src, FieldType type,
                                   int start, int end, const NilCount &nc) {
  if (!is_string_type(type) && type_size(type) == 0)
    throw base::ColrecException(
        (boost::format("unsupported column type %d (%s)") % type %
         field_type_name(type))
            .str());
  if (end <= start || src.len == 0) return;

  if (end - start == src.len && len == 0) {
    append_all(src);
    return;
  }

  // Physical positions skip the nulls before start and end.
  int start_offset = start, end_offset = end;
  if (nc.total > 0) {
    start_offset = start - nc.value[start];
    end_offset = end - nc.value[end];
  }

  if (is_string_type(type)) {
    append_string_range(src, start, end);
  } else {
    int size = type_size(type);
    val.insert(val.end(), src.val.begin() + start_offset * size,
               src.val.begin() + end_offset * size);
  }

  append_bitmap(src.bitmap, src.bit_map_offset, src.len, start, end);
  len += end - start;
  nil_count += end - start - (end_offset - start_offset);
}

void ColVal::append_bitmap(const std::vector<uint8_t> &bm, int bit_offset,
                           int rows, int start, int end) {
  int nbytes, sub_offset;
  const uint8_t *sub =
      sub_bitmap_bytes(bm, bit_offset, rows, &nbytes, &sub_offset);

  // Fast path: whole bytes on both sides.
  if ((bit_map_offset + len) % 8 == 0 && (start + sub_offset) % 8 == 0) {
    int first = (start + sub_offset) / 8;
    int last = (end + sub_offset) / 8;
    if ((end + sub_offset) % 8 != 0) ++last;
    bitmap.insert(bitmap.end(), sub + first, sub + last);
    return;
  }

  int dst_row = bit_map_offset + len;
  int add_size = (dst_row + end - start + 7) / 8 - (dst_row + 7) / 8;
  if (add_size > 0) bitmap.resize(bitmap.size() + add_size, 0);

  for (int i = 0; i < end - start; ++i) {
    int dst_index = dst_row + i;
    int src_index = sub_offset + start + i;
    if ((sub[src_index >> 3] & BIT_MASK[src_index & 0x07]) == 0)
      bitmap[dst_index >> 3] &= FLIPPED_BIT_MASK[dst_index & 0x07];
    else
      bitmap[dst_index >> 3] |= BIT_MASK[dst_index & 0x07];
  }
}

void ColVal::delete_last(FieldType type) {
  if (!is_string_type(type) && type_size(type) == 0)
    throw base::ColrecException(
        (boost::format("unsupported column type %d (%s)") % type %
         field_type_name(type))
            .str());
  if (len == 0) return;

  bool nil = is_nil(len - 1);
  --len;
  if ((bit_map_offset + len) % 8 == 0 && !bitmap.empty()) bitmap.pop_back();

  if (nil) {
    --nil_count;
  } else {
    size_t size = is_string_type(type) ? val.size() - offset[len]
                                       : static_cast<size_t>(type_size(type));
    val.resize(val.size() - size);
  }

  if (is_string_type(type)) offset.resize(len);
}

int ColVal::size() const {
  return codec::SIZE_OF_INT64 * 3 + codec::size_of_byte_slice(val) +
         codec::size_of_byte_slice(bitmap) +
         codec::size_of_uint32_slice(offset);
}

error::Error ColVal::marshal(std::vector<uint8_t> &buf) const {
  codec::append_int(buf, len);
  codec::append_int(buf, nil_count);
  codec::append_int(buf, bit_map_offset);
  codec::append_bytes(buf, val);
  codec::append_bytes(buf, bitmap);
  codec::append_uint32_slice(buf, offset);
  return error::Error();
}

error::Error ColVal::unmarshal(codec::DecBuf &dec) {
  len = dec.get_int();
  nil_count = dec.get_int();
  bit_map_offset = dec.get_int();
  dec.get_bytes(val);
  dec.get_bytes(bitmap);
  dec.get_uint32_slice(offset);
  if (dec.err()) return error::wrap(dec.err(), "decode colval");

  error::Error err = check_header();
  if (err) return err;
  if (!offset.empty() && offset.size() != static_cast<size_t>(len))
    return error::Error(
        (boost::format("invalid colval offsets: %d for %d rows") %
         offset.size() % len)
            .str());
  return check_offsets();
}

error::Error ColVal::check_offsets() const {
  for (size_t i = 0; i < offset.size(); ++i) {
    size_t next = i + 1 < offset.size() ? offset[i + 1] : val.size();
    if (offset[i] > next)
      return error::Error(
          (boost::format("invalid colval offsets: offset[%d]=%d beyond %d, "
                         "val has %d bytes") %
           i % offset[i] % next % val.size())
              .str());
  }
  return error::Error();
}

error::Error ColVal::check_header() const {
  if (len < 0 || nil_count < 0 || nil_count > len || bit_map_offset < 0)
    return error::Error(
        (boost::format("invalid colval header: len=%d nil_count=%d "
                       "bit_map_offset=%d") %
         len % nil_count % bit_map_offset)
            .str());
  if (len > 0 && bitmap.size() * 8 < static_cast<size_t>(bit_map_offset) +
                                         static_cast<size_t>(len))
    return error::Error(
        (boost::format("invalid colval bitmap: %d bytes for %d rows") %
         bitmap.size() % len)
            .str());
  return error::Error();
}

error::Error ColVal::check(FieldType type) const {
  error::Error err = check_header();
  if (err) return err;

  if (is_string_type(type)) {
    if (offset.size() != static_cast<size_t>(len))
      return error::Error(
          (boost::format("invalid colval offsets: %d for %d rows") %
           offset.size() % len)
              .str());
    return check_offsets();
  }

  size_t exp_len = static_cast<size_t>(type_size(type)) *
                   static_cast<size_t>(len - nil_count);
  if (exp_len != val.size())
    return error::Error(
        (boost::format("invalid colval val: exp %d bytes, got %d") % exp_len %
         val.size())
            .str());
  return error::Error();
}

bool ColVal::operator==(const ColVal &c) const {
  return len == c.len && nil_count == c.nil_count &&
         bit_map_offset == c.bit_map_offset && val == c.val &&
         offset == c.offset && bitmap == c.bitmap;
}

}  // namespace record
}  // namespace colrec
