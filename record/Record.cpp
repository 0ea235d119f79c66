#include "record/Record.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

#include <boost/format.hpp>

#include "base/Logging.hpp"
#include "codec/Codec.hpp"
#include "codec/DecBuf.hpp"

namespace colrec {
namespace record {

Record::Record(const Schemas &schema)
    : col_vals(schema.size()), schema(schema) {}

bool Record::less(int i, int j) const {
  if (schema[i].name == TIME_FIELD)
    return false;
  else if (schema[j].name == TIME_FIELD)
    return true;
  else
    return schema[i].name < schema[j].name;
}

void Record::swap_columns(int i, int j) {
  std::swap(schema[i], schema[j]);
  std::swap(col_vals[i], col_vals[j]);
}

void Record::sort_columns() {
  std::vector<int> idx(schema.size());
  for (size_t i = 0; i < idx.size(); ++i) idx[i] = static_cast<int>(i);
  std::stable_sort(idx.begin(), idx.end(),
                   [this](int a, int b) { return less(a, b); });

  Schemas sorted_schema;
  std::vector<ColVal> sorted_cols;
  sorted_schema.reserve(idx.size());
  sorted_cols.reserve(idx.size());
  for (int i : idx) {
    sorted_schema.push_back(std::move(schema[i]));
    sorted_cols.push_back(std::move(col_vals[i]));
  }
  schema.swap(sorted_schema);
  col_vals.swap(sorted_cols);
}

namespace {

error::Error check_same_name(const Schemas &schema) {
  for (size_t i = 1; i < schema.size(); ++i) {
    if (schema[i].name == schema[i - 1].name)
      return error::Error((boost::format("same schema; idx: %d, name: %s") %
                           i % schema[i].name)
                              .str());
  }
  return error::Error();
}

}  // namespace

error::Error Record::validate() {
  int n = len();
  if (static_cast<size_t>(n) != col_vals.size())
    return error::Error(
        (boost::format("invalid record: %d fields but %d columns") % n %
         col_vals.size())
            .str());
  if (n <= 1 || schema[n - 1].name != TIME_FIELD)
    return error::Error("invalid schema: " + schemas_string(schema));
  if (schema[n - 1].type != FIELD_TYPE_INT)
    return error::Error("invalid schema: time field must be " +
                        field_type_name(FIELD_TYPE_INT) + ", got " +
                        field_type_name(schema[n - 1].type));
  if (col_vals[n - 1].nil_count != 0)
    return error::Error(
        (boost::format("invalid colvals: time column has %d nulls") %
         col_vals[n - 1].nil_count)
            .str());

  error::Error err = check_same_name(schema);
  if (err) return err;

  bool ordered = true;
  for (int i = 0; i < n; ++i) {
    const Field &f = schema[i];
    const ColVal &col = col_vals[i];

    if (i < n - 1 && col.len != col_vals[i + 1].len)
      return error::Error(
          (boost::format("invalid colvals length: column %d has %d rows, "
                         "column %d has %d rows") %
           i % col.len % (i + 1) % col_vals[i + 1].len)
              .str());

    if (ordered && i > 0 && i < n - 1 && schema[i - 1].name >= f.name) {
      LOG_DEBUG << "msg=\"record schema is not ordered\" idx=" << i - 1
                << " name=" << schema[i - 1].name << " idx=" << i
                << " name=" << f.name;
      ordered = false;
    }

    if (!is_string_type(f.type)) {
      size_t exp_len =
          static_cast<size_t>(type_size(f.type)) * (col.len - col.nil_count);
      if (exp_len != col.val.size())
        return error::Error(
            (boost::format("the length of col_vals[%d].val is incorrect. "
                           "exp: %d, got: %d") %
             i % exp_len % col.val.size())
                .str());
    }

    err = col.check(f.type);
    if (err)
      return error::wrap(err, (boost::format("col_vals[%d]") % i).str());
  }

  if (!ordered) {
    sort_columns();
    err = check_same_name(schema);
    if (err) return err;
  }
  return error::Error();
}

int Record::row_nums() const {
  if (col_vals.empty()) return 0;
  return col_vals.back().len;
}

std::vector<int64_t> Record::times() const {
  if (col_vals.empty()) return std::vector<int64_t>();
  return col_vals.back().integer_values();
}

void Record::append_time(int64_t t) { col_vals.back().append_integer(t); }

void Record::append_times(std::initializer_list<int64_t> ts) {
  for (int64_t t : ts) append_time(t);
}

void Record::reset() {
  schema.clear();
  col_vals.clear();
}

// Keeps the existing column buffers so their capacity is reused.
void Record::reset_with_schema(const Schemas &s) {
  schema = s;
  col_vals.resize(schema.size());
  init_col_val(0, static_cast<int>(col_vals.size()));
}

void Record::reserve_col_val(int size) {
  int start = static_cast<int>(col_vals.size());
  col_vals.resize(start + size);
  init_col_val(start, start + size);
}

void Record::init_col_val(int start, int end) {
  for (int i = start; i < end; ++i) col_vals[i].init();
}

void Record::swap(Record &r) {
  col_vals.swap(r.col_vals);
  schema.swap(r.schema);
}

std::string Record::string() const {
  std::ostringstream out;
  for (size_t i = 0; i < schema.size() && i < col_vals.size(); ++i) {
    const Field &f = schema[i];
    const ColVal &col = col_vals[i];
    out << "field(" << f.name << "):[";
    if (f.type == FIELD_TYPE_INT) {
      std::vector<int64_t> v = col.integer_values();
      for (size_t j = 0; j < v.size(); ++j) out << (j ? " " : "") << v[j];
    } else if (f.type == FIELD_TYPE_FLOAT) {
      std::vector<double> v = col.float_values();
      for (size_t j = 0; j < v.size(); ++j) out << (j ? " " : "") << v[j];
    } else if (f.type == FIELD_TYPE_BOOLEAN) {
      std::vector<bool> v = col.boolean_values();
      for (size_t j = 0; j < v.size(); ++j)
        out << (j ? " " : "") << (v[j] ? "true" : "false");
    } else if (is_string_type(f.type)) {
      std::vector<std::string> v;
      col.string_values(v);
      for (size_t j = 0; j < v.size(); ++j)
        out << (j ? " " : "") << "\"" << v[j] << "\"";
    }
    out << "]\n";
  }
  return out.str();
}

int Record::size() const {
  int size = codec::SIZE_OF_UINT32;
  for (const Field &f : schema) size += codec::SIZE_OF_UINT32 + f.size();
  size += codec::SIZE_OF_UINT32;
  for (const ColVal &c : col_vals) size += codec::SIZE_OF_UINT32 + c.size();
  return size;
}

error::Error Record::marshal(std::vector<uint8_t> &buf) const {
  codec::append_uint32(buf, static_cast<uint32_t>(schema.size()));
  for (size_t i = 0; i < schema.size(); ++i) {
    codec::append_uint32(buf, static_cast<uint32_t>(schema[i].size()));
    error::Error err = schema[i].marshal(buf);
    if (err)
      return error::wrap(err, (boost::format("marshal field %d") % i).str());
  }

  codec::append_uint32(buf, static_cast<uint32_t>(col_vals.size()));
  for (size_t i = 0; i < col_vals.size(); ++i) {
    codec::append_uint32(buf, static_cast<uint32_t>(col_vals[i].size()));
    error::Error err = col_vals[i].marshal(buf);
    if (err)
      return error::wrap(err, (boost::format("marshal colval %d") % i).str());
  }
  return error::Error();
}

namespace {

// Reads one size-prefixed entry and hands its bytes to a fresh DecBuf.
template <typename T>
error::Error unmarshal_entry(codec::DecBuf &dec, T &entry,
                             const std::string &what, size_t i) {
  uint32_t size = dec.get_BE_uint32();
  const uint8_t *p = dec.get_raw(static_cast<int>(size));
  if (dec.err())
    return error::wrap(dec.err(),
                       (boost::format("decode %s %d") % what % i).str());

  codec::DecBuf entry_dec(p, static_cast<int>(size));
  error::Error err = entry.unmarshal(entry_dec);
  if (err) return error::wrap(err, (boost::format("%s %d") % what % i).str());
  if (entry_dec.len() != 0)
    return error::Error((boost::format("%s %d: %d trailing bytes") % what % i %
                         entry_dec.len())
                            .str());
  return error::Error();
}

}  // namespace

error::Error Record::unmarshal(const uint8_t *buf, int length) {
  codec::DecBuf dec(buf, length);
  Schemas new_schema;
  std::vector<ColVal> new_cols;

  uint32_t n = dec.get_BE_uint32();
  if (dec.err()) return error::wrap(dec.err(), "decode schema count");
  if (n > static_cast<uint32_t>(dec.len() / codec::SIZE_OF_UINT32))
    return error::Error(
        (boost::format("invalid schema count %d for %d bytes") % n % dec.len())
            .str());
  new_schema.resize(n);
  for (uint32_t i = 0; i < n; ++i) {
    error::Error err = unmarshal_entry(dec, new_schema[i], "field", i);
    if (err) return err;
  }

  uint32_t m = dec.get_BE_uint32();
  if (dec.err()) return error::wrap(dec.err(), "decode colval count");
  if (m > static_cast<uint32_t>(dec.len() / codec::SIZE_OF_UINT32))
    return error::Error(
        (boost::format("invalid colval count %d for %d bytes") % m % dec.len())
            .str());
  new_cols.resize(m);
  for (uint32_t i = 0; i < m; ++i) {
    error::Error err = unmarshal_entry(dec, new_cols[i], "colval", i);
    if (err) return err;
  }

  if (dec.len() != 0)
    return error::Error(
        (boost::format("record: %d trailing bytes") % dec.len()).str());

  schema.swap(new_schema);
  col_vals.swap(new_cols);
  return error::Error();
}

error::Error Record::unmarshal(const std::vector<uint8_t> &buf) {
  return unmarshal(buf.data(), static_cast<int>(buf.size()));
}

}  // namespace record
}  // namespace colrec
