#include <string>
#include <vector>

#include "codec/Codec.hpp"
#include "gtest/gtest.h"
#include "record/Record.hpp"

namespace colrec {
namespace record {

class RecordTest : public testing::Test {
 public:
  // a:Integer, s:String, time:Integer with 3 rows.
  static Record sample() {
    Record rec(Schemas({Field("a", FIELD_TYPE_INT),
                        Field("s", FIELD_TYPE_STRING),
                        Field(TIME_FIELD, FIELD_TYPE_INT)}));
    rec.column(0)->append_integer(1);
    rec.column(0)->append_null();
    rec.column(0)->append_integer(3);
    rec.column(1)->append_string("x");
    rec.column(1)->append_string_null();
    rec.column(1)->append_string("");
    rec.append_times({30, 10, 20});
    return rec;
  }
};

TEST_F(RecordTest, TestConstruct) {
  Record empty;
  ASSERT_EQ(0, empty.len());
  ASSERT_EQ(0, empty.row_nums());
  ASSERT_TRUE(empty.times().empty());

  Record rec(Schemas({Field("a", FIELD_TYPE_FLOAT),
                      Field(TIME_FIELD, FIELD_TYPE_INT)}));
  ASSERT_EQ(2, rec.len());
  ASSERT_EQ(2u, rec.col_vals.size());
  ASSERT_EQ(0, rec.row_nums());
}

TEST_F(RecordTest, TestLessAndSwap) {
  Record rec(Schemas({Field(TIME_FIELD, FIELD_TYPE_INT),
                      Field("b", FIELD_TYPE_INT), Field("a", FIELD_TYPE_INT)}));
  ASSERT_FALSE(rec.less(0, 1));
  ASSERT_TRUE(rec.less(1, 0));
  ASSERT_TRUE(rec.less(2, 1));
  ASSERT_FALSE(rec.less(1, 2));
  ASSERT_FALSE(rec.less(1, 1));

  rec.column(1)->append_integer(7);
  rec.swap_columns(0, 1);
  ASSERT_EQ("b", rec.schema[0].name);
  ASSERT_EQ(TIME_FIELD, rec.schema[1].name);
  ASSERT_EQ(1, rec.column(0)->len);
  ASSERT_EQ(0, rec.column(1)->len);
}

TEST_F(RecordTest, TestTimes) {
  Record rec = sample();
  ASSERT_EQ(3, rec.row_nums());
  ASSERT_EQ(std::vector<int64_t>({30, 10, 20}), rec.times());
  rec.append_time(40);
  ASSERT_EQ(4, rec.row_nums());
}

TEST_F(RecordTest, TestValidate) {
  Record rec = sample();
  ASSERT_FALSE(rec.validate());
  ASSERT_EQ(sample(), rec);
}

TEST_F(RecordTest, TestValidateReorders) {
  Record rec(Schemas({Field("c", FIELD_TYPE_INT), Field("a", FIELD_TYPE_TAG),
                      Field("b", FIELD_TYPE_BOOLEAN),
                      Field(TIME_FIELD, FIELD_TYPE_INT)}));
  rec.column(0)->append_integer(100);
  rec.column(1)->append_string("tag");
  rec.column(2)->append_boolean(true);
  rec.append_time(1);

  ASSERT_FALSE(rec.validate());
  ASSERT_EQ("a", rec.schema[0].name);
  ASSERT_EQ("b", rec.schema[1].name);
  ASSERT_EQ("c", rec.schema[2].name);
  ASSERT_EQ(TIME_FIELD, rec.schema[3].name);

  std::vector<std::string> tags;
  rec.column(0)->string_values(tags);
  ASSERT_EQ(std::vector<std::string>({"tag"}), tags);
  ASSERT_EQ(std::vector<bool>({true}), rec.column(1)->boolean_values());
  ASSERT_EQ(std::vector<int64_t>({100}), rec.column(2)->integer_values());
}

TEST_F(RecordTest, TestValidateInvalidSchema) {
  Record no_time(Schemas({Field("a", FIELD_TYPE_INT),
                          Field("b", FIELD_TYPE_INT)}));
  error::Error err = no_time.validate();
  ASSERT_TRUE(err);
  ASSERT_EQ(0u, err.error().find("invalid schema: "));

  Record only_time(Schemas({Field(TIME_FIELD, FIELD_TYPE_INT)}));
  ASSERT_TRUE(only_time.validate());

  Record float_time(Schemas({Field("a", FIELD_TYPE_INT),
                             Field(TIME_FIELD, FIELD_TYPE_FLOAT)}));
  err = float_time.validate();
  ASSERT_TRUE(err);
  ASSERT_EQ(0u, err.error().find("invalid schema: "));

  Record missing_col = sample();
  missing_col.col_vals.pop_back();
  ASSERT_TRUE(missing_col.validate());
}

TEST_F(RecordTest, TestValidateSameName) {
  Record rec(Schemas({Field("a", FIELD_TYPE_INT), Field("a", FIELD_TYPE_FLOAT),
                      Field(TIME_FIELD, FIELD_TYPE_INT)}));
  error::Error err = rec.validate();
  ASSERT_TRUE(err);
  ASSERT_EQ("same schema; idx: 1, name: a", err.error());

  // Only adjacent after reordering.
  Record unordered(Schemas({Field("b", FIELD_TYPE_INT),
                            Field("a", FIELD_TYPE_INT),
                            Field("b", FIELD_TYPE_INT),
                            Field(TIME_FIELD, FIELD_TYPE_INT)}));
  err = unordered.validate();
  ASSERT_TRUE(err);
  ASSERT_EQ("same schema; idx: 2, name: b", err.error());
}

TEST_F(RecordTest, TestValidateColumnLength) {
  Record rec = sample();
  rec.column(0)->append_integer(4);
  error::Error err = rec.validate();
  ASSERT_TRUE(err);
  ASSERT_EQ(0u, err.error().find("invalid colvals length"));
}

TEST_F(RecordTest, TestValidateValueLength) {
  Record rec = sample();
  rec.column(0)->val.push_back(0);
  error::Error err = rec.validate();
  ASSERT_TRUE(err);
  ASSERT_EQ("the length of col_vals[0].val is incorrect. exp: 16, got: 17",
            err.error());

  Record time = sample();
  time.column(2)->val.pop_back();
  err = time.validate();
  ASSERT_TRUE(err);
  ASSERT_EQ("the length of col_vals[2].val is incorrect. exp: 24, got: 23",
            err.error());
}

TEST_F(RecordTest, TestValidateStringOffsets) {
  Record beyond = sample();
  beyond.column(1)->offset[1] = 4000;
  error::Error err = beyond.validate();
  ASSERT_TRUE(err);
  ASSERT_EQ(0u, err.error().find("col_vals[1]: invalid colval offsets"));

  Record decreasing = sample();
  decreasing.column(1)->offset[0] = 1;
  decreasing.column(1)->offset[1] = 0;
  ASSERT_TRUE(decreasing.validate());

  Record missing = sample();
  missing.column(1)->offset.pop_back();
  err = missing.validate();
  ASSERT_TRUE(err);
  ASSERT_EQ("col_vals[1]: invalid colval offsets: 2 for 3 rows", err.error());

  Record no_offsets = sample();
  no_offsets.column(1)->offset.clear();
  ASSERT_TRUE(no_offsets.validate());

  Record short_bitmap = sample();
  short_bitmap.column(0)->bitmap.clear();
  err = short_bitmap.validate();
  ASSERT_TRUE(err);
  ASSERT_EQ(0u, err.error().find("col_vals[0]: invalid colval bitmap"));
}

TEST_F(RecordTest, TestValidateTimeNulls) {
  Record rec = sample();
  rec.column(0)->append_integer(4);
  rec.column(1)->append_string("y");
  rec.column(2)->append_null();
  ASSERT_TRUE(rec.validate());
}

TEST_F(RecordTest, TestString) {
  Record rec = sample();
  ASSERT_EQ(
      "field(a):[1 3]\n"
      "field(s):[\"x\" \"\"]\n"
      "field(time):[30 10 20]\n",
      rec.string());

  Record bools(Schemas({Field("ok", FIELD_TYPE_BOOLEAN),
                        Field(TIME_FIELD, FIELD_TYPE_INT)}));
  bools.column(0)->append_booleans({true, false});
  bools.append_times({1, 2});
  ASSERT_EQ("field(ok):[true false]\nfield(time):[1 2]\n", bools.string());
}

TEST_F(RecordTest, TestReset) {
  Record rec = sample();
  size_t cap = rec.column(0)->val.capacity();

  rec.reset_with_schema(rec.schema);
  ASSERT_EQ(3, rec.len());
  ASSERT_EQ(0, rec.row_nums());
  ASSERT_EQ(0, rec.column(0)->len);
  ASSERT_EQ(cap, rec.column(0)->val.capacity());

  rec.reserve_col_val(2);
  ASSERT_EQ(5u, rec.col_vals.size());
  ASSERT_EQ(0, rec.col_vals[4].len);

  rec.reset();
  ASSERT_EQ(0, rec.len());
  ASSERT_TRUE(rec.col_vals.empty());
}

TEST_F(RecordTest, TestSwap) {
  Record a = sample();
  Record b;
  a.swap(b);
  ASSERT_EQ(0, a.len());
  ASSERT_EQ(sample(), b);
}

TEST_F(RecordTest, TestMarshal) {
  Record rec = sample();
  std::vector<uint8_t> buf;
  ASSERT_FALSE(rec.marshal(buf));
  ASSERT_EQ(static_cast<size_t>(rec.size()), buf.size());

  // Field count, then the size and bytes of the first field.
  ASSERT_EQ(
      std::vector<uint8_t>({0, 0, 0, 3, 0, 0, 0, 7, 0, 1, 'a', 0, 0, 0, 1}),
      std::vector<uint8_t>(buf.begin(), buf.begin() + 15));

  Record out;
  ASSERT_FALSE(out.unmarshal(buf));
  ASSERT_EQ(rec, out);
  ASSERT_EQ(rec.string(), out.string());
}

TEST_F(RecordTest, TestMarshalEmpty) {
  Record rec;
  std::vector<uint8_t> buf;
  ASSERT_FALSE(rec.marshal(buf));
  ASSERT_EQ(std::vector<uint8_t>({0, 0, 0, 0, 0, 0, 0, 0}), buf);

  Record out = sample();
  ASSERT_FALSE(out.unmarshal(buf));
  ASSERT_EQ(0, out.len());
  ASSERT_TRUE(out.col_vals.empty());
}

TEST_F(RecordTest, TestUnmarshalInvalid) {
  Record rec = sample();
  std::vector<uint8_t> buf;
  ASSERT_FALSE(rec.marshal(buf));

  std::vector<uint8_t> trailing(buf);
  trailing.push_back(0);
  Record out = sample();
  error::Error err = out.unmarshal(trailing);
  ASSERT_TRUE(err);
  ASSERT_EQ("record: 1 trailing bytes", err.error());
  // Failed decoding leaves the record alone.
  ASSERT_EQ(sample(), out);

  for (size_t n : {size_t(0), size_t(3), size_t(10), buf.size() - 1}) {
    Record truncated;
    ASSERT_TRUE(truncated.unmarshal(buf.data(), static_cast<int>(n)))
        << "n=" << n;
  }

  // Offsets pointing past the string bytes never decode.
  Record tampered = sample();
  tampered.column(1)->offset[1] = 4000;
  std::vector<uint8_t> tampered_buf;
  ASSERT_FALSE(tampered.marshal(tampered_buf));
  Record decoded;
  err = decoded.unmarshal(tampered_buf);
  ASSERT_TRUE(err);
  ASSERT_NE(std::string::npos, err.error().find("invalid colval offsets"));
  ASSERT_EQ(0, decoded.len());

  std::vector<uint8_t> huge_count({0xff, 0xff, 0xff, 0xff});
  ASSERT_TRUE(out.unmarshal(huge_count));
}

}  // namespace record
}  // namespace colrec

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
