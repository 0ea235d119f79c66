#include "record/Field.hpp"

#include "codec/Codec.hpp"
#include "codec/DecBuf.hpp"

namespace colrec {
namespace record {

const FieldType FIELD_TYPE_UNKNOWN = 0;
const FieldType FIELD_TYPE_INT = 1;
const FieldType FIELD_TYPE_UINT = 2;
const FieldType FIELD_TYPE_FLOAT = 3;
const FieldType FIELD_TYPE_STRING = 4;
const FieldType FIELD_TYPE_BOOLEAN = 5;
const FieldType FIELD_TYPE_TAG = 6;
const FieldType FIELD_TYPE_LAST = 7;

const std::string TIME_FIELD = "time";

std::string field_type_name(FieldType type) {
  switch (type) {
    case 1:
      return "Integer";
    case 2:
      return "Unsigned";
    case 3:
      return "Float";
    case 4:
      return "String";
    case 5:
      return "Boolean";
    case 6:
      return "Tag";
    default:
      return "Unknown";
  }
}

int type_size(FieldType type) {
  switch (type) {
    case 1:
      return sizeof(int64_t);
    case 3:
      return sizeof(double);
    case 5:
      return sizeof(bool);
    default:
      return 0;
  }
}

std::string Field::string() const { return name + field_type_name(type); }

error::Error Field::marshal(std::vector<uint8_t> &buf) const {
  error::Error err = codec::append_string(buf, name);
  if (err) return error::wrap(err, "marshal field name");
  codec::append_uint32(buf, static_cast<uint32_t>(type));
  return error::Error();
}

int Field::size() const {
  return codec::size_of_string(name) + codec::SIZE_OF_UINT32;
}

error::Error Field::unmarshal(codec::DecBuf &dec) {
  name = dec.get_string();
  type = static_cast<FieldType>(dec.get_BE_uint32());
  if (dec.err()) return error::wrap(dec.err(), "decode field");
  return error::Error();
}

std::string schemas_string(const Schemas &schema) {
  std::string s;
  for (const Field &f : schema) s += f.string() + "\n";
  return s;
}

}  // namespace record
}  // namespace colrec
