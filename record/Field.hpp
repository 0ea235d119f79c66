#ifndef FIELD_H
#define FIELD_H

#include <stdint.h>

#include <string>
#include <vector>

#include "base/Error.hpp"

namespace colrec {

namespace codec {
class DecBuf;
}  // namespace codec

namespace record {

typedef int FieldType;
extern const FieldType FIELD_TYPE_UNKNOWN;
extern const FieldType FIELD_TYPE_INT;
extern const FieldType FIELD_TYPE_UINT;
extern const FieldType FIELD_TYPE_FLOAT;
extern const FieldType FIELD_TYPE_STRING;
extern const FieldType FIELD_TYPE_BOOLEAN;
extern const FieldType FIELD_TYPE_TAG;
extern const FieldType FIELD_TYPE_LAST;

// Reserved name of the timestamp column, always the last field.
extern const std::string TIME_FIELD;

// "Integer", "Unsigned", "Float", "String", "Boolean", "Tag" or "Unknown".
std::string field_type_name(FieldType type);

// Bytes per value of a fixed-width type, 0 for everything else.
int type_size(FieldType type);

inline bool is_string_type(FieldType type) {
  return type == FIELD_TYPE_STRING || type == FIELD_TYPE_TAG;
}

class Field {
 public:
  FieldType type;
  std::string name;

  Field() : type(FIELD_TYPE_UNKNOWN) {}
  Field(const std::string &name, FieldType type) : type(type), name(name) {}

  // name followed by the type label, e.g. "usageFloat".
  std::string string() const;

  // ┌──────────────────────────────┐
  // │ len(name) <2b> │ name        │
  // ├──────────────────────────────┤
  // │ type <4b>                    │
  // └──────────────────────────────┘
  error::Error marshal(std::vector<uint8_t> &buf) const;
  int size() const;

  error::Error unmarshal(codec::DecBuf &dec);

  bool operator==(const Field &f) const {
    return type == f.type && name == f.name;
  }
  bool operator!=(const Field &f) const { return !(*this == f); }
};

typedef std::vector<Field> Schemas;

// One Field::string() per line.
std::string schemas_string(const Schemas &schema);

}  // namespace record
}  // namespace colrec

#endif
