#include "codec/Codec.hpp"

#include <cstring>

#include <boost/format.hpp>

namespace colrec {
namespace codec {

int MAX_STRING_LEN = 65535;

const int SIZE_OF_UINT16 = 2;
const int SIZE_OF_UINT32 = 4;
const int SIZE_OF_INT64 = 8;

void append_uint16(std::vector<uint8_t> &b, uint16_t u) {
  b.push_back(static_cast<uint8_t>(u >> 8));
  b.push_back(static_cast<uint8_t>(u));
}

void append_uint32(std::vector<uint8_t> &b, uint32_t u) {
  b.push_back(static_cast<uint8_t>(u >> 24));
  b.push_back(static_cast<uint8_t>(u >> 16));
  b.push_back(static_cast<uint8_t>(u >> 8));
  b.push_back(static_cast<uint8_t>(u));
}

uint64_t zigzag_encode(int64_t v) {
  return (static_cast<uint64_t>(v) << 1) ^ static_cast<uint64_t>(v >> 63);
}

int64_t zigzag_decode(uint64_t u) {
  return static_cast<int64_t>(u >> 1) ^ -static_cast<int64_t>(u & 1);
}

void append_int64(std::vector<uint8_t> &b, int64_t v) {
  uint64_t u = zigzag_encode(v);
  for (int shift = 56; shift >= 0; shift -= 8)
    b.push_back(static_cast<uint8_t>(u >> shift));
}

void append_int(std::vector<uint8_t> &b, int i) {
  append_int64(b, static_cast<int64_t>(i));
}

error::Error append_string(std::vector<uint8_t> &b, const std::string &s) {
  size_t max = MAX_STRING_LEN < 0 ? 0 : static_cast<size_t>(MAX_STRING_LEN);
  if (max > 0xffff) max = 0xffff;
  if (s.size() > max)
    return error::Error(
        (boost::format("string too long: %d bytes, max %d") % s.size() % max)
            .str());
  append_uint16(b, static_cast<uint16_t>(s.size()));
  b.insert(b.end(), s.begin(), s.end());
  return error::Error();
}

void append_bytes(std::vector<uint8_t> &b, const std::vector<uint8_t> &buf) {
  append_uint32(b, static_cast<uint32_t>(buf.size()));
  b.insert(b.end(), buf.begin(), buf.end());
}

void append_uint32_slice(std::vector<uint8_t> &b,
                         const std::vector<uint32_t> &a) {
  append_uint32(b, static_cast<uint32_t>(a.size()));
  if (a.empty()) return;

  size_t index = b.size();
  b.resize(index + a.size() * SIZE_OF_UINT32);
  memcpy(&b[index], a.data(), a.size() * SIZE_OF_UINT32);
}

int size_of_string(const std::string &s) {
  return static_cast<int>(s.size()) + SIZE_OF_UINT16;
}

int size_of_byte_slice(const std::vector<uint8_t> &s) {
  return static_cast<int>(s.size()) + SIZE_OF_UINT32;
}

int size_of_uint32_slice(const std::vector<uint32_t> &s) {
  return static_cast<int>(s.size()) * SIZE_OF_UINT32 + SIZE_OF_UINT32;
}

}  // namespace codec
}  // namespace colrec
