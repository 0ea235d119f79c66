#include "codec/DecBuf.hpp"

#include <limits.h>

#include <cstring>

#include <boost/format.hpp>

#include "codec/Codec.hpp"

namespace colrec {
namespace codec {

DecBuf::DecBuf(const uint8_t *b, int size) : b_(b), size_(size), index_(0) {}

DecBuf::DecBuf(const std::vector<uint8_t> &b)
    : b_(b.data()), size_(static_cast<int>(b.size())), index_(0) {}

bool DecBuf::check(int n) {
  if (err_) return false;
  if (n < 0 || n > size_ - index_) {
    err_ = error::Error(
        (boost::format("invalid size: need %d bytes at offset %d, have %d") %
         n % index_ % (size_ - index_))
            .str());
    return false;
  }
  return true;
}

uint16_t DecBuf::get_BE_uint16() {
  if (!check(SIZE_OF_UINT16)) return 0;
  uint16_t u = (static_cast<uint16_t>(b_[index_]) << 8) |
               static_cast<uint16_t>(b_[index_ + 1]);
  index_ += SIZE_OF_UINT16;
  return u;
}

uint32_t DecBuf::get_BE_uint32() {
  if (!check(SIZE_OF_UINT32)) return 0;
  uint32_t u = 0;
  for (int i = 0; i < SIZE_OF_UINT32; ++i) u = (u << 8) | b_[index_ + i];
  index_ += SIZE_OF_UINT32;
  return u;
}

int64_t DecBuf::get_int64() {
  if (!check(SIZE_OF_INT64)) return 0;
  uint64_t u = 0;
  for (int i = 0; i < SIZE_OF_INT64; ++i) u = (u << 8) | b_[index_ + i];
  index_ += SIZE_OF_INT64;
  return zigzag_decode(u);
}

int DecBuf::get_int() {
  int64_t v = get_int64();
  if (err_) return 0;
  if (v < INT_MIN || v > INT_MAX) {
    err_ = error::Error(
        (boost::format("invalid int: %d at offset %d out of range") % v %
         (index_ - SIZE_OF_INT64))
            .str());
    return 0;
  }
  return static_cast<int>(v);
}

std::string DecBuf::get_string() {
  int n = get_BE_uint16();
  const uint8_t *p = get_raw(n);
  if (!p) return std::string();
  return std::string(reinterpret_cast<const char *>(p), n);
}

void DecBuf::get_bytes(std::vector<uint8_t> &dst) {
  dst.clear();
  uint32_t n = get_BE_uint32();
  if (n > static_cast<uint32_t>(len())) {
    check(static_cast<int>(len() + 1));
    return;
  }
  const uint8_t *p = get_raw(static_cast<int>(n));
  if (p) dst.assign(p, p + n);
}

void DecBuf::get_uint32_slice(std::vector<uint32_t> &dst) {
  dst.clear();
  uint32_t n = get_BE_uint32();
  if (n > static_cast<uint32_t>(len() / SIZE_OF_UINT32)) {
    check(static_cast<int>(len() + 1));
    return;
  }
  const uint8_t *p = get_raw(static_cast<int>(n) * SIZE_OF_UINT32);
  if (!p || n == 0) return;
  dst.resize(n);
  memcpy(dst.data(), p, n * SIZE_OF_UINT32);
}

const uint8_t *DecBuf::get_raw(int n) {
  if (!check(n)) return nullptr;
  const uint8_t *p = b_ + index_;
  index_ += n;
  return p;
}

}  // namespace codec
}  // namespace colrec
