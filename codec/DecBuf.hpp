#ifndef DECBUF_H
#define DECBUF_H

#include <stdint.h>

#include <string>
#include <vector>

#include "base/Error.hpp"

namespace colrec {
namespace codec {

// DecBuf reads the encodings written by the append_* functions.
// The first short read sets err() and every later read returns zero values,
// so callers check err() once after a group of reads.
class DecBuf {
 public:
  DecBuf(const uint8_t *b, int size);
  explicit DecBuf(const std::vector<uint8_t> &b);

  uint16_t get_BE_uint16();
  uint32_t get_BE_uint32();
  int64_t get_int64();
  int get_int();

  std::string get_string();
  void get_bytes(std::vector<uint8_t> &dst);
  void get_uint32_slice(std::vector<uint32_t> &dst);

  // Returns a pointer to the next n bytes and skips them.
  const uint8_t *get_raw(int n);

  int len() const { return size_ - index_; }
  int pos() const { return index_; }

  const error::Error &err() const { return err_; }

 private:
  bool check(int n);

  const uint8_t *b_;
  int size_;
  int index_;
  error::Error err_;
};

}  // namespace codec
}  // namespace colrec

#endif
