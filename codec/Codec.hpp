#ifndef CODEC_H
#define CODEC_H

#include <stdint.h>

#include <string>
#include <vector>

#include "base/Error.hpp"

namespace colrec {
namespace codec {

// Longest string that fits behind a uint16 length prefix.
extern int MAX_STRING_LEN;

extern const int SIZE_OF_UINT16;
extern const int SIZE_OF_UINT32;
extern const int SIZE_OF_INT64;

// ┌──────────────────┐
// │ u <2b, BE>       │
// └──────────────────┘
void append_uint16(std::vector<uint8_t> &b, uint16_t u);

// ┌──────────────────┐
// │ u <4b, BE>       │
// └──────────────────┘
void append_uint32(std::vector<uint8_t> &b, uint32_t u);

// ┌────────────────────────────────┐
// │ (v << 1) ^ (v >> 63) <8b, BE>  │
// └────────────────────────────────┘
// Fixed width, unlike varint zig-zag.
void append_int64(std::vector<uint8_t> &b, int64_t v);
void append_int(std::vector<uint8_t> &b, int i);

// ┌───────────────┬──────────────┐
// │ len <uint16>  │ bytes        │
// └───────────────┴──────────────┘
// Strings longer than MAX_STRING_LEN (capped at 65535) are rejected and
// nothing is written.
error::Error append_string(std::vector<uint8_t> &b, const std::string &s);

// ┌───────────────┬──────────────┐
// │ len <uint32>  │ bytes        │
// └───────────────┴──────────────┘
void append_bytes(std::vector<uint8_t> &b, const std::vector<uint8_t> &buf);

// ┌───────────────┬───────────────────────────────┐
// │ n <uint32>    │ n * 4 bytes in host byte order │
// └───────────────┴───────────────────────────────┘
void append_uint32_slice(std::vector<uint8_t> &b,
                         const std::vector<uint32_t> &a);

uint64_t zigzag_encode(int64_t v);
int64_t zigzag_decode(uint64_t u);

int size_of_string(const std::string &s);
int size_of_byte_slice(const std::vector<uint8_t> &s);
int size_of_uint32_slice(const std::vector<uint32_t> &s);

}  // namespace codec
}  // namespace colrec

#endif
