#pragma once
/*
================================================================================
Fragment 1.5 — Core: Deterministic Hashing
FILE: cpp/stagegate/core/hashing.hpp

Purpose:
  - Stable 64-bit identity for elements that carry no id-like field, so the
    same record maps to the same history entry across runs and platforms.

Encoding:
  - integers and lengths: 8 bytes, little-endian
  - doubles: canonical bit pattern (-0.0 as +0.0, every NaN as one payload)
  - strings: length, then bytes

Not cryptographic.
================================================================================
*/

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace stagegate {

struct Hash64 {
  uint64_t value = 0;

  constexpr bool operator==(const Hash64& o) const noexcept { return value == o.value; }
  constexpr bool operator!=(const Hash64& o) const noexcept { return value != o.value; }
};

// Streaming FNV-1a, 64-bit.
class Fnv1a64 {
 public:
  static constexpr uint64_t kOffsetBasis = 14695981039346656037ull;
  static constexpr uint64_t kPrime       = 1099511628211ull;

  Hash64 digest() const { return Hash64{h_}; }

  void update_tag(uint8_t tag) { mix(tag); }
  void update_i64(int64_t v) { update_word(static_cast<uint64_t>(v)); }
  void update_length(std::size_t n) { update_word(static_cast<uint64_t>(n)); }
  void update_f64(double x);
  void update_string(std::string_view s);

 private:
  void mix(uint8_t byte) {
    h_ ^= byte;
    h_ *= kPrime;
  }
  void update_word(uint64_t v);

  uint64_t h_ = kOffsetBasis;
};

// 16 lowercase hex digits, most significant nibble first.
std::string hash_to_hex(Hash64 h);

}  // namespace stagegate
