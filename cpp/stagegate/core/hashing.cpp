#include "stagegate/core/hashing.hpp"

#include <bit>
#include <cmath>

namespace stagegate {

void Fnv1a64::update_word(uint64_t v) {
  for (int i = 0; i < 8; ++i) mix(static_cast<uint8_t>(v >> (8 * i)));
}

void Fnv1a64::update_f64(double x) {
  uint64_t bits = 0x7ff8000000000000ull;  // canonical quiet NaN
  if (!std::isnan(x)) bits = std::bit_cast<uint64_t>(x == 0.0 ? 0.0 : x);
  update_word(bits);
}

void Fnv1a64::update_string(std::string_view s) {
  update_length(s.size());
  for (char c : s) mix(static_cast<uint8_t>(c));
}

std::string hash_to_hex(Hash64 h) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out(16, '0');
  uint64_t v = h.value;
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kDigits[v & 0xFu];
    v >>= 4;
  }
  return out;
}

}  // namespace stagegate
