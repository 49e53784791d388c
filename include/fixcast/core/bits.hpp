#ifndef FIXCAST_CORE_BITS_HPP
#define FIXCAST_CORE_BITS_HPP

// bits_t<N>: the unsigned container for one raw fixed-point code.
//
// Not a number semantically, a register image. Only the three widths a
// toolchain word can take are mapped; anything else fails to compile.

#include <cstdint>

namespace fixcast {

namespace detail {

template <int N>
struct BitsStorage {
  static_assert(N == 8 || N == 16 || N == 32,
                "fixed-point words are 8, 16 or 32 bits wide");
};

template <>
struct BitsStorage<8> {
  using type = uint8_t;
};

template <>
struct BitsStorage<16> {
  using type = uint16_t;
};

template <>
struct BitsStorage<32> {
  using type = uint32_t;
};

} // namespace detail

template <int N>
using bits_t = typename detail::BitsStorage<N>::type;

// Run-time width check shared by the descriptor builder and the byte
// order helpers.
constexpr bool isSupportedWidth(unsigned Bits) {
  return Bits == 8 || Bits == 16 || Bits == 32;
}

// Low N bits set. Valid for 0 <= N <= 32.
constexpr uint32_t lowMask(unsigned N) {
  return N >= 32 ? UINT32_MAX : (uint32_t{1} << N) - 1;
}

// Bits [Lo, Hi) set.
constexpr uint32_t rangeMask(unsigned Lo, unsigned Hi) {
  return Hi <= Lo ? 0 : lowMask(Hi) & ~lowMask(Lo);
}

} // namespace fixcast

#endif // FIXCAST_CORE_BITS_HPP
