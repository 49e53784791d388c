#ifndef FIXCAST_CORE_FORMAT_HPP
#define FIXCAST_CORE_FORMAT_HPP

#include <cstdint>

#include "fixcast/core/bits.hpp"
#include "fixcast/core/descriptor.hpp"

namespace fixcast {

// Compile-time bit geometry of a fixed-point word.
//
// Same layout as FormatDescriptor, but the parameters are template
// arguments and bad geometry is a compile error instead of an exception.
//
//   signed:   [S][ integer bits ][ binary_point fractional bits ]
//   unsigned:    [ integer bits ][ binary_point fractional bits ]
template <int Bits, int BinaryPoint, bool Signed>
struct FixedFormat {
  static constexpr int total_bits = Bits;
  static constexpr int binary_point = BinaryPoint;
  static constexpr bool is_signed = Signed;

  static constexpr int sign_bits = Signed ? 1 : 0;
  static constexpr int int_bits = Bits - BinaryPoint - sign_bits;
  static constexpr int frac_bits = BinaryPoint;

  static constexpr uint32_t dec_mask = lowMask(BinaryPoint);
  static constexpr uint32_t int_mask =
      rangeMask(BinaryPoint, Bits - sign_bits);
  static constexpr uint32_t sign_mask =
      Signed ? uint32_t{1} << (Bits - 1) : 0;

  static constexpr FormatDescriptor descriptor() {
    return makeDescriptor(Bits, BinaryPoint, Signed);
  }

  static_assert(Bits == 8 || Bits == 16 || Bits == 32,
                "fixed-point words are 8, 16 or 32 bits wide");
  static_assert(BinaryPoint >= 0, "binary point must be non-negative");
  static_assert(BinaryPoint < Bits,
                "binary point must leave at least one non-fractional bit");
};

// Toolchain spelling: Fix_16_15, UFix_8_0, ...
template <int Bits, int BinaryPoint>
using Fix = FixedFormat<Bits, BinaryPoint, true>;

template <int Bits, int BinaryPoint>
using UFix = FixedFormat<Bits, BinaryPoint, false>;

// Named Q-format layouts
using q7_layout = Fix<8, 7>;
using q15_layout = Fix<16, 15>;
using q31_layout = Fix<32, 31>;
using uq1_7_layout = UFix<8, 7>;
using uq1_15_layout = UFix<16, 15>;
using uq1_31_layout = UFix<32, 31>;

} // namespace fixcast

#endif // FIXCAST_CORE_FORMAT_HPP
