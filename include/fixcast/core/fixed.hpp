#ifndef FIXCAST_CORE_FIXED_HPP
#define FIXCAST_CORE_FIXED_HPP

#include <cstdint>

#include "fixcast/core/bits.hpp"
#include "fixcast/core/decode.hpp"
#include "fixcast/core/descriptor.hpp"
#include "fixcast/core/encode.hpp"
#include "fixcast/core/format.hpp"
#include "fixcast/core/rounding.hpp"

namespace fixcast {

// A fixed-point format known at compile time, bundled with the rounding
// policy its encoder uses. Conversions go through the same run-time
// engine as a parsed descriptor, so both paths produce identical codes.
template <typename Fmt, typename Rnd = rounding::Default>
  requires RoundingPolicy<Rnd>
struct Fixed {
  using format = Fmt;
  using rounding = Rnd;
  using storage_type = bits_t<Fmt::total_bits>;

  static constexpr FormatDescriptor descriptor = Fmt::descriptor();

  // Smallest and largest representable values.
  static constexpr double lowest = decodeValue(
      Fmt::is_signed ? Fmt::sign_mask : 0u, descriptor);
  static constexpr double highest =
      decodeValue(Fmt::int_mask | Fmt::dec_mask, descriptor);

  static constexpr double decode(storage_type Raw) {
    return decodeValue(Raw, descriptor);
  }

  static storage_type encode(double Real) {
    return static_cast<storage_type>(encodeValue<Rnd>(Real, descriptor));
  }
};

// --- Convenience aliases ---

// Signed Q formats: one sign bit, the rest fractional.
using q7 = Fixed<q7_layout>;
using q15 = Fixed<q15_layout>;
using q31 = Fixed<q31_layout>;

// Unsigned formats with one integer bit.
using uq1_7 = Fixed<uq1_7_layout>;
using uq1_15 = Fixed<uq1_15_layout>;
using uq1_31 = Fixed<uq1_31_layout>;

// Round-to-nearest variants for new data paths that need not match
// captured toolchain output.
template <typename Fmt>
using NearestFixed = Fixed<Fmt, rounding::ToNearestTiesToEven>;

} // namespace fixcast

#endif // FIXCAST_CORE_FIXED_HPP
