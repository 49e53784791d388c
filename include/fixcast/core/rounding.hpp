#ifndef FIXCAST_CORE_ROUNDING_HPP
#define FIXCAST_CORE_ROUNDING_HPP

#include <concepts>

#include "fixcast/core/enums.hpp"

namespace fixcast {

template <typename R>
concept RoundingPolicy = requires {
  { R::mode } -> std::convertible_to<RoundingMode>;
  { R::saturates } -> std::convertible_to<bool>;
};

namespace rounding {

// Bit-compatible with the toolchain helper scripts that produced most
// captured data: the fraction is truncated to a step, then a
// nearest-distance comparison may step it back down. Negative values are
// folded into the magnitude range before the split. Out-of-range integer
// parts wrap (they are masked), they do not saturate.
struct Legacy {
  static constexpr RoundingMode mode = RoundingMode::Legacy;
  static constexpr bool saturates = false;
};

// The remaining policies round real * 2^binary_point to an integer code
// and clamp it to the format's range.

struct TowardZero {
  static constexpr RoundingMode mode = RoundingMode::TowardZero;
  static constexpr bool saturates = true;
};

// Floor.
struct TowardNegative {
  static constexpr RoundingMode mode = RoundingMode::TowardNegative;
  static constexpr bool saturates = true;
};

// Ceiling.
struct TowardPositive {
  static constexpr RoundingMode mode = RoundingMode::TowardPositive;
  static constexpr bool saturates = true;
};

// Round to nearest, ties to the even code.
struct ToNearestTiesToEven {
  static constexpr RoundingMode mode = RoundingMode::ToNearestTiesToEven;
  static constexpr bool saturates = true;
};

// Round to nearest, ties away from zero.
struct ToNearestTiesAway {
  static constexpr RoundingMode mode = RoundingMode::ToNearestTiesAway;
  static constexpr bool saturates = true;
};

using Default = Legacy;

static_assert(RoundingPolicy<Legacy>);
static_assert(RoundingPolicy<TowardZero>);
static_assert(RoundingPolicy<TowardNegative>);
static_assert(RoundingPolicy<TowardPositive>);
static_assert(RoundingPolicy<ToNearestTiesToEven>);
static_assert(RoundingPolicy<ToNearestTiesAway>);

} // namespace rounding
} // namespace fixcast

#endif // FIXCAST_CORE_ROUNDING_HPP
