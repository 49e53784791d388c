#ifndef FIXCAST_CORE_ENCODE_HPP
#define FIXCAST_CORE_ENCODE_HPP

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "fixcast/core/byte_order.hpp"
#include "fixcast/core/descriptor.hpp"
#include "fixcast/core/errors.hpp"
#include "fixcast/core/rounding.hpp"

namespace fixcast {

namespace detail {

inline uint32_t encodeLegacy(double Real, const FormatDescriptor &Fmt) {
  // Fold the negative range onto magnitudes: -0.25 in fix_8_7 becomes
  // 0.75, and the sign bit is added back at the end.
  bool Negative = Real < 0;
  if (Negative)
    Real = Real - Fmt.int_min();

  double Mag = std::fabs(Real);
  double IntPart = std::floor(Mag);
  double Frac = Mag - IntPart;

  // Same as masking with (int_mask >> binary_point), without converting
  // an arbitrarily large double to an integer first.
  uint64_t IntVal =
      static_cast<uint64_t>(std::fmod(IntPart, pow2(Fmt.intBits())));

  int64_t Dec = static_cast<int64_t>(std::floor(Frac / Fmt.dec_step()));
  if (Dec > static_cast<int64_t>(Fmt.dec_mask()))
    Dec = Fmt.dec_mask();

  double Val =
      static_cast<double>(IntVal) + static_cast<double>(Dec) * Fmt.dec_step();
  if ((Val - Real) > (Real - Val + Fmt.dec_step()))
    --Dec;

  int64_t Code =
      static_cast<int64_t>((IntVal << Fmt.binary_point()) & Fmt.int_mask()) + Dec;
  if (Negative)
    Code += Fmt.sign_mask();
  return static_cast<uint32_t>(Code) & Fmt.wordMask();
}

inline double roundTiesToEven(double X) {
  double F = std::floor(X);
  double D = X - F;
  if (D > 0.5 || (D == 0.5 && std::fmod(F, 2.0) != 0.0))
    return F + 1.0;
  return F;
}

inline double roundScaled(double Scaled, RoundingMode Mode) {
  switch (Mode) {
  case RoundingMode::TowardZero:          return std::trunc(Scaled);
  case RoundingMode::TowardNegative:      return std::floor(Scaled);
  case RoundingMode::TowardPositive:      return std::ceil(Scaled);
  case RoundingMode::ToNearestTiesAway:   return std::round(Scaled);
  case RoundingMode::ToNearestTiesToEven: return roundTiesToEven(Scaled);
  case RoundingMode::Legacy:              break;
  }
  return std::floor(Scaled);
}

inline uint32_t encodeSaturating(double Real, const FormatDescriptor &Fmt,
                                 RoundingMode Mode) {
  double Q = roundScaled(std::ldexp(Real, static_cast<int>(Fmt.binary_point())),
                         Mode);
  double Lo = Fmt.is_signed() ? -pow2(Fmt.bits() - 1) : 0.0;
  double Hi = Fmt.is_signed() ? pow2(Fmt.bits() - 1) - 1.0 : pow2(Fmt.bits()) - 1.0;
  Q = std::clamp(Q, Lo, Hi);
  return static_cast<uint32_t>(static_cast<int64_t>(Q)) & Fmt.wordMask();
}

} // namespace detail

// Real value -> raw code, rounded by Rnd.
//
// The default policy reproduces the toolchain scripts bit for bit:
// negative values are folded by subtracting int_min, the integer part
// wraps to the integer field width, and the fraction is quantized down
// to dec_step (saturating at dec_mask) before a nearest-distance check
// that may step it back. See rounding.hpp for the saturating policies.
//
// Fmt.scaling() is NOT applied here, although decodeValue() divides by it.
// For a scaled format, encodeValue(decodeValue(Raw)) only returns Raw
// when the caller multiplies the decoded value by scaling first.
//
// Throws SignError for a negative Real in an unsigned format and
// NotFiniteError for NaN or infinity.
template <RoundingPolicy Rnd = rounding::Default>
uint32_t encodeValue(double Real, const FormatDescriptor &Fmt) {
  if (!Fmt.is_signed() && Real < 0)
    throw SignError(Real);
  if (!std::isfinite(Real))
    throw NotFiniteError();
  if constexpr (Rnd::mode == RoundingMode::Legacy)
    return detail::encodeLegacy(Real, Fmt);
  else
    return detail::encodeSaturating(Real, Fmt, Rnd::mode);
}

// Encodes Real into Out, which must be exactly one word long.
template <RoundingPolicy Rnd = rounding::Default>
void encodeBuffer(double Real, const FormatDescriptor &Fmt,
                  std::span<std::byte> Out,
                  ByteOrder Order = ByteOrder::Native) {
  if (Out.size() != Fmt.byteWidth())
    throw FormatError(Out.size(), Fmt.byteWidth());
  storeWord(Out, Fmt.byteWidth(), Order, encodeValue<Rnd>(Real, Fmt));
}

// Packs Values into consecutive words, in order. Nothing is returned if
// any value fails to encode.
template <RoundingPolicy Rnd = rounding::Default>
std::vector<std::byte> encodeSequence(std::span<const double> Values,
                                      const FormatDescriptor &Fmt,
                                      ByteOrder Order = ByteOrder::Native) {
  const unsigned Width = Fmt.byteWidth();
  std::vector<std::byte> Bytes(Values.size() * Width);
  std::span<std::byte> Out(Bytes);
  for (std::size_t I = 0; I < Values.size(); ++I)
    storeWord(Out.subspan(I * Width, Width), Width, Order,
              encodeValue<Rnd>(Values[I], Fmt));
  return Bytes;
}

} // namespace fixcast

#endif // FIXCAST_CORE_ENCODE_HPP
