#ifndef FIXCAST_CORE_DESCRIPTOR_HPP
#define FIXCAST_CORE_DESCRIPTOR_HPP

// FormatDescriptor: run-time description of one fixed-point layout.
//
// Holds every constant the decoder and encoder need, derived once from
// (bits, binary point, signedness, scaling). Built by makeDescriptor()
// or parsed from a toolchain type name such as "fix_8_7" or "UFix_16_10".
// Immutable after construction; share it freely across threads.

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

#include "fixcast/core/bits.hpp"
#include "fixcast/core/errors.hpp"

namespace fixcast {

class FormatDescriptor;

constexpr FormatDescriptor makeDescriptor(unsigned Bits, unsigned BinaryPoint,
                                          bool IsSigned = false,
                                          double Scaling = 1.0);

namespace detail {

constexpr double pow2(unsigned N) {
  return static_cast<double>(uint64_t{1} << N);
}

} // namespace detail

// Only makeDescriptor() can build one, so every descriptor in existence
// has passed its checks. There is no default state and no assignment.
class FormatDescriptor {
public:
  constexpr unsigned bits() const { return Bits; }
  constexpr unsigned binary_point() const { return BinaryPoint; }
  constexpr bool is_signed() const { return Signed; }
  constexpr double scaling() const { return Scaling; }

  constexpr double dec_step() const { return DecStep; }
  constexpr uint32_t dec_mask() const { return DecMask; }
  constexpr uint32_t int_mask() const { return IntMask; }
  constexpr uint32_t sign_mask() const { return SignMask; }
  constexpr double int_min() const { return IntMin; }
  constexpr double int_max() const { return IntMax; }

  constexpr unsigned byteWidth() const { return Bits / 8; }
  constexpr uint32_t wordMask() const { return lowMask(Bits); }

  // Width of the integer magnitude field.
  constexpr unsigned intBits() const {
    return Bits - BinaryPoint - (Signed ? 1 : 0);
  }

  constexpr bool operator==(const FormatDescriptor &) const = default;

private:
  friend constexpr FormatDescriptor makeDescriptor(unsigned, unsigned, bool,
                                                   double);

  constexpr FormatDescriptor(unsigned Bits, unsigned BinaryPoint, bool Signed,
                             double Scaling, uint32_t IntMask,
                             uint32_t SignMask, double IntMin, double IntMax)
      : Bits(Bits), BinaryPoint(BinaryPoint), Signed(Signed),
        Scaling(Scaling), DecStep(1.0 / detail::pow2(BinaryPoint)),
        DecMask(lowMask(BinaryPoint)), IntMask(IntMask), SignMask(SignMask),
        IntMin(IntMin), IntMax(IntMax) {}

  static constexpr FormatDescriptor makeUnsigned(unsigned Bits,
                                                 unsigned BinaryPoint,
                                                 double Scaling) {
    return FormatDescriptor(Bits, BinaryPoint, false, Scaling,
                            rangeMask(BinaryPoint, Bits), 0, 0.0,
                            detail::pow2(Bits - BinaryPoint) - 1.0);
  }

  static constexpr FormatDescriptor makeSigned(unsigned Bits,
                                               unsigned BinaryPoint,
                                               double Scaling) {
    return FormatDescriptor(Bits, BinaryPoint, true, Scaling,
                            rangeMask(BinaryPoint, Bits - 1),
                            uint32_t{1} << (Bits - 1),
                            -detail::pow2(Bits - 1 - BinaryPoint),
                            detail::pow2(Bits - 1 - BinaryPoint) - 1.0);
  }

  const unsigned Bits;        // total width: 8, 16 or 32
  const unsigned BinaryPoint; // fractional bits, < Bits
  const bool Signed;          // Fix (two's complement) or UFix
  const double Scaling;       // divisor applied after decode

  const double DecStep;    // value of the least significant bit
  const uint32_t DecMask;  // fractional bits
  const uint32_t IntMask;  // integer magnitude bits, sign bit excluded
  const uint32_t SignMask; // sign bit, 0 when unsigned
  const double IntMin;     // most negative integer part
  const double IntMax;     // largest integer magnitude
};

namespace detail {

constexpr bool isValidScaling(double Scaling) {
  // NaN fails the first comparison, infinities the last two.
  constexpr double Max = std::numeric_limits<double>::max();
  return Scaling == Scaling && Scaling != 0.0 && Scaling <= Max &&
         Scaling >= -Max;
}

constexpr char toLower(char C) {
  return (C >= 'A' && C <= 'Z') ? static_cast<char>(C - 'A' + 'a') : C;
}

constexpr bool isDigit(char C) { return C >= '0' && C <= '9'; }

// Consumes a run of decimal digits starting at Pos. Values too large for
// any width saturate so that range errors come from makeDescriptor.
constexpr bool parseDigits(std::string_view S, std::size_t &Pos,
                           unsigned &Out) {
  constexpr unsigned Saturated = 100000;
  if (Pos >= S.size() || !isDigit(S[Pos]))
    return false;
  unsigned Val = 0;
  while (Pos < S.size() && isDigit(S[Pos])) {
    if (Val < Saturated)
      Val = Val * 10 + static_cast<unsigned>(S[Pos] - '0');
    ++Pos;
  }
  Out = Val < Saturated ? Val : Saturated;
  return true;
}

} // namespace detail

// Builds the descriptor for a (bits, binary point, signedness, scaling)
// layout.
//
// Throws UnsupportedWidthError unless Bits is 8, 16 or 32,
// InvalidBinaryPointError unless BinaryPoint < Bits, and
// InvalidScalingError for a zero or non-finite Scaling.
constexpr FormatDescriptor makeDescriptor(unsigned Bits, unsigned BinaryPoint,
                                          bool IsSigned, double Scaling) {
  if (!isSupportedWidth(Bits))
    throw UnsupportedWidthError(Bits);
  if (BinaryPoint >= Bits)
    throw InvalidBinaryPointError(Bits, BinaryPoint);
  if (!detail::isValidScaling(Scaling))
    throw InvalidScalingError(Scaling);
  return IsSigned
             ? FormatDescriptor::makeSigned(Bits, BinaryPoint, Scaling)
             : FormatDescriptor::makeUnsigned(Bits, BinaryPoint, Scaling);
}

// Parses a toolchain fixed-point type name.
//
// Grammar (case-insensitive, anchored at the start): (u?fix)_<bits>_<point>.
// Anything after the last digit of <point> is ignored, so "Fix_16_15_sat"
// reads as fix_16_15. Throws NameParseError when the prefix does not
// match; range errors propagate from makeDescriptor().
constexpr FormatDescriptor parseFormatName(std::string_view Name) {
  std::size_t Pos = 0;
  bool IsSigned = true;
  if (!Name.empty() && detail::toLower(Name[0]) == 'u') {
    IsSigned = false;
    ++Pos;
  }

  constexpr std::string_view Fix = "fix_";
  if (Name.size() - Pos < Fix.size())
    throw NameParseError(std::string(Name));
  for (char C : Fix) {
    if (detail::toLower(Name[Pos++]) != C)
      throw NameParseError(std::string(Name));
  }

  unsigned Bits = 0;
  unsigned BinaryPoint = 0;
  if (!detail::parseDigits(Name, Pos, Bits))
    throw NameParseError(std::string(Name));
  if (Pos >= Name.size() || Name[Pos] != '_')
    throw NameParseError(std::string(Name));
  ++Pos;
  if (!detail::parseDigits(Name, Pos, BinaryPoint))
    throw NameParseError(std::string(Name));

  return makeDescriptor(Bits, BinaryPoint, IsSigned);
}

// Canonical lower-case name of a descriptor's layout. Scaling is not
// part of the name.
inline std::string formatName(const FormatDescriptor &Fmt) {
  return std::string(Fmt.is_signed() ? "fix_" : "ufix_") +
         std::to_string(Fmt.bits()) + "_" + std::to_string(Fmt.binary_point());
}

} // namespace fixcast

#endif // FIXCAST_CORE_DESCRIPTOR_HPP
