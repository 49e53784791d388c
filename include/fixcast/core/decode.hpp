#ifndef FIXCAST_CORE_DECODE_HPP
#define FIXCAST_CORE_DECODE_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "fixcast/core/byte_order.hpp"
#include "fixcast/core/descriptor.hpp"
#include "fixcast/core/errors.hpp"

namespace fixcast {

// Raw code -> real value.
//
// integer part  = (Raw & int_mask) >> binary_point
// fraction      = dec_step * (Raw & dec_mask)
// signed and sign bit set: int_min + integer part + fraction
//
// The result is divided by Fmt.scaling(). Bits of Raw above Fmt.bits() are
// ignored except through the masks, so callers should pass codes that fit
// the word. Every step is exact in double precision for widths up to 32.
constexpr double decodeValue(uint32_t Raw, const FormatDescriptor &Fmt) {
  double IntVal = static_cast<double>((Raw & Fmt.int_mask()) >> Fmt.binary_point());
  double DecVal = Fmt.dec_step() * static_cast<double>(Raw & Fmt.dec_mask());
  double Res;
  if (Fmt.is_signed() && (Raw & Fmt.sign_mask()) != 0)
    Res = Fmt.int_min() + IntVal + DecVal;
  else
    Res = IntVal + DecVal;
  return Res / Fmt.scaling();
}

// Decodes the single word held in Bytes. Throws FormatError unless Bytes
// is exactly one word long.
inline double decodeBuffer(std::span<const std::byte> Bytes,
                           const FormatDescriptor &Fmt,
                           ByteOrder Order = ByteOrder::Native) {
  if (Bytes.size() != Fmt.byteWidth())
    throw FormatError(Bytes.size(), Fmt.byteWidth());
  return decodeValue(loadWord(Bytes, Fmt.byteWidth(), Order), Fmt);
}

// Decodes a packed run of words, in buffer order. Throws FormatError when
// the length is not a whole number of words.
inline std::vector<double> decodeSequence(std::span<const std::byte> Bytes,
                                          const FormatDescriptor &Fmt,
                                          ByteOrder Order = ByteOrder::Native) {
  const unsigned Width = Fmt.byteWidth();
  if (Bytes.size() % Width != 0)
    throw FormatError(Bytes.size(), Width);

  std::vector<double> Values;
  Values.reserve(Bytes.size() / Width);
  for (std::size_t Off = 0; Off < Bytes.size(); Off += Width)
    Values.push_back(
        decodeValue(loadWord(Bytes.subspan(Off, Width), Width, Order), Fmt));
  return Values;
}

} // namespace fixcast

#endif // FIXCAST_CORE_DECODE_HPP
