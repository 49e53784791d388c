#ifndef FIXCAST_CORE_BYTE_ORDER_HPP
#define FIXCAST_CORE_BYTE_ORDER_HPP

// Loading and storing one 1, 2 or 4 byte word at a given byte order.
// Callers check the buffer length; these helpers read or write exactly
// Width bytes starting at the span's first element.

#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>

#include "fixcast/core/enums.hpp"

namespace fixcast {

constexpr bool isLittleEndian(ByteOrder Order) {
  if (Order == ByteOrder::Native)
    return std::endian::native == std::endian::little;
  return Order == ByteOrder::Little;
}

inline uint32_t loadWord(std::span<const std::byte> Bytes, unsigned Width,
                         ByteOrder Order) {
  uint32_t Val = 0;
  if (isLittleEndian(Order)) {
    for (unsigned I = Width; I-- > 0;)
      Val = (Val << 8) | std::to_integer<uint32_t>(Bytes[I]);
  } else {
    for (unsigned I = 0; I < Width; ++I)
      Val = (Val << 8) | std::to_integer<uint32_t>(Bytes[I]);
  }
  return Val;
}

inline void storeWord(std::span<std::byte> Bytes, unsigned Width,
                      ByteOrder Order, uint32_t Val) {
  for (unsigned I = 0; I < Width; ++I) {
    unsigned Slot = isLittleEndian(Order) ? I : Width - 1 - I;
    Bytes[Slot] = static_cast<std::byte>(Val & 0xFF);
    Val >>= 8;
  }
}

} // namespace fixcast

#endif // FIXCAST_CORE_BYTE_ORDER_HPP
