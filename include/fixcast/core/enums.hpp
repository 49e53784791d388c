#ifndef FIXCAST_CORE_ENUMS_HPP
#define FIXCAST_CORE_ENUMS_HPP

namespace fixcast {

// Byte order of a word inside a caller-supplied buffer.
enum class ByteOrder {
  Native, // whatever std::endian::native is on this host
  Little,
  Big
};

enum class RoundingMode {
  Legacy,             // toolchain-compatible truncation with nearest check
  TowardZero,
  TowardNegative,
  TowardPositive,
  ToNearestTiesToEven,
  ToNearestTiesAway
};

enum class ErrorKind {
  UnsupportedWidth,   // bits not in {8, 16, 32}
  InvalidBinaryPoint, // binary point >= bits
  InvalidScaling,     // scaling is zero or not finite
  NameParse,          // type name does not match (u)fix_<bits>_<point>
  Sign,               // negative value into an unsigned format
  NotFinite,          // NaN or infinity passed to an encoder
  Format              // buffer length does not fit the word width
};

inline const char *errorKindName(ErrorKind K) {
  switch (K) {
  case ErrorKind::UnsupportedWidth:   return "unsupported width";
  case ErrorKind::InvalidBinaryPoint: return "invalid binary point";
  case ErrorKind::InvalidScaling:     return "invalid scaling";
  case ErrorKind::NameParse:          return "name parse error";
  case ErrorKind::Sign:               return "sign error";
  case ErrorKind::NotFinite:          return "value not finite";
  case ErrorKind::Format:             return "format error";
  }
  return "???";
}

} // namespace fixcast

#endif // FIXCAST_CORE_ENUMS_HPP
