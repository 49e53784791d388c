#ifndef FIXCAST_CORE_ERRORS_HPP
#define FIXCAST_CORE_ERRORS_HPP

// Every failure in fixcast is a caller-input error: a bad format
// parameter, a bad name, a value the format cannot hold or a buffer of
// the wrong size. They are thrown immediately; nothing is retried and no
// partial result is returned.

#include <cstddef>
#include <stdexcept>
#include <string>

#include "fixcast/core/enums.hpp"

namespace fixcast {

class ConversionError : public std::invalid_argument {
public:
  ConversionError(ErrorKind K, const std::string &What)
      : std::invalid_argument(std::string(errorKindName(K)) + ": " + What),
        Kind(K) {}

  ErrorKind kind() const noexcept { return Kind; }

private:
  ErrorKind Kind;
};

class UnsupportedWidthError : public ConversionError {
public:
  explicit UnsupportedWidthError(unsigned Bits)
      : ConversionError(ErrorKind::UnsupportedWidth,
                        "number of bits not supported: " +
                            std::to_string(Bits)) {}
};

class InvalidBinaryPointError : public ConversionError {
public:
  InvalidBinaryPointError(unsigned Bits, unsigned BinaryPoint)
      : ConversionError(ErrorKind::InvalidBinaryPoint,
                        "binary point " + std::to_string(BinaryPoint) +
                            " does not fit in " + std::to_string(Bits) +
                            " bits") {}
};

class InvalidScalingError : public ConversionError {
public:
  explicit InvalidScalingError(double Scaling)
      : ConversionError(ErrorKind::InvalidScaling,
                        "scaling must be finite and non-zero, got " +
                            std::to_string(Scaling)) {}
};

class NameParseError : public ConversionError {
public:
  explicit NameParseError(const std::string &Name)
      : ConversionError(ErrorKind::NameParse,
                        "cannot interpret name: " + Name) {}
};

class SignError : public ConversionError {
public:
  explicit SignError(double Real)
      : ConversionError(ErrorKind::Sign,
                        "cannot convert " + std::to_string(Real) +
                            " to unsigned representation") {}
};

class NotFiniteError : public ConversionError {
public:
  NotFiniteError()
      : ConversionError(ErrorKind::NotFinite,
                        "cannot convert NaN or infinity to fixed point") {}
};

class FormatError : public ConversionError {
public:
  FormatError(std::size_t Length, unsigned WordBytes)
      : ConversionError(ErrorKind::Format,
                        "buffer of " + std::to_string(Length) +
                            " bytes does not match " +
                            std::to_string(WordBytes) + "-byte words") {}
};

} // namespace fixcast

#endif // FIXCAST_CORE_ERRORS_HPP
