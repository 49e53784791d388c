// Encoder: legacy toolchain behaviour, saturating policies, buffers.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <vector>

#include "fixcast/fixcast.hpp"

using namespace fixcast;

TEST_CASE("encodeValue: 8-bit toolchain examples all give 0b10000001") {
  CHECK(encodeValue(-0.9921875, makeDescriptor(8, 7, true)) == 129);
  CHECK(encodeValue(-3.96875, makeDescriptor(8, 5, true)) == 129);
  CHECK(encodeValue(-127.0, makeDescriptor(8, 0, true)) == 129);
  CHECK(encodeValue(1.0078125, makeDescriptor(8, 7, false)) == 129);
  CHECK(encodeValue(4.03125, makeDescriptor(8, 5, false)) == 129);
  CHECK(encodeValue(129.0, makeDescriptor(8, 0, false)) == 129);
}

TEST_CASE("encodeValue: negative values into unsigned layouts") {
  FormatDescriptor Fmt = makeDescriptor(16, 4);
  CHECK_THROWS_AS(encodeValue(-0.5, Fmt), SignError);
  CHECK_THROWS_AS(encodeValue(-1e-300, Fmt), SignError);
  CHECK_THROWS_AS(encodeValue(-HUGE_VAL, Fmt), SignError);
  CHECK_THROWS_AS(encodeValue<rounding::ToNearestTiesToEven>(-0.01, Fmt),
                  SignError);
  CHECK(encodeValue(-0.0, Fmt) == 0);
  try {
    encodeValue(-3.0, makeDescriptor(8, 0));
    FAIL("expected SignError");
  } catch (const ConversionError &E) {
    CHECK(E.kind() == ErrorKind::Sign);
  }
}

TEST_CASE("encodeValue: NaN and infinity are rejected") {
  const double NaN = std::numeric_limits<double>::quiet_NaN();
  CHECK_THROWS_AS(encodeValue(NaN, makeDescriptor(8, 7, true)),
                  NotFiniteError);
  CHECK_THROWS_AS(encodeValue(NaN, makeDescriptor(8, 7, false)),
                  NotFiniteError);
  CHECK_THROWS_AS(encodeValue(HUGE_VAL, makeDescriptor(32, 0, true)),
                  NotFiniteError);
  CHECK_THROWS_AS(encodeValue(-HUGE_VAL, makeDescriptor(32, 0, true)),
                  NotFiniteError);
  CHECK_THROWS_AS(
      encodeValue<rounding::TowardZero>(HUGE_VAL, makeDescriptor(16, 0)),
      NotFiniteError);
}

TEST_CASE("encodeValue: legacy truncates the fraction to a step") {
  CHECK(encodeValue(1.99, makeDescriptor(8, 4)) == 0x1F);
  CHECK(encodeValue(0.03, makeDescriptor(8, 7, true)) == 3);
  // -0.03 folds to 0.97, 124 steps: -1 + 124/128 = -0.03125.
  CHECK(encodeValue(-0.03, makeDescriptor(8, 7, true)) == 0x80 + 124);
  // Exactly half a step still rounds down.
  CHECK(encodeValue(2.5 / 128, makeDescriptor(8, 7, true)) == 2);
  CHECK(encodeValue(0.5, makeDescriptor(8, 0)) == 0);
}

TEST_CASE("encodeValue: legacy wraps out-of-range integer parts") {
  // ufix_8_4 holds 0..15.9375; 16.5 keeps only the low four integer bits.
  CHECK(encodeValue(16.5, makeDescriptor(8, 4)) == 0x08);
  // fix_8_4 has three integer bits: 9.25 -> 1.25.
  CHECK(encodeValue(9.25, makeDescriptor(8, 4, true)) == 0x14);
  // Below int_min the folded value stays negative and the step-back
  // check fires, landing on the largest positive code.
  CHECK(encodeValue(-2.0, makeDescriptor(8, 7, true)) == 0x7F);
  CHECK(encodeValue(1e300, makeDescriptor(32, 0)) ==
        static_cast<uint32_t>(std::fmod(1e300, 4294967296.0)));
}

TEST_CASE("encodeValue: result always fits the word") {
  const double Reals[] = {0.0,   1e-12, 0.3,   1.0,   127.9,  128.0,  255.5,
                          1e5,   3e9,   7e12,  1e300, -1e-12, -0.3,   -1.0,
                          -128.5, -1e5, -3e9,  -7e12, -1e300};
  for (unsigned Bits : {8u, 16u, 32u}) {
    for (unsigned Point = 0; Point < Bits; Point += 3) {
      FormatDescriptor Fmt = makeDescriptor(Bits, Point, true);
      for (double X : Reals) {
        CAPTURE(formatName(Fmt));
        CAPTURE(X);
        CHECK(encodeValue(X, Fmt) <= Fmt.wordMask());
        CHECK(encodeValue<rounding::ToNearestTiesAway>(X, Fmt) <=
              Fmt.wordMask());
      }
    }
  }
}

TEST_CASE("encodeValue: every 8-bit code survives a round trip") {
  for (unsigned Point = 0; Point < 8; ++Point) {
    for (bool Signed : {false, true}) {
      FormatDescriptor Fmt = makeDescriptor(8, Point, Signed);
      CAPTURE(formatName(Fmt));
      for (uint32_t Raw = 0; Raw < 256; ++Raw) {
        double Real = decodeValue(Raw, Fmt);
        CHECK(encodeValue(Real, Fmt) == Raw);
        CHECK(encodeValue<rounding::ToNearestTiesToEven>(Real, Fmt) == Raw);
        CHECK(encodeValue<rounding::TowardZero>(Real, Fmt) == Raw);
      }
    }
  }
}

TEST_CASE("encodeValue: 16- and 32-bit boundary codes survive a round trip") {
  for (unsigned Bits : {16u, 32u}) {
    for (unsigned Point = 0; Point < Bits; ++Point) {
      for (bool Signed : {false, true}) {
        FormatDescriptor Fmt = makeDescriptor(Bits, Point, Signed);
        const uint32_t Half = Fmt.dec_mask() == 0 ? 0 : (Fmt.dec_mask() >> 1) + 1;
        for (uint32_t Raw :
             {uint32_t{0}, uint32_t{1}, Fmt.dec_mask(), Half, Fmt.int_mask(),
              Fmt.int_mask() | Fmt.dec_mask(), Fmt.sign_mask(),
              Fmt.sign_mask() | 1u, Fmt.sign_mask() | Half, Fmt.wordMask()}) {
          CAPTURE(formatName(Fmt));
          CAPTURE(Raw);
          CHECK(encodeValue(decodeValue(Raw, Fmt), Fmt) == Raw);
        }
      }
    }
  }
}

TEST_CASE("encodeValue: saturating policies round real * 2^point") {
  FormatDescriptor Fmt = makeDescriptor(8, 7, true);
  // -0.03 * 128 = -3.84
  CHECK(encodeValue<rounding::TowardZero>(-0.03, Fmt) == 256 - 3);
  CHECK(encodeValue<rounding::TowardNegative>(-0.03, Fmt) == 256 - 4);
  CHECK(encodeValue<rounding::TowardPositive>(-0.03, Fmt) == 256 - 3);
  CHECK(encodeValue<rounding::ToNearestTiesToEven>(-0.03, Fmt) == 256 - 4);
  CHECK(encodeValue<rounding::ToNearestTiesAway>(-0.03, Fmt) == 256 - 4);

  // Ties: 2.5 and 3.5 steps.
  CHECK(encodeValue<rounding::ToNearestTiesToEven>(2.5 / 128, Fmt) == 2);
  CHECK(encodeValue<rounding::ToNearestTiesAway>(2.5 / 128, Fmt) == 3);
  CHECK(encodeValue<rounding::ToNearestTiesToEven>(3.5 / 128, Fmt) == 4);
  CHECK(encodeValue<rounding::ToNearestTiesAway>(3.5 / 128, Fmt) == 4);
  CHECK(encodeValue<rounding::ToNearestTiesToEven>(-2.5 / 128, Fmt) ==
        256 - 2);
  CHECK(encodeValue<rounding::ToNearestTiesAway>(-2.5 / 128, Fmt) == 256 - 3);
  CHECK(encodeValue<rounding::TowardPositive>(0.1 / 128, Fmt) == 1);
}

TEST_CASE("encodeValue: saturating policies clamp to the range") {
  FormatDescriptor Q7 = makeDescriptor(8, 7, true);
  CHECK(encodeValue<rounding::ToNearestTiesToEven>(1.5, Q7) == 0x7F);
  CHECK(encodeValue<rounding::ToNearestTiesToEven>(-3.0, Q7) == 0x80);
  CHECK(encodeValue<rounding::TowardZero>(1e300, Q7) == 0x7F);
  CHECK(encodeValue<rounding::ToNearestTiesToEven>(1.0, Q7) == 0x7F);

  FormatDescriptor U8 = makeDescriptor(8, 0);
  CHECK(encodeValue<rounding::ToNearestTiesAway>(300.0, U8) == 0xFF);
  CHECK(encodeValue<rounding::ToNearestTiesAway>(255.4, U8) == 0xFF);

  FormatDescriptor S32 = makeDescriptor(32, 0, true);
  CHECK(encodeValue<rounding::TowardNegative>(-3e9, S32) == 0x80000000);
  CHECK(encodeValue<rounding::TowardPositive>(3e9, S32) == 0x7FFFFFFF);
}

TEST_CASE("encodeValue: scaling is not applied on encode") {
  FormatDescriptor Fmt = makeDescriptor(16, 8, true, 4.0);
  double Decoded = decodeValue(0x0100, Fmt);
  CHECK(Decoded == 0.25);
  CHECK(encodeValue(Decoded, Fmt) == 0x0040);
  CHECK(encodeValue(Decoded * Fmt.scaling(), Fmt) == 0x0100);
}

TEST_CASE("encodeBuffer: one word in the requested byte order") {
  FormatDescriptor Fmt = makeDescriptor(16, 8, true);
  std::byte Out[2];
  encodeBuffer(-0.5, Fmt, Out, ByteOrder::Big);
  CHECK(Out[0] == std::byte{0xFF});
  CHECK(Out[1] == std::byte{0x80});
  encodeBuffer(-0.5, Fmt, Out, ByteOrder::Little);
  CHECK(Out[0] == std::byte{0x80});
  CHECK(Out[1] == std::byte{0xFF});
  CHECK(decodeBuffer(Out, Fmt, ByteOrder::Little) == -0.5);

  encodeBuffer(-0.5, Fmt, Out);
  CHECK(decodeBuffer(Out, Fmt) == -0.5);

  std::byte Wide[4];
  encodeBuffer<rounding::ToNearestTiesToEven>(1.0 / 3, makeDescriptor(32, 30),
                                              Wide, ByteOrder::Big);
  CHECK(Wide[0] == std::byte{0x15});
  CHECK(Wide[3] == std::byte{0x55});

  std::byte Short[1];
  CHECK_THROWS_AS(encodeBuffer(0.5, Fmt, Short), FormatError);
  CHECK_THROWS_AS(encodeBuffer(0.5, Fmt, Wide), FormatError);
}

TEST_CASE("encodeSequence: packs words in order and decodes back") {
  FormatDescriptor Fmt = makeDescriptor(16, 15, true);
  std::vector<double> Vals = {-1.0, 0.5, 0.0, -0.5};
  std::vector<std::byte> Bytes = encodeSequence(Vals, Fmt, ByteOrder::Big);
  REQUIRE(Bytes.size() == 8);
  CHECK(Bytes[0] == std::byte{0x80});
  CHECK(Bytes[1] == std::byte{0x00});
  CHECK(Bytes[2] == std::byte{0x40});
  CHECK(Bytes[6] == std::byte{0xC0});
  CHECK(decodeSequence(Bytes, Fmt, ByteOrder::Big) == Vals);

  std::vector<std::byte> Little = encodeSequence(Vals, Fmt, ByteOrder::Little);
  CHECK(Little[0] == std::byte{0x00});
  CHECK(Little[1] == std::byte{0x80});
  CHECK(decodeSequence(Little, Fmt, ByteOrder::Little) == Vals);

  CHECK(encodeSequence(std::span<const double>(), Fmt).empty());
}

TEST_CASE("encodeSequence: one bad value fails the whole sequence") {
  FormatDescriptor Fmt = makeDescriptor(8, 4);
  std::vector<double> Vals = {1.0, 2.0, -1.0, 3.0};
  CHECK_THROWS_AS(encodeSequence(Vals, Fmt), SignError);
}

TEST_CASE("Fixed: compile-time layouts use the same engine") {
  CHECK(q15::encode(-1.0) == 0x8000);
  CHECK(q15::encode(0.5) == 0x4000);
  CHECK(q7::encode(-0.9921875) == 0x81);
  CHECK(q31::encode(-0.5) == 0xC0000000u);
  CHECK(uq1_7::encode(1.5) == 0xC0);
  CHECK_THROWS_AS(uq1_15::encode(-0.25), SignError);

  // Legacy truncates, the nearest variant rounds.
  CHECK(q15::encode(0.9 / 32768) == 0);
  CHECK(NearestFixed<q15_layout>::encode(0.9 / 32768) == 1);

  CHECK(q15::encode(0.3) == encodeValue(0.3, parseFormatName("fix_16_15")));
}
