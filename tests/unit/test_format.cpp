// FormatSpec construction, accessors and the plain-data round trip.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <string>

#include "fixq/fixq.hpp"

using namespace fixq;

TEST_CASE("defaults") {
  FormatSpec S = makeSpec(3, 4);
  CHECK(S.integerBits() == 3);
  CHECK(S.fractionalBits() == 4);
  CHECK(S.isSigned());
  CHECK(S.rounding() == RoundingMode::Trunc);
  CHECK(S.overflow() == OverflowMode::Wrap);
  CHECK(S.totalBits() == 7);
  CHECK(S.scale() == 16.0);
  CHECK(S.resolution() == 0.0625);
}

TEST_CASE("bit counts are validated at construction") {
  CHECK_THROWS_AS(makeSpec(0, 0), InvalidSpecError);
  CHECK_THROWS_AS(makeSpec(-1, 4), InvalidSpecError);
  CHECK_THROWS_AS(makeSpec(4, -1), InvalidSpecError);
  CHECK_THROWS_AS(makeSpec(40, 14), InvalidSpecError);
  CHECK_THROWS_AS(FormatSpec(0, 0), InvalidSpecError);
  CHECK_NOTHROW(makeSpec(1, 0));
  CHECK_NOTHROW(makeSpec(0, 1));
  CHECK_NOTHROW(makeSpec(53, 0, false));
  CHECK_NOTHROW(makeSpec(0, 53));

  try {
    makeSpec(0, 0);
    FAIL("expected an InvalidSpecError");
  } catch (const Error &E) {
    CHECK(E.status() == Status::InvalidSpec);
    CHECK(std::string(E.what()).find("Q0.0") != std::string::npos);
  }
}

TEST_CASE("mode codes are validated at construction") {
  CHECK_THROWS_AS(makeSpec(8, 0, true, 20, 0), InvalidRoundingModeError);
  CHECK_THROWS_AS(makeSpec(8, 0, true, 0, 3), InvalidOverflowModeError);
  CHECK_THROWS_AS(FormatSpec(8, 0, true, static_cast<RoundingMode>(20)),
                  InvalidRoundingModeError);
  CHECK_THROWS_AS(FormatSpec(8, 0, true, RoundingMode::Trunc,
                             static_cast<OverflowMode>(-1)),
                  InvalidOverflowModeError);
}

// integer_bits counts the sign bit: test both ends of both kinds.
TEST_CASE("range boundaries") {
  SUBCASE("Q8.0 signed") {
    FormatSpec S = makeSpec(8, 0);
    CHECK(S.lower() == -128);
    CHECK(S.upper() == 127);
    CHECK(S.minValue() == -128.0);
    CHECK(S.maxValue() == 127.0);
  }
  SUBCASE("Q8.0 unsigned") {
    FormatSpec S = makeSpec(8, 0, false);
    CHECK(S.lower() == 0);
    CHECK(S.upper() == 255);
  }
  SUBCASE("Q1.7 signed") {
    FormatSpec S = makeSpec(1, 7);
    CHECK(S.minValue() == -1.0);
    CHECK(S.maxValue() == 127.0 / 128.0);
  }
  SUBCASE("Q3.4 signed") {
    FormatSpec S = makeSpec(3, 4);
    CHECK(S.minValue() == -4.0);
    CHECK(S.maxValue() == 3.9375);
  }
  SUBCASE("Q0.8 unsigned") {
    FormatSpec S = makeSpec(0, 8, false);
    CHECK(S.minValue() == 0.0);
    CHECK(S.maxValue() == 255.0 / 256.0);
  }
  SUBCASE("Q0.4 signed has no integer magnitude") {
    FormatSpec S = makeSpec(0, 4);
    CHECK(S.minValue() == -0.5);
    CHECK(S.maxValue() == 0.4375);
  }
}

TEST_CASE("codes round trip") {
  for (RoundingMode R : AllRoundingModes) {
    for (OverflowMode O : AllOverflowModes) {
      FormatSpec S(5, 3, false, R, O);
      SpecCodes C = toCodes(S);
      CHECK(C.Rounding == toCode(R));
      CHECK(C.Overflow == toCode(O));
      CHECK(fromCodes(C) == S);
    }
  }
  CHECK_THROWS_AS(fromCodes(SpecCodes{8, 0, true, 9, 0}),
                  InvalidRoundingModeError);
  CHECK_THROWS_AS(fromCodes(SpecCodes{0, 0, true, 0, 0}), InvalidSpecError);
}

TEST_CASE("equality covers every field") {
  FormatSpec A = makeSpec(8, 8);
  CHECK(A == makeSpec(8, 8, true, RoundingMode::Trunc, OverflowMode::Wrap));
  CHECK_FALSE(A == makeSpec(8, 8, false));
  CHECK_FALSE(A == makeSpec(8, 8, true, RoundingMode::Ceil));
  CHECK_FALSE(A == makeSpec(8, 8, true, RoundingMode::Trunc, OverflowMode::Sat));
  CHECK_FALSE(A == makeSpec(9, 7));
}

TEST_CASE("describe") {
  CHECK(makeSpec(3, 4).describe() == "Q3.4 signed TRUNC WRAP");
  CHECK(makeSpec(8, 0, false, RoundingMode::HalfEven, OverflowMode::Error)
            .describe() == "Q8.0 unsigned HALF_EVEN ERROR");
  CHECK(SaturatingQ<1, 15>::spec().describe() == "Q1.15 signed HALF_EVEN SAT");
}

TEST_CASE("status names") {
  CHECK(std::string(statusName(Status::Overflow)) == "Overflow");
  CHECK(std::string(statusName(Status::UnsupportedInputType)) ==
        "UnsupportedInputType");
}
