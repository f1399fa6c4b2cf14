#ifndef FIXQ_CORE_FORMAT_HPP
#define FIXQ_CORE_FORMAT_HPP

#include <concepts>
#include <cstdint>
#include <cstdio>
#include <string>

#include "fixq/core/enums.hpp"
#include "fixq/core/exceptions.hpp"

namespace fixq {

// Widest lattice whose every point k / 2^f is an exact double.
inline constexpr int MaxTotalBits = 53;

// Lattice bounds for a total width. integer_bits counts the sign bit
// when signed (ARM Q-format), so Q1.15 spans [-1, 1 - 2^-15].
struct Range {
  std::int64_t Lower;
  std::int64_t Upper;

  static constexpr Range of(bool Signed, int TotalBits) {
    if (Signed)
      return {-(std::int64_t{1} << (TotalBits - 1)),
              (std::int64_t{1} << (TotalBits - 1)) - 1};
    return {0, (std::int64_t{1} << TotalBits) - 1};
  }

  constexpr bool contains(std::int64_t K) const {
    return K >= Lower && K <= Upper;
  }

  constexpr bool operator==(const Range &) const = default;
};

[[noreturn]] inline void throwInvalidSpec(int IntegerBits, int FractionalBits) {
  char Msg[128];
  std::snprintf(Msg, sizeof(Msg),
                "invalid format Q%d.%d: bit counts must be non-negative and "
                "total between 1 and %d",
                IntegerBits, FractionalBits, MaxTotalBits);
  throw InvalidSpecError(Msg);
}

// ===================================================================
// FormatSpec: runtime description of one fixed-point format
// ===================================================================
//
// Immutable once constructed; copy it freely. Construction is the only
// place bit counts are validated.
class FormatSpec {
public:
  constexpr FormatSpec(int IntegerBits, int FractionalBits, bool Signed = true,
                       RoundingMode Rnd = RoundingMode::Trunc,
                       OverflowMode Ovf = OverflowMode::Wrap)
      : IntBits(IntegerBits), FracBits(FractionalBits), IsSigned(Signed),
        Rounding(Rnd), Overflow(Ovf) {
    if (IntegerBits < 0 || FractionalBits < 0 ||
        IntegerBits + FractionalBits < 1 ||
        IntegerBits + FractionalBits > MaxTotalBits)
      throwInvalidSpec(IntegerBits, FractionalBits);
    if (!isValidRoundingCode(toCode(Rnd)))
      throwInvalidRoundingCode(toCode(Rnd));
    if (!isValidOverflowCode(toCode(Ovf)))
      throwInvalidOverflowCode(toCode(Ovf));
  }

  constexpr int integerBits() const { return IntBits; }
  constexpr int fractionalBits() const { return FracBits; }
  constexpr bool isSigned() const { return IsSigned; }
  constexpr RoundingMode rounding() const { return Rounding; }
  constexpr OverflowMode overflow() const { return Overflow; }

  constexpr int totalBits() const { return IntBits + FracBits; }

  // 2^fractional_bits: multiply to land on the integer lattice.
  constexpr double scale() const {
    return static_cast<double>(std::int64_t{1} << FracBits);
  }

  // Weight of one LSB, 2^-fractional_bits.
  constexpr double resolution() const { return 1.0 / scale(); }

  constexpr Range range() const { return Range::of(IsSigned, totalBits()); }
  constexpr std::int64_t lower() const { return range().Lower; }
  constexpr std::int64_t upper() const { return range().Upper; }

  constexpr double minValue() const {
    return static_cast<double>(lower()) / scale();
  }
  constexpr double maxValue() const {
    return static_cast<double>(upper()) / scale();
  }

  // "Q3.4 signed TRUNC WRAP"
  std::string describe() const {
    char Buf[96];
    std::snprintf(Buf, sizeof(Buf), "Q%d.%d %s %s %s", IntBits, FracBits,
                  IsSigned ? "signed" : "unsigned", roundingModeName(Rounding),
                  overflowModeName(Overflow));
    return Buf;
  }

  constexpr bool operator==(const FormatSpec &) const = default;

private:
  int IntBits;
  int FracBits;
  bool IsSigned;
  RoundingMode Rounding;
  OverflowMode Overflow;
};

inline FormatSpec makeSpec(int IntegerBits, int FractionalBits,
                           bool Signed = true,
                           RoundingMode Rnd = RoundingMode::Trunc,
                           OverflowMode Ovf = OverflowMode::Wrap) {
  return FormatSpec(IntegerBits, FractionalBits, Signed, Rnd, Ovf);
}

// Integer-code form used at serialization boundaries. Unknown codes
// throw InvalidRoundingModeError / InvalidOverflowModeError.
inline FormatSpec makeSpec(int IntegerBits, int FractionalBits, bool Signed,
                           int RndCode, int OvfCode) {
  return FormatSpec(IntegerBits, FractionalBits, Signed,
                    roundingModeFromCode(RndCode),
                    overflowModeFromCode(OvfCode));
}

// ===================================================================
// SpecCodes: a FormatSpec as plain data
// ===================================================================

struct SpecCodes {
  int IntegerBits = 0;
  int FractionalBits = 0;
  bool Signed = true;
  int Rounding = 0;
  int Overflow = 0;

  constexpr bool operator==(const SpecCodes &) const = default;
};

constexpr SpecCodes toCodes(const FormatSpec &Spec) {
  return {Spec.integerBits(), Spec.fractionalBits(), Spec.isSigned(),
          toCode(Spec.rounding()), toCode(Spec.overflow())};
}

inline FormatSpec fromCodes(const SpecCodes &Codes) {
  return makeSpec(Codes.IntegerBits, Codes.FractionalBits, Codes.Signed,
                  Codes.Rounding, Codes.Overflow);
}

// ===================================================================
// QFormat: the same description fixed at compile time
// ===================================================================

template <typename Q>
concept ValidQFormat = requires {
  { Q::integer_bits } -> std::convertible_to<int>;
  { Q::fractional_bits } -> std::convertible_to<int>;
  { Q::is_signed } -> std::convertible_to<bool>;
  { Q::rounding } -> std::convertible_to<RoundingMode>;
  { Q::overflow } -> std::convertible_to<OverflowMode>;
} && (Q::integer_bits >= 0) && (Q::fractional_bits >= 0) &&
    (Q::integer_bits + Q::fractional_bits >= 1) &&
    (Q::integer_bits + Q::fractional_bits <= MaxTotalBits);

template <int IntegerBits, int FractionalBits, bool Signed = true,
          RoundingMode Rnd = RoundingMode::Trunc,
          OverflowMode Ovf = OverflowMode::Wrap>
struct QFormat {
  static constexpr int integer_bits = IntegerBits;
  static constexpr int fractional_bits = FractionalBits;
  static constexpr bool is_signed = Signed;
  static constexpr RoundingMode rounding = Rnd;
  static constexpr OverflowMode overflow = Ovf;

  static constexpr int total_bits = IntegerBits + FractionalBits;

  static_assert(IntegerBits >= 0, "integer bits cannot be negative");
  static_assert(FractionalBits >= 0, "fractional bits cannot be negative");
  static_assert(total_bits >= 1, "format needs at least one bit");
  static_assert(total_bits <= MaxTotalBits,
                "lattice must be exactly representable as double");

  static constexpr Range range = Range::of(Signed, total_bits);

  static constexpr FormatSpec spec() {
    return FormatSpec(IntegerBits, FractionalBits, Signed, Rnd, Ovf);
  }
};

// --- Convenience aliases ---

// ARM fractional formats: one sign bit, the rest fraction.
using q7 = QFormat<1, 7>;
using q15 = QFormat<1, 15>;
using q31 = QFormat<1, 31>;

// Unsigned integer and mixed formats
using uq8 = QFormat<8, 0, false>;
using uq16 = QFormat<16, 0, false>;
using uq8_8 = QFormat<8, 8, false>;

// DSP-style: round to nearest even, clip instead of wrapping.
template <int IntegerBits, int FractionalBits>
using SaturatingQ = QFormat<IntegerBits, FractionalBits, true,
                            RoundingMode::HalfEven, OverflowMode::Sat>;

static_assert(ValidQFormat<q7>);
static_assert(ValidQFormat<q15>);
static_assert(ValidQFormat<q31>);
static_assert(ValidQFormat<uq8>);
static_assert(ValidQFormat<uq16>);
static_assert(ValidQFormat<uq8_8>);

} // namespace fixq

#endif // FIXQ_CORE_FORMAT_HPP
