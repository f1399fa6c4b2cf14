#ifndef FIXQ_CORE_OVERFLOW_HPP
#define FIXQ_CORE_OVERFLOW_HPP

#include <cmath>
#include <concepts>
#include <cstdint>
#include <cstdio>

#include "fixq/core/enums.hpp"
#include "fixq/core/exceptions.hpp"
#include "fixq/core/format.hpp"

namespace fixq {

// An overflow policy has two steps:
//   fold : narrow an integer-valued double to int64 without changing
//           the answer apply() will give
//   apply: bring the int64 into the Range (or throw)
template <typename O>
concept OverflowPolicy = requires(double R, std::int64_t K, Range Rg) {
  { O::mode } -> std::convertible_to<OverflowMode>;
  { O::validates_first } -> std::convertible_to<bool>;
  { O::fold(R, Rg) } -> std::same_as<std::int64_t>;
  { O::apply(K, Rg) } -> std::same_as<std::int64_t>;
};

namespace overflow {

// Rounded values below this magnitude convert to int64 directly. It
// leaves headroom above any Range (|bounds| <= 2^53).
inline constexpr double FoldLimit = 4611686018427387904.0; // 2^62

[[noreturn]] inline void throwOverflow(std::int64_t K, const Range &R) {
  char Msg[128];
  std::snprintf(Msg, sizeof(Msg), "overflow: %lld outside [%lld, %lld]",
                static_cast<long long>(K), static_cast<long long>(R.Lower),
                static_cast<long long>(R.Upper));
  throw OverflowError(Msg);
}

// Clamp into [-2^62, 2^62]. Anything clamped was already outside every
// Range, so SAT and ERROR decide the same way.
inline std::int64_t clampFold(double R) {
  if (R > FoldLimit)
    return static_cast<std::int64_t>(FoldLimit);
  if (R < -FoldLimit)
    return -static_cast<std::int64_t>(FoldLimit);
  return static_cast<std::int64_t>(R);
}

// Modulo 2^total_bits; two's complement for signed ranges. Masking
// then sign-extending is the same as subtracting the modulus when the
// masked value lands above Upper.
struct Wrap {
  static constexpr OverflowMode mode = OverflowMode::Wrap;
  static constexpr bool validates_first = false;

  static std::int64_t fold(double R, const Range &Rg) {
    if (std::fabs(R) < FoldLimit)
      return static_cast<std::int64_t>(R);
    // Only a finite input times 2^f can reach infinity here. Such an
    // input is at least 2^971 in magnitude, hence a multiple of 2^919:
    // congruent to 0 for every modulus.
    if (std::isinf(R))
      return 0;
    double Modulus = static_cast<double>(Rg.Upper - Rg.Lower + 1);
    return static_cast<std::int64_t>(std::fmod(R, Modulus));
  }

  static std::int64_t apply(std::int64_t K, const Range &Rg) {
    std::int64_t Modulus = Rg.Upper - Rg.Lower + 1;
    std::int64_t Masked = K & (Modulus - 1);
    if (Rg.Lower < 0 && Masked > Rg.Upper)
      return Masked - Modulus;
    return Masked;
  }
};

struct Sat {
  static constexpr OverflowMode mode = OverflowMode::Sat;
  static constexpr bool validates_first = false;

  static std::int64_t fold(double R, const Range &) { return clampFold(R); }

  static std::int64_t apply(std::int64_t K, const Range &Rg) {
    if (K > Rg.Upper)
      return Rg.Upper;
    if (K < Rg.Lower)
      return Rg.Lower;
    return K;
  }
};

// Fail closed: bulk callers check every element before writing any.
struct Error {
  static constexpr OverflowMode mode = OverflowMode::Error;
  static constexpr bool validates_first = true;

  static std::int64_t fold(double R, const Range &) { return clampFold(R); }

  static std::int64_t apply(std::int64_t K, const Range &Rg) {
    if (!Rg.contains(K))
      throwOverflow(K, Rg);
    return K;
  }
};

using Default = Wrap;

static_assert(OverflowPolicy<Wrap>);
static_assert(OverflowPolicy<Sat>);
static_assert(OverflowPolicy<Error>);

} // namespace overflow

template <typename Fn> decltype(auto) withOverflowPolicy(OverflowMode M, Fn &&F) {
  switch (M) {
  case OverflowMode::Wrap:  return F(overflow::Wrap{});
  case OverflowMode::Sat:   return F(overflow::Sat{});
  case OverflowMode::Error: return F(overflow::Error{});
  }
  throwInvalidOverflowCode(toCode(M));
}

// Reduce an integer into the representable range of a signed or
// unsigned word of TotalBits bits.
inline std::int64_t reduce(std::int64_t K, bool Signed, int TotalBits,
                           OverflowMode M) {
  if (TotalBits < 1 || TotalBits > MaxTotalBits)
    throwInvalidSpec(TotalBits, 0);
  Range Rg = Range::of(Signed, TotalBits);
  switch (M) {
  case OverflowMode::Wrap:  return overflow::Wrap::apply(K, Rg);
  case OverflowMode::Sat:   return overflow::Sat::apply(K, Rg);
  case OverflowMode::Error: return overflow::Error::apply(K, Rg);
  }
  throwInvalidOverflowCode(toCode(M));
}

inline std::int64_t reduce(std::int64_t K, bool Signed, int TotalBits,
                           int Code) {
  return reduce(K, Signed, TotalBits, overflowModeFromCode(Code));
}

// Fold and reduce the output of roundScaled() in one step.
inline std::int64_t reduceRounded(double Rounded, const Range &Rg,
                                  OverflowMode M) {
  switch (M) {
  case OverflowMode::Wrap:
    return overflow::Wrap::apply(overflow::Wrap::fold(Rounded, Rg), Rg);
  case OverflowMode::Sat:
    return overflow::Sat::apply(overflow::Sat::fold(Rounded, Rg), Rg);
  case OverflowMode::Error:
    return overflow::Error::apply(overflow::Error::fold(Rounded, Rg), Rg);
  }
  throwInvalidOverflowCode(toCode(M));
}

} // namespace fixq

#endif // FIXQ_CORE_OVERFLOW_HPP
