#ifndef FIXQ_CORE_ROUNDING_HPP
#define FIXQ_CORE_ROUNDING_HPP

#include <cmath>
#include <concepts>

#include "fixq/core/enums.hpp"

namespace fixq {

// A rounding policy maps a scaled real onto an integer-valued double.
// The result stays a double because the scaled input may lie far
// outside any integer type; the overflow stage narrows it.
template <typename R>
concept RoundingPolicy = requires(double X) {
  { R::mode } -> std::convertible_to<RoundingMode>;
  { R::apply(X) } -> std::same_as<double>;
};

namespace rounding {

namespace detail {

// Nearest integer to a non-negative A, ties up. A - floor(A) is exact
// for A >= 0, so the comparison decides ties exactly. This is
// floor(A + 0.5) without the double rounding of the addition.
inline double halfUpMagnitude(double A) {
  double Floor = std::floor(A);
  return (A - Floor >= 0.5) ? Floor + 1.0 : Floor;
}

// ceil(A - 0.5) for non-negative A, in the same manner.
inline double halfDownMagnitude(double A) {
  double Floor = std::floor(A);
  return (A - Floor > 0.5) ? Floor + 1.0 : Floor;
}

// Negative inputs go through the magnitude: below zero the fractional
// part x - floor(x) is not always representable.
inline double nearestTiesUp(double X) {
  return X >= 0 ? halfUpMagnitude(X) : -halfDownMagnitude(-X);
}

inline double nearestTiesDown(double X) {
  return X >= 0 ? halfDownMagnitude(X) : -halfUpMagnitude(-X);
}

} // namespace detail

// Bit truncation of the two's complement word: toward -inf.
struct Trunc {
  static constexpr RoundingMode mode = RoundingMode::Trunc;
  static double apply(double X) { return std::floor(X); }
};

struct Ceil {
  static constexpr RoundingMode mode = RoundingMode::Ceil;
  static double apply(double X) { return std::ceil(X); }
};

struct ToZero {
  static constexpr RoundingMode mode = RoundingMode::ToZero;
  static double apply(double X) { return std::trunc(X); }
};

struct Away {
  static constexpr RoundingMode mode = RoundingMode::Away;
  static double apply(double X) {
    return X >= 0 ? std::ceil(X) : -std::ceil(std::fabs(X));
  }
};

struct HalfUp {
  static constexpr RoundingMode mode = RoundingMode::HalfUp;
  static double apply(double X) { return detail::nearestTiesUp(X); }
};

struct HalfDown {
  static constexpr RoundingMode mode = RoundingMode::HalfDown;
  static double apply(double X) { return detail::nearestTiesDown(X); }
};

// Ties are detected with an exact == 0.5 on the magnitude. Scaling by
// 2^f never disturbs the fraction, so ties in the input stay exact ties
// here.
struct HalfEven {
  static constexpr RoundingMode mode = RoundingMode::HalfEven;
  static double apply(double X) {
    double A = std::fabs(X);
    double Floor = std::floor(A);
    double Magnitude;
    if (A - Floor == 0.5)
      Magnitude = std::fmod(Floor, 2.0) != 0.0 ? Floor + 1.0 : Floor;
    else
      Magnitude = std::round(A);
    return X >= 0 ? Magnitude : -Magnitude;
  }
};

struct HalfZero {
  static constexpr RoundingMode mode = RoundingMode::HalfZero;
  static double apply(double X) {
    double Magnitude = detail::halfDownMagnitude(std::fabs(X));
    return X >= 0 ? Magnitude : -Magnitude;
  }
};

struct HalfAway {
  static constexpr RoundingMode mode = RoundingMode::HalfAway;
  static double apply(double X) {
    double Magnitude = detail::halfUpMagnitude(std::fabs(X));
    return X >= 0 ? Magnitude : -Magnitude;
  }
};

using Default = Trunc;

static_assert(RoundingPolicy<Trunc>);
static_assert(RoundingPolicy<Ceil>);
static_assert(RoundingPolicy<ToZero>);
static_assert(RoundingPolicy<Away>);
static_assert(RoundingPolicy<HalfUp>);
static_assert(RoundingPolicy<HalfDown>);
static_assert(RoundingPolicy<HalfEven>);
static_assert(RoundingPolicy<HalfZero>);
static_assert(RoundingPolicy<HalfAway>);

} // namespace rounding

// Invoke Fn with a default-constructed policy tag for M. Lets callers
// pick the policy once and run a fully static loop underneath.
template <typename Fn> decltype(auto) withRoundingPolicy(RoundingMode M, Fn &&F) {
  switch (M) {
  case RoundingMode::Trunc:    return F(rounding::Trunc{});
  case RoundingMode::Ceil:     return F(rounding::Ceil{});
  case RoundingMode::ToZero:   return F(rounding::ToZero{});
  case RoundingMode::Away:     return F(rounding::Away{});
  case RoundingMode::HalfUp:   return F(rounding::HalfUp{});
  case RoundingMode::HalfDown: return F(rounding::HalfDown{});
  case RoundingMode::HalfEven: return F(rounding::HalfEven{});
  case RoundingMode::HalfZero: return F(rounding::HalfZero{});
  case RoundingMode::HalfAway: return F(rounding::HalfAway{});
  }
  throwInvalidRoundingCode(toCode(M));
}

// Round an already scaled value (x * 2^f) to an integer-valued double.
inline double roundScaled(double Scaled, RoundingMode M) {
  switch (M) {
  case RoundingMode::Trunc:    return rounding::Trunc::apply(Scaled);
  case RoundingMode::Ceil:     return rounding::Ceil::apply(Scaled);
  case RoundingMode::ToZero:   return rounding::ToZero::apply(Scaled);
  case RoundingMode::Away:     return rounding::Away::apply(Scaled);
  case RoundingMode::HalfUp:   return rounding::HalfUp::apply(Scaled);
  case RoundingMode::HalfDown: return rounding::HalfDown::apply(Scaled);
  case RoundingMode::HalfEven: return rounding::HalfEven::apply(Scaled);
  case RoundingMode::HalfZero: return rounding::HalfZero::apply(Scaled);
  case RoundingMode::HalfAway: return rounding::HalfAway::apply(Scaled);
  }
  throwInvalidRoundingCode(toCode(M));
}

inline double roundScaled(double Scaled, int Code) {
  return roundScaled(Scaled, roundingModeFromCode(Code));
}

} // namespace fixq

#endif // FIXQ_CORE_ROUNDING_HPP
