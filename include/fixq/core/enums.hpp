#ifndef FIXQ_CORE_ENUMS_HPP
#define FIXQ_CORE_ENUMS_HPP

#include <array>
#include <cstdio>
#include <optional>
#include <string_view>

#include "fixq/core/exceptions.hpp"

namespace fixq {

// The enumerator values are the serialization codes. They are part of
// the external interface and never change.
enum class RoundingMode {
  Trunc = 0,    // floor, toward -inf
  Ceil = 1,     // toward +inf
  ToZero = 2,   // drop the fractional part
  Away = 3,     // away from zero
  HalfUp = 4,   // nearest, ties toward +inf
  HalfDown = 5, // nearest, ties toward -inf
  HalfEven = 6, // nearest, ties to even
  HalfZero = 7, // nearest, ties toward zero
  HalfAway = 8, // nearest, ties away from zero
};

enum class OverflowMode {
  Wrap = 0,  // modulo 2^total_bits, two's complement for signed
  Sat = 1,   // clamp to [lower, upper]
  Error = 2, // fail the whole call
};

inline constexpr std::array<RoundingMode, 9> AllRoundingModes = {
    RoundingMode::Trunc,    RoundingMode::Ceil,     RoundingMode::ToZero,
    RoundingMode::Away,     RoundingMode::HalfUp,   RoundingMode::HalfDown,
    RoundingMode::HalfEven, RoundingMode::HalfZero, RoundingMode::HalfAway,
};

inline constexpr std::array<OverflowMode, 3> AllOverflowModes = {
    OverflowMode::Wrap, OverflowMode::Sat, OverflowMode::Error};

constexpr int toCode(RoundingMode M) { return static_cast<int>(M); }
constexpr int toCode(OverflowMode M) { return static_cast<int>(M); }

constexpr bool isValidRoundingCode(int Code) {
  return Code >= 0 && Code < static_cast<int>(AllRoundingModes.size());
}

constexpr bool isValidOverflowCode(int Code) {
  return Code >= 0 && Code < static_cast<int>(AllOverflowModes.size());
}

// ===================================================================
// Names
// ===================================================================

inline const char *roundingModeName(RoundingMode M) {
  switch (M) {
  case RoundingMode::Trunc:    return "TRUNC";
  case RoundingMode::Ceil:     return "CEIL";
  case RoundingMode::ToZero:   return "TO_ZERO";
  case RoundingMode::Away:     return "AWAY";
  case RoundingMode::HalfUp:   return "HALF_UP";
  case RoundingMode::HalfDown: return "HALF_DOWN";
  case RoundingMode::HalfEven: return "HALF_EVEN";
  case RoundingMode::HalfZero: return "HALF_ZERO";
  case RoundingMode::HalfAway: return "HALF_AWAY";
  }
  return "???";
}

inline const char *overflowModeName(OverflowMode M) {
  switch (M) {
  case OverflowMode::Wrap:  return "WRAP";
  case OverflowMode::Sat:   return "SAT";
  case OverflowMode::Error: return "ERROR";
  }
  return "???";
}

// ===================================================================
// Code boundary
// ===================================================================
// Integer codes only exist at the edge of the library. Everything past
// these functions works with the closed enumerations.

[[noreturn]] inline void throwInvalidRoundingCode(int Code) {
  char Msg[64];
  std::snprintf(Msg, sizeof(Msg), "invalid rounding mode: %d", Code);
  throw InvalidRoundingModeError(Msg);
}

[[noreturn]] inline void throwInvalidOverflowCode(int Code) {
  char Msg[64];
  std::snprintf(Msg, sizeof(Msg), "invalid overflow mode: %d", Code);
  throw InvalidOverflowModeError(Msg);
}

inline RoundingMode roundingModeFromCode(int Code) {
  if (!isValidRoundingCode(Code))
    throwInvalidRoundingCode(Code);
  return static_cast<RoundingMode>(Code);
}

inline OverflowMode overflowModeFromCode(int Code) {
  if (!isValidOverflowCode(Code))
    throwInvalidOverflowCode(Code);
  return static_cast<OverflowMode>(Code);
}

// Reverse lookup for diagnostics: code -> "HALF_EVEN".
inline const char *roundingModeName(int Code) {
  return roundingModeName(roundingModeFromCode(Code));
}

inline const char *overflowModeName(int Code) {
  return overflowModeName(overflowModeFromCode(Code));
}

// Forward lookup: "HALF_EVEN" -> RoundingMode::HalfEven.
inline std::optional<RoundingMode> parseRoundingMode(std::string_view Name) {
  for (RoundingMode M : AllRoundingModes)
    if (Name == roundingModeName(M))
      return M;
  return std::nullopt;
}

inline std::optional<OverflowMode> parseOverflowMode(std::string_view Name) {
  for (OverflowMode M : AllOverflowModes)
    if (Name == overflowModeName(M))
      return M;
  return std::nullopt;
}

} // namespace fixq

#endif // FIXQ_CORE_ENUMS_HPP
