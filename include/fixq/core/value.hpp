#ifndef FIXQ_CORE_VALUE_HPP
#define FIXQ_CORE_VALUE_HPP

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "fixq/core/exceptions.hpp"
#include "fixq/core/format.hpp"
#include "fixq/core/quantizer.hpp"

namespace fixq {

// A loosely typed input, as it arrives from a serialized or scripted
// caller. Only the scalar and array alternatives can be quantized.
using Value = std::variant<std::monostate, std::int64_t, double,
                           std::vector<double>, std::string>;

inline const char *valueKindName(const Value &V) {
  switch (V.index()) {
  case 0: return "empty";
  case 1: return "integer";
  case 2: return "real";
  case 3: return "array";
  case 4: return "string";
  }
  return "???";
}

// Dispatch on the input's shape: scalars through ScalarQuantizer,
// arrays through ArrayQuantizer. The result has the input's shape,
// except that integer scalars come back as reals.
inline Value quantizeValue(const Value &X, const FormatSpec &Spec) {
  return std::visit(
      [&](const auto &V) -> Value {
        using T = std::decay_t<decltype(V)>;
        if constexpr (std::is_same_v<T, double>) {
          return quantize(V, Spec);
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          return quantize(static_cast<double>(V), Spec);
        } else if constexpr (std::is_same_v<T, std::vector<double>>) {
          return quantize(std::span<const double>(V), Spec);
        } else {
          char Msg[64];
          std::snprintf(Msg, sizeof(Msg), "unsupported input type: %s",
                        valueKindName(X));
          throw UnsupportedInputTypeError(Msg);
        }
      },
      X);
}

inline Outcome<Value> tryQuantizeValue(const Value &X, const FormatSpec &Spec) {
  return underPolicy<exceptions::ReturnStatus>(
      [&] { return quantizeValue(X, Spec); });
}

} // namespace fixq

#endif // FIXQ_CORE_VALUE_HPP
