#ifndef FIXQ_CORE_BACKEND_HPP
#define FIXQ_CORE_BACKEND_HPP

#include <cmath>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <span>
#include <vector>

#include "fixq/core/exceptions.hpp"
#include "fixq/core/format.hpp"
#include "fixq/core/overflow.hpp"
#include "fixq/core/rounding.hpp"

namespace fixq {

namespace detail {

[[noreturn]] inline void throwNonFinite(double X) {
  char Msg[96];
  std::snprintf(Msg, sizeof(Msg), "unsupported input: %g is not a finite real",
                X);
  throw UnsupportedInputTypeError(Msg);
}

inline void checkFinite(double X) {
  if (!std::isfinite(X))
    throwNonFinite(X);
}

inline void checkFinite(std::span<const double> Xs) {
  for (double X : Xs)
    checkFinite(X);
}

inline void checkSameLength(std::size_t In, std::size_t Out) {
  if (In == Out)
    return;
  char Msg[96];
  std::snprintf(Msg, sizeof(Msg),
                "output holds %zu elements, input holds %zu", Out, In);
  throw UnsupportedInputTypeError(Msg);
}

// The reference element path: scale, round, fold + reduce, each mode
// resolved by a switch on every call. The scalar API runs exactly this.
inline std::int64_t latticeOf(double X, const FormatSpec &Spec) {
  double Rounded = roundScaled(X * Spec.scale(), Spec.rounding());
  return reduceRounded(Rounded, Spec.range(), Spec.overflow());
}

// The same pipeline with both policies fixed at compile time.
template <RoundingPolicy Rnd, OverflowPolicy Ovf>
inline std::int64_t latticeOf(double X, double Scale, const Range &Rg) {
  return Ovf::apply(Ovf::fold(Rnd::apply(X * Scale), Rg), Rg);
}

template <RoundingPolicy Rnd, OverflowPolicy Ovf>
void specializedKernel(std::span<const double> In, std::span<double> Out,
                       double Scale, const Range &Rg) {
  if constexpr (Ovf::validates_first) {
    for (double X : In)
      (void)latticeOf<Rnd, Ovf>(X, Scale, Rg);
  }
  const std::size_t N = In.size();
  for (std::size_t I = 0; I < N; ++I)
    Out[I] = static_cast<double>(latticeOf<Rnd, Ovf>(In[I], Scale, Rg)) / Scale;
}

} // namespace detail

// ===================================================================
// Backends: how a bulk conversion is executed
// ===================================================================
// Every backend must give bit-identical results for the same inputs;
// they differ only in how often the mode switch is paid. A backend
// may assume In and Out have equal length, that every input is
// finite, and that Out may alias In element-for-element.

template <typename B>
concept BackendPolicy =
    requires(std::span<const double> In, std::span<double> Out,
             const FormatSpec &Spec) {
      { B::name() } -> std::convertible_to<const char *>;
      { B::precompiled } -> std::convertible_to<bool>;
      B::run(In, Out, Spec);
    };

namespace backends {

// Element-at-a-time through the scalar reference path.
struct Reference {
  static constexpr bool precompiled = false;
  static constexpr const char *name() { return "Reference"; }

  static void run(std::span<const double> In, std::span<double> Out,
                  const FormatSpec &Spec) {
    const std::size_t N = In.size();
    const double Scale = Spec.scale();
    if (Spec.overflow() == OverflowMode::Error) {
      std::vector<std::int64_t> Lattice(N);
      for (std::size_t I = 0; I < N; ++I)
        Lattice[I] = detail::latticeOf(In[I], Spec);
      for (std::size_t I = 0; I < N; ++I)
        Out[I] = static_cast<double>(Lattice[I]) / Scale;
      return;
    }
    for (std::size_t I = 0; I < N; ++I)
      Out[I] = static_cast<double>(detail::latticeOf(In[I], Spec)) / Scale;
  }
};

// Resolve (rounding, overflow) once, then run a loop instantiated for
// that pair. One kernel exists per combination: 9 x 3.
struct Specialized {
  static constexpr bool precompiled = true;
  static constexpr const char *name() { return "Specialized"; }

  static void run(std::span<const double> In, std::span<double> Out,
                  const FormatSpec &Spec) {
    const double Scale = Spec.scale();
    const Range Rg = Spec.range();
    withRoundingPolicy(Spec.rounding(), [&](auto Rnd) {
      withOverflowPolicy(Spec.overflow(), [&](auto Ovf) {
        detail::specializedKernel<decltype(Rnd), decltype(Ovf)>(In, Out, Scale,
                                                                Rg);
      });
    });
  }
};

using Default = Specialized;

static_assert(BackendPolicy<Reference>);
static_assert(BackendPolicy<Specialized>);

} // namespace backends
} // namespace fixq

#endif // FIXQ_CORE_BACKEND_HPP
