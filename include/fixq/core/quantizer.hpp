#ifndef FIXQ_CORE_QUANTIZER_HPP
#define FIXQ_CORE_QUANTIZER_HPP

#include <concepts>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

#include "fixq/core/backend.hpp"
#include "fixq/core/enums.hpp"
#include "fixq/core/exceptions.hpp"
#include "fixq/core/format.hpp"

namespace fixq {

// Two ways to apply a format: one value at a time, or a whole buffer.
// Both views share the rounding and overflow policies and must agree
// bit-for-bit on every element.
template <typename Q>
concept ElementwiseQuantizer = requires(const Q &Impl, double X) {
  { Impl.spec() } -> std::convertible_to<FormatSpec>;
  { Impl(X) } -> std::same_as<double>;
};

template <typename Q>
concept BulkQuantizer = requires(const Q &Impl, std::span<const double> In,
                                 std::span<double> Out) {
  { Impl.spec() } -> std::convertible_to<FormatSpec>;
  { Impl(In) } -> std::same_as<std::vector<double>>;
  Impl(In, Out);
};

class ScalarQuantizer {
public:
  explicit ScalarQuantizer(const FormatSpec &Spec) : Spec(Spec) {}

  const FormatSpec &spec() const { return Spec; }

  // Reduced lattice integer k, with x ~ k / 2^f.
  std::int64_t raw(double X) const {
    detail::checkFinite(X);
    return detail::latticeOf(X, Spec);
  }

  double operator()(double X) const {
    return static_cast<double>(raw(X)) / Spec.scale();
  }

private:
  FormatSpec Spec;
};

template <BackendPolicy Backend = backends::Default> class ArrayQuantizer {
public:
  using backend = Backend;

  explicit ArrayQuantizer(const FormatSpec &Spec) : Spec(Spec) {}

  const FormatSpec &spec() const { return Spec; }

  // Out may be In itself. Nothing is written unless every element
  // converts.
  void operator()(std::span<const double> In, std::span<double> Out) const {
    detail::checkSameLength(In.size(), Out.size());
    detail::checkFinite(In);
    Backend::run(In, Out, Spec);
  }

  std::vector<double> operator()(std::span<const double> In) const {
    std::vector<double> Out(In.size());
    (*this)(In, std::span<double>(Out));
    return Out;
  }

private:
  FormatSpec Spec;
};

static_assert(ElementwiseQuantizer<ScalarQuantizer>);
static_assert(BulkQuantizer<ArrayQuantizer<backends::Reference>>);
static_assert(BulkQuantizer<ArrayQuantizer<backends::Specialized>>);

// ===================================================================
// Free functions
// ===================================================================

inline double quantize(double X, const FormatSpec &Spec) {
  return ScalarQuantizer(Spec)(X);
}

inline std::vector<double> quantize(std::span<const double> Xs,
                                    const FormatSpec &Spec) {
  return ArrayQuantizer<>(Spec)(Xs);
}

inline void quantizeInPlace(std::span<double> Xs, const FormatSpec &Spec) {
  ArrayQuantizer<> Bulk(Spec);
  Bulk(Xs, Xs);
}

// Positional forms: build the FormatSpec, then convert.
inline double quantize(double X, int IntegerBits, int FractionalBits,
                       bool Signed = true,
                       RoundingMode Rnd = RoundingMode::Trunc,
                       OverflowMode Ovf = OverflowMode::Wrap) {
  return quantize(X, makeSpec(IntegerBits, FractionalBits, Signed, Rnd, Ovf));
}

inline double quantize(double X, int IntegerBits, int FractionalBits,
                       bool Signed, int RndCode, int OvfCode) {
  return quantize(
      X, makeSpec(IntegerBits, FractionalBits, Signed, RndCode, OvfCode));
}

inline std::vector<double> quantize(std::span<const double> Xs,
                                    int IntegerBits, int FractionalBits,
                                    bool Signed = true,
                                    RoundingMode Rnd = RoundingMode::Trunc,
                                    OverflowMode Ovf = OverflowMode::Wrap) {
  return quantize(Xs, makeSpec(IntegerBits, FractionalBits, Signed, Rnd, Ovf));
}

inline std::vector<double> quantize(std::span<const double> Xs,
                                    int IntegerBits, int FractionalBits,
                                    bool Signed, int RndCode, int OvfCode) {
  return quantize(
      Xs, makeSpec(IntegerBits, FractionalBits, Signed, RndCode, OvfCode));
}

template <ValidQFormat Q> double quantize(double X) {
  return quantize(X, Q::spec());
}

// ===================================================================
// Raw lattice access
// ===================================================================

inline std::int64_t quantizeToRaw(double X, const FormatSpec &Spec) {
  return ScalarQuantizer(Spec).raw(X);
}

inline double fromRaw(std::int64_t K, const FormatSpec &Spec) {
  Range Rg = Spec.range();
  if (!Rg.contains(K))
    overflow::throwOverflow(K, Rg);
  return static_cast<double>(K) / Spec.scale();
}

// ===================================================================
// Status-returning forms
// ===================================================================

// Run Body under an exception policy: Throw passes the result (and any
// Error) straight through, ReturnStatus converts an Error into its
// Status.
template <ExceptionPolicy Exc, typename Fn> auto underPolicy(Fn &&Body) {
  if constexpr (Exc::throws) {
    return std::forward<Fn>(Body)();
  } else {
    using T = decltype(std::forward<Fn>(Body)());
    try {
      return Outcome<T>{std::forward<Fn>(Body)(), Status::Ok};
    } catch (const Error &E) {
      return Outcome<T>{T{}, E.status()};
    }
  }
}

inline Outcome<double> tryQuantize(double X, const FormatSpec &Spec) {
  return underPolicy<exceptions::ReturnStatus>(
      [&] { return quantize(X, Spec); });
}

inline Outcome<std::vector<double>> tryQuantize(std::span<const double> Xs,
                                                const FormatSpec &Spec) {
  return underPolicy<exceptions::ReturnStatus>(
      [&] { return quantize(Xs, Spec); });
}

inline Outcome<double> tryQuantize(double X, int IntegerBits,
                                   int FractionalBits, bool Signed,
                                   int RndCode, int OvfCode) {
  return underPolicy<exceptions::ReturnStatus>([&] {
    return quantize(X, IntegerBits, FractionalBits, Signed, RndCode, OvfCode);
  });
}

} // namespace fixq

#endif // FIXQ_CORE_QUANTIZER_HPP
