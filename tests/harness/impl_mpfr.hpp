#ifndef FIXQ_TESTS_HARNESS_IMPL_MPFR_HPP
#define FIXQ_TESTS_HARNESS_IMPL_MPFR_HPP

// MPFR adapter: one implementation among equals.
//
// Provides MpfrAdapter satisfying the adapter interface:
//   dispatch(double, FormatSpec) -> TestOutput
//
// Internally contains:
//   MpfrFloat     : RAII wrapper around mpfr_t
//   MpzInt        : RAII wrapper around mpz_t
//   mpfrRoundExact: the nine rounding rules in exact arithmetic
//   mpzReduce     : WRAP / SAT / ERROR on an unbounded integer
//
// Nothing here calls into fixq's rounding or overflow code. The only
// shared pieces are FormatSpec (for the parameters) and Status.

#include <cstdint>

#include <gmp.h>
#include <mpfr.h>

#include "harness/ops.hpp"

namespace fixq::testing {

// Working precision. A scaled double that still has a fraction is
// below 2^53 and stays exact when a half is added. Larger ones are
// integers; the half rounds away and leaves them unchanged.
inline constexpr mpfr_prec_t ExactPrecision = 256;

// ===================================================================
// MpfrFloat: RAII wrapper around mpfr_t
// ===================================================================

class MpfrFloat {
public:
  explicit MpfrFloat(mpfr_prec_t Prec = ExactPrecision) {
    mpfr_init2(Val, Prec);
  }

  ~MpfrFloat() { mpfr_clear(Val); }

  MpfrFloat(const MpfrFloat &) = delete;
  MpfrFloat &operator=(const MpfrFloat &) = delete;

  mpfr_ptr get() { return Val; }
  mpfr_srcptr get() const { return Val; }
  operator mpfr_ptr() { return Val; }
  operator mpfr_srcptr() const { return Val; }

  bool isNegative() const { return mpfr_signbit(Val) != 0; }

private:
  mpfr_t Val;
};

// ===================================================================
// MpzInt: RAII wrapper around mpz_t
// ===================================================================

class MpzInt {
public:
  MpzInt() { mpz_init(Val); }
  explicit MpzInt(long V) { mpz_init_set_si(Val, V); }
  ~MpzInt() { mpz_clear(Val); }

  MpzInt(const MpzInt &) = delete;
  MpzInt &operator=(const MpzInt &) = delete;

  mpz_ptr get() { return Val; }
  mpz_srcptr get() const { return Val; }
  operator mpz_ptr() { return Val; }
  operator mpz_srcptr() const { return Val; }

private:
  mpz_t Val;
};

// ===================================================================
// mpfrRoundExact: round X to an integer per the named rule
// ===================================================================
// floor/ceil/trunc of an exact value are exact; see ExactPrecision
// for the half-adds.

inline void mpfrRoundExact(MpfrFloat &Result, const MpfrFloat &X,
                           RoundingMode M) {
  MpfrFloat Tmp;
  switch (M) {
  case RoundingMode::Trunc:
    mpfr_floor(Result, X);
    return;
  case RoundingMode::Ceil:
    mpfr_ceil(Result, X);
    return;
  case RoundingMode::ToZero:
    mpfr_trunc(Result, X);
    return;
  case RoundingMode::Away:
    mpfr_rint(Result, X, MPFR_RNDA);
    return;
  case RoundingMode::HalfUp:
    mpfr_add_d(Tmp, X, 0.5, MPFR_RNDN);
    mpfr_floor(Result, Tmp);
    return;
  case RoundingMode::HalfDown:
    mpfr_sub_d(Tmp, X, 0.5, MPFR_RNDN);
    mpfr_ceil(Result, Tmp);
    return;
  case RoundingMode::HalfEven:
    mpfr_roundeven(Result, X);
    return;
  case RoundingMode::HalfZero:
    // ceil(|x| - 1/2) with the sign restored
    mpfr_abs(Tmp, X, MPFR_RNDN);
    mpfr_sub_d(Tmp, Tmp, 0.5, MPFR_RNDN);
    mpfr_ceil(Result, Tmp);
    if (X.isNegative())
      mpfr_neg(Result, Result, MPFR_RNDN);
    return;
  case RoundingMode::HalfAway:
    mpfr_round(Result, X);
    return;
  }
}

// ===================================================================
// mpzReduce: bring an unbounded integer into the format's range
// ===================================================================
// Returns Status::Overflow under ERROR when K is out of range.

inline Status mpzReduce(MpzInt &K, const FormatSpec &Spec) {
  const int W = Spec.totalBits();
  MpzInt Lower(static_cast<long>(Spec.lower()));
  MpzInt Upper(static_cast<long>(Spec.upper()));

  switch (Spec.overflow()) {
  case OverflowMode::Wrap:
    // Non-negative residue mod 2^W, then reinterpret the top bit.
    mpz_fdiv_r_2exp(K, K, W);
    if (Spec.isSigned() && mpz_cmp(K, Upper) > 0) {
      MpzInt Modulus;
      mpz_ui_pow_ui(Modulus, 2, W);
      mpz_sub(K, K, Modulus);
    }
    return Status::Ok;
  case OverflowMode::Sat:
    if (mpz_cmp(K, Upper) > 0)
      mpz_set(K, Upper);
    else if (mpz_cmp(K, Lower) < 0)
      mpz_set(K, Lower);
    return Status::Ok;
  case OverflowMode::Error:
    if (mpz_cmp(K, Upper) > 0 || mpz_cmp(K, Lower) < 0)
      return Status::Overflow;
    return Status::Ok;
  }
  return Status::InvalidOverflowMode;
}

// ===================================================================
// MpfrAdapter
// ===================================================================

struct MpfrAdapter {
  static constexpr const char *name() { return "MPFR"; }

  bool supports(const FormatSpec &) const { return true; }

  TestOutput dispatch(double X, const FormatSpec &Spec) const {
    MpfrFloat Exact;
    mpfr_set_d(Exact, X, MPFR_RNDN);
    if (!mpfr_number_p(Exact.get()))
      return {0.0, Status::UnsupportedInputType};

    mpfr_mul_2si(Exact, Exact, Spec.fractionalBits(), MPFR_RNDN);

    MpfrFloat Rounded;
    mpfrRoundExact(Rounded, Exact, Spec.rounding());

    MpzInt K;
    mpfr_get_z(K, Rounded, MPFR_RNDN);
    Status S = mpzReduce(K, Spec);
    if (S != Status::Ok)
      return {0.0, S};

    MpfrFloat Result;
    mpfr_set_z(Result, K, MPFR_RNDN);
    mpfr_div_2si(Result, Result, Spec.fractionalBits(), MPFR_RNDN);
    // |K| <= 2^53, so the conversion is exact. K == 0 gives +0.0.
    return {mpfr_get_d(Result, MPFR_RNDN), Status::Ok};
  }
};

} // namespace fixq::testing

#endif // FIXQ_TESTS_HARNESS_IMPL_MPFR_HPP
