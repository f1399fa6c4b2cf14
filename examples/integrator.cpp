// A first-order fixed-point integrator.
//
// The input (DC 1.0 plus gaussian noise) is quantized to a saturating
// Q4.5 word, then summed into a Q7.5 accumulator that wraps. Prints
// one "n x x_fxp y_fxp" line per sample.
//
// Usage: integrator [samples] [seed]

#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdint>
#include <cstdlib>
#include <random>
#include <vector>

#include "fixq/fixq.hpp"

using namespace fixq;

static std::vector<double> integrate(const std::vector<double> &XFxp,
                                     const ScalarQuantizer &Acc) {
  std::vector<double> Y(XFxp.size());
  double State = 0.0;
  for (std::size_t I = 0; I < XFxp.size(); ++I) {
    Y[I] = Acc(State + XFxp[I]);
    State = Y[I];
  }
  return Y;
}

// Parses a whole decimal argument; false on empty input, trailing
// characters or a value outside [Min, Max].
static bool parseArg(const char *Text, long Min, long Max, long &Out) {
  char *End = nullptr;
  errno = 0;
  long V = std::strtol(Text, &End, 10);
  if (End == Text || *End != '\0' || errno == ERANGE || V < Min || V > Max)
    return false;
  Out = V;
  return true;
}

int main(int argc, char **argv) {
  long Samples = 1024;
  long Seed = 1;
  if (argc > 1 && !parseArg(argv[1], 1, 1L << 24, Samples)) {
    std::fprintf(stderr, "integrator: bad sample count '%s'\n", argv[1]);
    return 1;
  }
  if (argc > 2 && !parseArg(argv[2], 0, LONG_MAX, Seed)) {
    std::fprintf(stderr, "integrator: bad seed '%s'\n", argv[2]);
    return 1;
  }

  const FormatSpec InputSpec =
      makeSpec(4, 5, true, RoundingMode::Trunc, OverflowMode::Sat);
  const FormatSpec AccSpec =
      makeSpec(7, 5, true, RoundingMode::Trunc, OverflowMode::Wrap);

  std::mt19937_64 Rng(static_cast<std::uint64_t>(Seed));
  std::normal_distribution<double> Noise(0.0, 0.1);
  std::vector<double> X(static_cast<std::size_t>(Samples));
  for (double &V : X)
    V = 1.0 + Noise(Rng);

  try {
    std::vector<double> XFxp = ArrayQuantizer<>(InputSpec)(X);
    std::vector<double> Y = integrate(XFxp, ScalarQuantizer(AccSpec));

    std::printf("# input  %s\n", InputSpec.describe().c_str());
    std::printf("# output %s\n", AccSpec.describe().c_str());
    for (std::size_t I = 0; I < X.size(); ++I)
      std::printf("%zu %.6f %.5f %.5f\n", I, X[I], XFxp[I], Y[I]);
  } catch (const Error &E) {
    std::fprintf(stderr, "integrator: %s (%s)\n", E.what(),
                 statusName(E.status()));
    return 1;
  }
  return 0;
}
