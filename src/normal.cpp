#include "bsm/normal.hpp"

#include <cmath>

namespace {

constexpr double kInvSqrtTwoPi = 0.39894228040143267794;  // 1/sqrt(2*pi)

constexpr double kTailScale = 0.2316419;
constexpr double kDensity = 0.3989423;
constexpr double kB1 = 0.3193815;
constexpr double kB2 = -0.3565638;
constexpr double kB3 = 1.781478;
constexpr double kB4 = -1.821256;
constexpr double kB5 = 1.330274;

}  // namespace

namespace bsm {

double normal_cdf(double x) {
  const double t = 1.0 / (1.0 + kTailScale * std::abs(x));
  const double density = kDensity * std::exp(-0.5 * x * x);
  const double tail = density * t * (kB1 + t * (kB2 + t * (kB3 + t * (kB4 + t * kB5))));
  return x > 0.0 ? 1.0 - tail : tail;
}

double normal_pdf(double x) {
  return kInvSqrtTwoPi * std::exp(-0.5 * x * x);
}

}  // namespace bsm
