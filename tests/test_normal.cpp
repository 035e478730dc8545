#include <cmath>
#include <cstdlib>
#include <iostream>

#include "bsm/normal.hpp"

namespace {

void assert_near(const char* label, double actual, double expected, double tolerance) {
  if (std::abs(actual - expected) > tolerance) {
    std::cerr << label << " expected " << expected << " but got " << actual << '\n';
    std::exit(EXIT_FAILURE);
  }
}

void assert_condition(bool condition, const char* message) {
  if (!condition) {
    std::cerr << message << '\n';
    std::exit(EXIT_FAILURE);
  }
}

}  // namespace

int main() {
  assert_near("cdf(0)", bsm::normal_cdf(0.0), 0.5, 1e-6);
  assert_near("cdf(1)", bsm::normal_cdf(1.0), 0.8413447460685429, 1e-6);
  assert_near("cdf(-1.96)", bsm::normal_cdf(-1.96), 0.024997895148220435, 1e-6);
  assert_near("cdf(2.5)", bsm::normal_cdf(2.5), 0.9937903346742238, 1e-6);
  assert_near("cdf(-8)", bsm::normal_cdf(-8.0), 0.0, 1e-12);
  assert_near("cdf(8)", bsm::normal_cdf(8.0), 1.0, 1e-12);

  for (double x : {0.1, 0.5, 1.3, 2.7, 4.0, 6.5}) {
    assert_near("cdf antisymmetry", bsm::normal_cdf(-x), 1.0 - bsm::normal_cdf(x), 1e-12);
  }

  double previous = bsm::normal_cdf(-5.0);
  for (double x = -4.9; x <= 5.0; x += 0.1) {
    const double current = bsm::normal_cdf(x);
    assert_condition(current >= previous, "cdf must be non-decreasing");
    assert_condition(current >= 0.0 && current <= 1.0, "cdf must stay within [0, 1]");
    previous = current;
  }

  assert_near("pdf(0)", bsm::normal_pdf(0.0), 0.3989422804014327, 1e-15);
  assert_near("pdf(1)", bsm::normal_pdf(1.0), 0.24197072451914337, 1e-15);
  assert_near("pdf symmetry", bsm::normal_pdf(-1.7), bsm::normal_pdf(1.7), 1e-15);

  return EXIT_SUCCESS;
}
