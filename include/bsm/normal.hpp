#pragma once

namespace bsm {

// Abramowitz-Stegun 26.2.17, absolute error below ~1e-7.
double normal_cdf(double x);

double normal_pdf(double x);

}  // namespace bsm
