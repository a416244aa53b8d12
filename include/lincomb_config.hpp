#ifndef LINCOMB_CONFIG_HPP
#define LINCOMB_CONFIG_HPP

#include <complex>

namespace lincomb {

// Coefficient type of every linear combination. Real inputs are widened to it on entry.
using Scalar = std::complex<double>;

// Format spec used by operator<< and to_string() (fmt / Python format mini-language)
inline constexpr const char *kDefaultFormatSpec = ".3f";

// Default threshold for clean(): terms with |coefficient| <= this are dropped
inline constexpr double kDefaultCleanTolerance = 1e-9;

// Default threshold for approx_eq(): terms must differ by strictly less than this
inline constexpr double kDefaultApproxTolerance = 1e-8;

} // namespace lincomb

#endif // LINCOMB_CONFIG_HPP
