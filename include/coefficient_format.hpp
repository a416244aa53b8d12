#ifndef COEFFICIENT_FORMAT_HPP
#define COEFFICIENT_FORMAT_HPP

#include <sstream>
#include <string>

#include "lincomb_config.hpp"

namespace lincomb {

/**
 * @brief Formats one real number under a format spec (fmt / Python format mini-language, e.g. ".3f").
 *
 * Throws fmt::format_error if the spec is not valid for a floating point value.
 */
std::string
format_real(const std::string &format_spec, double value);

/**
 * @brief Formats a complex coefficient for use inside a rendered linear combination.
 *
 * The spec is applied separately to the real and imaginary parts. Returns an empty string when
 * both parts render as zero, so rounding for display can hide a term that is still stored.
 *   real only          -> "1.000"
 *   imaginary only     -> "2.000j"
 *   both negative      -> "-(1.000+2.000j)"
 *   signed imaginary   -> "(1.000-2.000j)"
 *   otherwise          -> "(1.000+2.000j)"
 */
std::string
format_coefficient(const std::string &format_spec, const Scalar &coefficient);

// Rendering of an empty combination: the integer 0 under the spec's fill/align/sign/width.
std::string
format_zero(const std::string &format_spec);

// Shortest round-trip text for a coefficient, in Python complex notation: "(1+0j)", "2j", "(-1-2j)".
std::string
repr_coefficient(const Scalar &coefficient);

/**
 * @brief Formats a single "<sign><coefficient>*<key>" term.
 *
 * Returns an empty string for terms whose coefficient renders as zero. Otherwise the result always
 * starts with '+' or '-' so that terms can be concatenated directly.
 */
template<typename V>
std::string
format_term(const std::string &format_spec, const V &vector, const Scalar &coefficient) {
    std::string const coefficient_str = format_coefficient(format_spec, coefficient);
    if (coefficient_str.empty()) { return coefficient_str; }

    std::ostringstream os;
    os << coefficient_str << '*' << vector;
    std::string term = os.str();
    if (term[0] == '+' || term[0] == '-') { return term; }
    return '+' + term;
}

} // namespace lincomb

#endif // COEFFICIENT_FORMAT_HPP
