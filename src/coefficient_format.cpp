#include "coefficient_format.hpp"

#include <cctype>    // For std::isspace, std::isdigit
#include <cmath>     // For std::signbit
#include <cstdlib>   // For std::strtod
#include <cstring>   // For std::strchr
#include <stdexcept> // For std::invalid_argument

#include <fmt/format.h>

namespace lincomb {

namespace {

// Value of a number produced by format_real(). Leading and trailing whitespace from width/alignment
// is accepted; anything else (fill characters, thousands separators, '%') is rejected.
double
parse_formatted(const std::string &text, const std::string &format_spec) {
    const char *begin = text.c_str();
    char *end = nullptr;
    double const value = std::strtod(begin, &end);
    if (end == begin) {
        throw std::invalid_argument("Format spec '" + format_spec + "' produced non-numeric text '" + text + "'.");
    }
    while (*end != '\0' && std::isspace(static_cast<unsigned char>(*end)) != 0) { ++end; }
    if (*end != '\0') {
        throw std::invalid_argument("Format spec '" + format_spec + "' produced non-numeric text '" + text + "'.");
    }
    return value;
}

bool
is_signed(const std::string &text) {
    return !text.empty() && (text[0] == '+' || text[0] == '-');
}

// Drops the precision and the floating point presentation type, which do not apply to integers.
std::string
integral_spec(const std::string &format_spec) {
    std::string spec = format_spec;
    if (!spec.empty() && std::strchr("aAeEfFgG%", spec.back()) != nullptr) { spec.pop_back(); }

    // A '.' in the first position followed by an alignment character is a fill, not a precision.
    std::size_t search_from = 0;
    if (spec.size() >= 2 && std::strchr("<>^=", spec[1]) != nullptr) { search_from = 2; }
    std::size_t const dot = spec.find('.', search_from);
    if (dot != std::string::npos) {
        std::size_t digits_end = dot + 1;
        while (digits_end < spec.size() && std::isdigit(static_cast<unsigned char>(spec[digits_end])) != 0) {
            ++digits_end;
        }
        spec.erase(dot, digits_end - dot);
    }
    return spec;
}

} // namespace

std::string
format_real(const std::string &format_spec, double value) {
    return fmt::format(fmt::runtime("{:" + format_spec + "}"), value);
}

std::string
format_coefficient(const std::string &format_spec, const Scalar &coefficient) {
    std::string const real_str = format_real(format_spec, coefficient.real());
    std::string const imag_str = format_real(format_spec, coefficient.imag());
    bool const real_is_zero = parse_formatted(real_str, format_spec) == 0.0;
    bool const imag_is_zero = parse_formatted(imag_str, format_spec) == 0.0;

    if (real_is_zero && imag_is_zero) { return ""; }
    if (imag_is_zero) { return real_str; }
    if (real_is_zero) { return imag_str + "j"; }
    if (real_str[0] == '-' && imag_str[0] == '-') {
        return "-(" + real_str.substr(1) + "+" + imag_str.substr(1) + "j)";
    }
    if (is_signed(imag_str)) { return "(" + real_str + imag_str + "j)"; }
    return "(" + real_str + "+" + imag_str + "j)";
}

std::string
format_zero(const std::string &format_spec) {
    return fmt::format(fmt::runtime("{:" + integral_spec(format_spec) + "}"), 0);
}

std::string
repr_coefficient(const Scalar &coefficient) {
    // Positive zero real part prints as a bare imaginary number, like 2j
    if (coefficient.real() == 0.0 && !std::signbit(coefficient.real())) {
        return fmt::format("{}j", coefficient.imag());
    }
    return fmt::format("({}{:+}j)", coefficient.real(), coefficient.imag());
}

} // namespace lincomb
