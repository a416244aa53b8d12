#ifndef LINCOMB_HPP
#define LINCOMB_HPP

// Include all library headers here
#include "coefficient_format.hpp"
#include "key_traits.hpp"
#include "lincomb/label.hpp"
#include "lincomb_config.hpp"
#include "sparse_linear_combination.hpp"

// This is the main header file for the lincomb library
// Include this single header to access all functionality

#endif // LINCOMB_HPP
