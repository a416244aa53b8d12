#ifndef KEY_TRAITS_HPP
#define KEY_TRAITS_HPP

#include <iterator>    // For std::begin
#include <ostream>     // For the operator<< detection
#include <type_traits> // For std::void_t, std::declval
#include <utility>

#include "lincomb_config.hpp"

namespace lincomb {

// --- Capability detection for vector key types ---
// Keys are opaque: only hashing, equality, ordering (for display) and printing are ever used.

// Trait to check if T supports a == b yielding something convertible to bool
template<typename T, typename = void>
struct is_equality_comparable : std::false_type {};

template<typename T>
struct is_equality_comparable<T, std::void_t<decltype(std::declval<const T &>() == std::declval<const T &>())>>
  : std::is_convertible<decltype(std::declval<const T &>() == std::declval<const T &>()), bool> {};

// Trait to check if T supports a < b (needed to sort keys when rendering)
template<typename T, typename = void>
struct is_less_comparable : std::false_type {};

template<typename T>
struct is_less_comparable<T, std::void_t<decltype(std::declval<const T &>() < std::declval<const T &>())>>
  : std::is_convertible<decltype(std::declval<const T &>() < std::declval<const T &>()), bool> {};

// Trait to check if T can be written to an std::ostream
template<typename T, typename = void>
struct is_ostreamable : std::false_type {};

template<typename T>
struct is_ostreamable<T, std::void_t<decltype(std::declval<std::ostream &>() << std::declval<const T &>())>>
  : std::true_type {};

// Trait to check if R is a range of (key, coefficient) pairs usable to build a combination over V.
// Accepts std::map, std::unordered_map, std::vector<std::pair<...>> and the like.
template<typename R, typename V, typename = void>
struct is_term_range : std::false_type {};

template<typename R, typename V>
struct is_term_range<R,
                     V,
                     std::void_t<decltype(std::begin(std::declval<const R &>())->first),
                                 decltype(std::begin(std::declval<const R &>())->second),
                                 decltype(std::end(std::declval<const R &>()))>>
  : std::bool_constant<std::is_convertible_v<decltype(std::begin(std::declval<const R &>())->first), V> &&
                       std::is_convertible_v<decltype(std::begin(std::declval<const R &>())->second), Scalar>> {};

// Trait to check if R is a plain range of keys (used by from_keys)
template<typename R, typename V, typename = void>
struct is_key_range : std::false_type {};

template<typename R, typename V>
struct is_key_range<R, V, std::void_t<decltype(*std::begin(std::declval<const R &>())), decltype(std::end(std::declval<const R &>()))>>
  : std::is_convertible<decltype(*std::begin(std::declval<const R &>())), V> {};

} // namespace lincomb

#endif // KEY_TRAITS_HPP
