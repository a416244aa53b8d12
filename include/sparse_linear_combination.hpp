#ifndef SPARSE_LINEAR_COMBINATION_HPP
#define SPARSE_LINEAR_COMBINATION_HPP

#include <algorithm> // For std::sort, std::count_if
#include <cmath>     // For std::abs
#include <complex>
#include <cstddef>
#include <functional> // For std::equal_to
#include <initializer_list>
#include <ostream>
#include <sstream>
#include <stdexcept> // For std::domain_error
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility> // For std::pair
#include <vector>

#include <boost/container_hash/hash.hpp>
#include <boost/iterator/filter_iterator.hpp>

#include "coefficient_format.hpp"
#include "key_traits.hpp"
#include "lincomb_config.hpp"

namespace lincomb {

//-----------------------------------------------------------------------------
// SparseLinearCombination
//-----------------------------------------------------------------------------
// Linear combination of abstract vectors with complex coefficients.
//
// Keys represent the vectors and are treated as opaque labels: two keys are combined only when
// they compare equal, so linearly dependent keys are allowed and never reduced. No entry with an
// exactly zero coefficient survives a public operation. Entries that are merely close to zero are
// only removed by an explicit clean().
template<typename V, typename Hash = boost::hash<V>, typename KeyEqual = std::equal_to<V>>
class SparseLinearCombination {
    static_assert(is_equality_comparable<V>::value, "Vector keys must support operator==");

  public:
    using key_type = V;
    using mapped_type = Scalar;
    using map_type = std::unordered_map<V, Scalar, Hash, KeyEqual>;
    using value_type = typename map_type::value_type;
    using size_type = typename map_type::size_type;

  private:
    struct NonZeroTerm {
        bool operator()(const value_type &term) const { return term.second != Scalar{}; }
    };

  public:
    using const_iterator = boost::filter_iterator<NonZeroTerm, typename map_type::const_iterator>;

    // Default constructor: the zero vector
    SparseLinearCombination() = default;

    // Constructor from a braced list of terms, e.g. {{"a", 1.0}, {"b", Scalar(0, 2)}}.
    // Repeated keys overwrite earlier ones; they are not summed.
    SparseLinearCombination(std::initializer_list<std::pair<V, Scalar>> terms) { update(terms); }

    // Constructor from any mapping or sequence of (key, coefficient) pairs. Last write wins.
    template<typename Range,
             typename = std::enable_if_t<
               std::conjunction_v<std::negation<std::is_same<std::decay_t<Range>, SparseLinearCombination>>,
                                  is_term_range<Range, V>>>>
    explicit SparseLinearCombination(const Range &terms) {
        update(terms);
    }

    // Builds a combination assigning the same coefficient to every key; duplicate keys collapse.
    template<typename KeyRange>
    static SparseLinearCombination from_keys(const KeyRange &vectors, const Scalar &coefficient = Scalar{}) {
        static_assert(is_key_range<KeyRange, V>::value, "from_keys expects a range of vector keys");
        SparseLinearCombination result;
        for (const auto &vector : vectors) { result.entries_.insert_or_assign(vector, coefficient); }
        result.clean(0.0);
        return result;
    }

    static SparseLinearCombination from_keys(std::initializer_list<V> vectors, const Scalar &coefficient = Scalar{}) {
        return from_keys<std::initializer_list<V>>(vectors, coefficient);
    }

    // Independent snapshot of the current terms
    [[nodiscard]] SparseLinearCombination copy() const { return *this; }

    //--- Lookup -----------------------------------------------------------------

    // Coefficient of vector, or default_value if the vector is absent or its coefficient is zero
    [[nodiscard]] Scalar get(const V &vector, const Scalar &default_value = Scalar{}) const {
        auto it = entries_.find(vector);
        if (it == entries_.end() || it->second == Scalar{}) { return default_value; }
        return it->second;
    }

    // Coefficient of vector; absent vectors read as zero. Read-only, write through set().
    const Scalar operator[](const V &vector) const {
        auto it = entries_.find(vector);
        return it == entries_.end() ? Scalar{} : it->second;
    }

    // Subscript assignment. Setting a coefficient to zero removes the term.
    SparseLinearCombination &set(const V &vector, const Scalar &coefficient) {
        if (coefficient != Scalar{}) {
            entries_.insert_or_assign(vector, coefficient);
        } else {
            entries_.erase(vector);
        }
        return *this;
    }

    [[nodiscard]] bool contains(const V &vector) const {
        auto it = entries_.find(vector);
        return it != entries_.end() && it->second != Scalar{};
    }

    // Removes vector regardless of its coefficient. Returns the number of terms removed.
    size_type erase(const V &vector) { return entries_.erase(vector); }

    void clear() noexcept { entries_.clear(); }

    //--- Bulk update ------------------------------------------------------------

    // Overwrites coefficients with those of terms (assignment, not addition), then drops exact zeros.
    template<typename Range>
    SparseLinearCombination &update(const Range &terms) {
        static_assert(is_term_range<Range, V>::value, "update expects a range of (vector, coefficient) pairs");
        for (const auto &term : terms) { entries_.insert_or_assign(term.first, Scalar(term.second)); }
        return clean(0.0);
    }

    SparseLinearCombination &update(std::initializer_list<std::pair<V, Scalar>> terms) {
        return update<std::initializer_list<std::pair<V, Scalar>>>(terms);
    }

    // Removes terms with coefficients of absolute value atol or less.
    // clean(0) removes exact zeros only and is applied after every mutation that can create them.
    SparseLinearCombination &clean(double atol = kDefaultCleanTolerance) {
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (std::abs(it->second) <= atol) {
                it = entries_.erase(it);
            } else {
                ++it;
            }
        }
        return *this;
    }

    //--- Enumeration ------------------------------------------------------------
    // Iteration follows the hash map's order and never yields a zero coefficient.

    const_iterator begin() const { return const_iterator(NonZeroTerm{}, entries_.begin(), entries_.end()); }
    const_iterator end() const { return const_iterator(NonZeroTerm{}, entries_.end(), entries_.end()); }

    [[nodiscard]] std::vector<V> keys() const {
        std::vector<V> result;
        result.reserve(entries_.size());
        for (const auto &term : *this) { result.push_back(term.first); }
        return result;
    }

    [[nodiscard]] std::vector<Scalar> values() const {
        std::vector<Scalar> result;
        result.reserve(entries_.size());
        for (const auto &term : *this) { result.push_back(term.second); }
        return result;
    }

    [[nodiscard]] std::vector<std::pair<V, Scalar>> items() const {
        std::vector<std::pair<V, Scalar>> result;
        result.reserve(entries_.size());
        for (const auto &term : *this) { result.emplace_back(term.first, term.second); }
        return result;
    }

    // Number of terms with nonzero coefficient
    [[nodiscard]] size_type size() const {
        return static_cast<size_type>(std::count_if(entries_.begin(), entries_.end(), NonZeroTerm{}));
    }

    [[nodiscard]] bool empty() const { return size() == 0; }

    // False only for the zero vector
    explicit operator bool() const { return !empty(); }

    //--- Arithmetic -------------------------------------------------------------

    // Vector addition: coefficients of shared keys are summed
    SparseLinearCombination &operator+=(const SparseLinearCombination &other) {
        for (const auto &term : other) { entries_[term.first] += term.second; }
        return clean(0.0);
    }

    SparseLinearCombination &operator-=(const SparseLinearCombination &other) {
        for (const auto &term : other) { entries_[term.first] -= term.second; }
        return clean(0.0);
    }

    SparseLinearCombination &operator*=(const Scalar &scalar) {
        for (auto &term : entries_) { term.second *= scalar; }
        return clean(0.0);
    }

    SparseLinearCombination &operator/=(const Scalar &scalar) {
        if (scalar == Scalar{}) {
            throw std::domain_error("Division by zero scalar in SparseLinearCombination division.");
        }
        return *this *= Scalar(1.0) / scalar;
    }

    SparseLinearCombination operator+(const SparseLinearCombination &other) const {
        SparseLinearCombination result = *this;
        result += other;
        return result;
    }

    SparseLinearCombination operator-(const SparseLinearCombination &other) const {
        SparseLinearCombination result = *this;
        result -= other;
        return result;
    }

    SparseLinearCombination operator-() const {
        SparseLinearCombination result;
        for (const auto &term : *this) { result.entries_.emplace(term.first, -term.second); }
        return result;
    }

    SparseLinearCombination operator*(const Scalar &scalar) const {
        SparseLinearCombination result = *this;
        result *= scalar;
        return result;
    }

    SparseLinearCombination operator/(const Scalar &scalar) const {
        SparseLinearCombination result = *this;
        result /= scalar;
        return result;
    }

    //--- Equality ---------------------------------------------------------------

    // Exact equality over the union of both key sets; absent keys read as zero.
    // Sensitive to floating point error, prefer approx_eq for computed coefficients.
    bool operator==(const SparseLinearCombination &other) const {
        for (const auto &term : *this) {
            if (other[term.first] != term.second) { return false; }
        }
        for (const auto &term : other) {
            if ((*this)[term.first] != term.second) { return false; }
        }
        return true;
    }

    bool operator!=(const SparseLinearCombination &other) const { return !(*this == other); }

    // True if every coefficient differs from the other's by strictly less than atol
    [[nodiscard]] bool approx_eq(const SparseLinearCombination &other, double atol) const {
        for (const auto &term : *this) {
            if (!(std::abs(term.second - other[term.first]) < atol)) { return false; }
        }
        for (const auto &term : other) {
            if (!(std::abs((*this)[term.first] - term.second) < atol)) { return false; }
        }
        return true;
    }

    //--- Rendering --------------------------------------------------------------

    /**
     * @brief Canonical text of the combination, e.g. "1.000*a-2.000*b+(1.000+2.000j)*c".
     *
     * Keys are sorted with operator< and each coefficient is rendered with format_spec (fmt / Python
     * format mini-language). Terms whose coefficient rounds to zero are omitted; an all-zero result
     * renders as 0 under format_spec.
     */
    [[nodiscard]] std::string format(const std::string &format_spec) const {
        static_assert(is_less_comparable<V>::value, "Vector keys must support operator< to be formatted");
        static_assert(is_ostreamable<V>::value, "Vector keys must support operator<< to be formatted");

        std::string result;
        for (const auto &vector : sorted_keys()) { result += format_term(format_spec, vector, (*this)[vector]); }
        if (result.empty()) { return format_zero(format_spec); }
        if (result[0] == '+') { result.erase(0, 1); }
        return result;
    }

    [[nodiscard]] std::string to_string() const { return format(kDefaultFormatSpec); }

    // Debug representation listing the stored coefficients: SparseLinearCombination({a: (1+0j)})
    [[nodiscard]] std::string repr() const {
        static_assert(is_less_comparable<V>::value, "Vector keys must support operator< to be printed");
        static_assert(is_ostreamable<V>::value, "Vector keys must support operator<< to be printed");

        std::ostringstream os;
        os << "SparseLinearCombination({";
        bool first = true;
        for (const auto &vector : sorted_keys()) {
            if (!first) { os << ", "; }
            os << vector << ": " << repr_coefficient((*this)[vector]);
            first = false;
        }
        os << "})";
        return os.str();
    }

  private:
    std::vector<V> sorted_keys() const {
        std::vector<V> result = keys();
        std::sort(result.begin(), result.end());
        return result;
    }

    map_type entries_;
};

//-----------------------------------------------------------------------------
// Free Operators
//-----------------------------------------------------------------------------

// Commutative scalar multiplication (scalar * combination)
template<typename V, typename Hash, typename KeyEqual>
SparseLinearCombination<V, Hash, KeyEqual>
operator*(const Scalar &scalar, const SparseLinearCombination<V, Hash, KeyEqual> &combination) {
    return combination * scalar;
}

template<typename V, typename Hash, typename KeyEqual>
bool
approx_eq(const SparseLinearCombination<V, Hash, KeyEqual> &lhs,
          const SparseLinearCombination<V, Hash, KeyEqual> &rhs,
          double atol = kDefaultApproxTolerance) {
    return lhs.approx_eq(rhs, atol);
}

// Output stream operator, renders with kDefaultFormatSpec
template<typename V, typename Hash, typename KeyEqual>
std::ostream &
operator<<(std::ostream &os, const SparseLinearCombination<V, Hash, KeyEqual> &combination) {
    os << combination.to_string();
    return os;
}

} // namespace lincomb

#endif // SPARSE_LINEAR_COMBINATION_HPP
