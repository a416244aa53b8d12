#ifndef LINCOMB_LABEL_HPP
#define LINCOMB_LABEL_HPP

#include <cstddef>
#include <ostream>
#include <string>
#include <utility> // For std::move

#include <boost/container_hash/hash.hpp>

namespace lincomb {

//-----------------------------------------------------------------------------
// Label Struct
//-----------------------------------------------------------------------------
// Ready-made vector key: a name with an optional non-negative index, printed as "X" or "Z1".
struct Label {
    std::string name;
    int index = -1; // Negative means "no index"

    // Constructor
    Label(std::string n = "", int i = -1)
      : name(std::move(n))
      , index(i) {}

    [[nodiscard]] bool has_index() const { return index >= 0; }

    bool operator==(const Label &other) const { return name == other.name && index == other.index; }
    bool operator!=(const Label &other) const { return !(*this == other); }

    // Order primarily by name, then index, so rendered combinations list X0 X1 ... Y0 ...
    bool operator<(const Label &other) const {
        if (name != other.name) { return name < other.name; }
        return index < other.index;
    }
};

// Found by boost::hash through argument dependent lookup
inline std::size_t
hash_value(const Label &label) {
    std::size_t seed = 0;
    boost::hash_combine(seed, label.name);
    boost::hash_combine(seed, label.index);
    return seed;
}

// Output stream operator for Label
inline std::ostream &
operator<<(std::ostream &os, const Label &label) {
    os << label.name;
    if (label.has_index()) { os << label.index; }
    return os;
}

} // namespace lincomb

#endif // LINCOMB_LABEL_HPP
