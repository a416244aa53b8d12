#include "sparse_linear_combination.hpp"
#include "test_utils.hpp" // Common labels and EXPECT_LINCOMB_EQ
#include <gtest/gtest.h>
#include <map>
#include <string>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

using namespace lincomb;

// Test Fixture for container behaviour
class SparseLinearCombinationTest : public ::testing::Test {
  protected:
    LabelCombination mixed{ { X0, 1.0 }, { Y0, -2.0 }, { Z0, Scalar(0.0, 3.0) } };
};

TEST_F(SparseLinearCombinationTest, DefaultIsZeroVector) {
    LabelCombination const zero;
    EXPECT_TRUE(zero.empty());
    EXPECT_EQ(zero.size(), 0u);
    EXPECT_FALSE(static_cast<bool>(zero));
    EXPECT_TRUE(zero.keys().empty());
}

TEST_F(SparseLinearCombinationTest, ConstructFromInitializerList) {
    EXPECT_EQ(mixed.size(), 3u);
    EXPECT_EQ(mixed[X0], Scalar(1.0, 0.0));
    EXPECT_EQ(mixed[Y0], Scalar(-2.0, 0.0));
    EXPECT_EQ(mixed[Z0], Scalar(0.0, 3.0));
    EXPECT_TRUE(static_cast<bool>(mixed));
}

TEST_F(SparseLinearCombinationTest, ConstructFromMappings) {
    std::map<std::string, double> const ordered = { { "a", 1.5 }, { "b", 0.0 } };
    StringCombination const from_map(ordered);
    EXPECT_EQ(from_map.size(), 1u); // Zero coefficient dropped
    EXPECT_EQ(from_map["a"], Scalar(1.5, 0.0));
    EXPECT_FALSE(from_map.contains("b"));

    std::unordered_map<std::string, Scalar> const hashed = { { "c", Scalar(0.0, -1.0) } };
    StringCombination const from_hashed(hashed);
    EXPECT_EQ(from_hashed["c"], Scalar(0.0, -1.0));
}

TEST_F(SparseLinearCombinationTest, ConstructionOverwritesRepeatedKeys) {
    // Later values replace earlier ones; they are not summed
    std::vector<std::pair<std::string, int>> const terms = { { "x", 1 }, { "y", 5 }, { "x", 2 } };
    StringCombination const c(terms);
    EXPECT_EQ(c.size(), 2u);
    EXPECT_EQ(c["x"], Scalar(2.0, 0.0));

    // A later zero removes the key entirely
    StringCombination const cancelled({ { "x", 1.0 }, { "x", 0.0 } });
    EXPECT_TRUE(cancelled.empty());
    EXPECT_FALSE(cancelled.contains("x"));
}

TEST_F(SparseLinearCombinationTest, FromKeys) {
    auto const ones = StringCombination::from_keys({ "a", "b", "a" }, 1.0);
    EXPECT_EQ(ones.size(), 2u);
    EXPECT_EQ(ones["a"], Scalar(1.0, 0.0));
    EXPECT_EQ(ones["b"], Scalar(1.0, 0.0));

    // Integer coefficient is widened to complex
    std::vector<Label> const labels = { X0, X1 };
    auto const twos = LabelCombination::from_keys(labels, 2);
    EXPECT_EQ(twos[X1], Scalar(2.0, 0.0));

    // Default coefficient is zero, which leaves nothing behind
    auto const zeros = LabelCombination::from_keys(labels);
    EXPECT_TRUE(zeros.empty());
}

TEST_F(SparseLinearCombinationTest, GetReturnsDefaultForMissing) {
    EXPECT_EQ(mixed.get(X0), Scalar(1.0, 0.0));
    EXPECT_EQ(mixed.get(X1), Scalar(0.0, 0.0));
    EXPECT_EQ(mixed.get(X1, Scalar(7.0, 0.0)), Scalar(7.0, 0.0));
    EXPECT_EQ(mixed.get(Y0, Scalar(7.0, 0.0)), Scalar(-2.0, 0.0));
}

TEST_F(SparseLinearCombinationTest, SubscriptReadNeverFails) {
    LabelCombination const zero;
    EXPECT_EQ(zero[X0], Scalar(0.0, 0.0));
    EXPECT_EQ(mixed[X1], Scalar(0.0, 0.0));
    EXPECT_EQ(mixed.size(), 3u); // Reading does not insert
}

TEST_F(SparseLinearCombinationTest, SetStoresAndDeletes) {
    LabelCombination c;
    c.set(X0, 2.0);
    EXPECT_TRUE(c.contains(X0));
    EXPECT_EQ(c[X0], Scalar(2.0, 0.0));

    c.set(X0, Scalar(0.0, -1.0));
    EXPECT_EQ(c[X0], Scalar(0.0, -1.0));

    c.set(X0, 0.0);
    EXPECT_FALSE(c.contains(X0));
    EXPECT_TRUE(c.empty());

    // Zero assignment of an absent key is a no-op
    c.set(Y0, 0.0);
    EXPECT_TRUE(c.empty());
}

TEST_F(SparseLinearCombinationTest, Contains) {
    EXPECT_TRUE(mixed.contains(X0));
    EXPECT_TRUE(mixed.contains(Z0));
    EXPECT_FALSE(mixed.contains(X1));
}

TEST_F(SparseLinearCombinationTest, UpdateOverwrites) {
    StringCombination c({ { "x", 1.0 }, { "y", 1.0 } });
    c.update({ { "x", 2.0 } });
    EXPECT_EQ(c["x"], Scalar(2.0, 0.0));
    EXPECT_EQ(c["y"], Scalar(1.0, 0.0));

    // Overwriting with zero removes the term
    std::map<std::string, double> const removal = { { "y", 0.0 }, { "z", 4.0 } };
    c.update(removal);
    EXPECT_FALSE(c.contains("y"));
    EXPECT_EQ(c["z"], Scalar(4.0, 0.0));
    EXPECT_EQ(c.size(), 2u);

    // Updating from another combination
    StringCombination const other({ { "x", -1.0 } });
    c.update(other);
    EXPECT_EQ(c["x"], Scalar(-1.0, 0.0));
}

TEST_F(SparseLinearCombinationTest, UpdateVersusAddition) {
    StringCombination updated({ { "x", 1.0 } });
    updated.update({ { "x", 2.0 } });
    EXPECT_LINCOMB_EQ(updated, StringCombination({ { "x", 2.0 } }));

    StringCombination added({ { "x", 1.0 } });
    added += StringCombination({ { "x", 2.0 } });
    EXPECT_LINCOMB_EQ(added, StringCombination({ { "x", 3.0 } }));
}

TEST_F(SparseLinearCombinationTest, CleanRemovesNegligibleTerms) {
    LabelCombination c({ { X0, 1e-12 }, { X1, Scalar(0.0, -1e-10) }, { Y0, 0.5 }, { Z0, 1e-3 } });
    EXPECT_EQ(c.size(), 4u);

    c.clean(); // Default tolerance 1e-9
    EXPECT_EQ(c.size(), 2u);
    EXPECT_TRUE(c.contains(Y0));
    EXPECT_TRUE(c.contains(Z0));

    // Boundary is inclusive
    c.clean(1e-3);
    EXPECT_EQ(c.size(), 1u);
    EXPECT_TRUE(c.contains(Y0));

    // clean(0) keeps every nonzero term
    LabelCombination tiny({ { X0, 1e-300 } });
    EXPECT_EQ(tiny.clean(0.0).size(), 1u);
}

TEST_F(SparseLinearCombinationTest, CleanIsChainable) {
    LabelCombination c({ { X0, 1e-12 }, { Y0, 1.0 } });
    LabelCombination const result = c.clean().copy() * 2.0;
    EXPECT_LINCOMB_EQ(result, LabelCombination({ { Y0, 2.0 } }));
}

TEST_F(SparseLinearCombinationTest, EnumerationSkipsZeros) {
    std::vector<Label> const keys = sorted_keys(mixed);
    ASSERT_EQ(keys.size(), 3u);
    EXPECT_EQ(keys[0], X0);
    EXPECT_EQ(keys[1], Y0);
    EXPECT_EQ(keys[2], Z0);

    EXPECT_EQ(mixed.values().size(), 3u);
    for (const auto &value : mixed.values()) { EXPECT_NE(value, Scalar(0.0, 0.0)); }

    int count = 0;
    for (const auto &term : mixed) {
        EXPECT_EQ(term.second, mixed[term.first]);
        ++count;
    }
    EXPECT_EQ(count, 3);

    for (const auto &item : mixed.items()) { EXPECT_EQ(item.second, mixed.get(item.first)); }
}

TEST_F(SparseLinearCombinationTest, ItemsAreSnapshots) {
    LabelCombination c({ { X0, 1.0 }, { Y0, 2.0 } });
    auto const items = c.items();
    c.set(X0, 0.0);
    c.set(Z0, 5.0);
    EXPECT_EQ(items.size(), 2u);
    EXPECT_EQ(c.size(), 2u);
    EXPECT_FALSE(c.contains(X0));
}

TEST_F(SparseLinearCombinationTest, CopyIsIndependent) {
    LabelCombination snapshot = mixed.copy();
    snapshot.set(X0, 0.0);
    snapshot *= 2.0;
    EXPECT_TRUE(mixed.contains(X0));
    EXPECT_EQ(mixed[Y0], Scalar(-2.0, 0.0));
    EXPECT_EQ(snapshot[Y0], Scalar(-4.0, 0.0));
}

TEST_F(SparseLinearCombinationTest, EraseAndClear) {
    EXPECT_EQ(mixed.erase(X0), 1u);
    EXPECT_EQ(mixed.erase(X0), 0u);
    EXPECT_EQ(mixed.size(), 2u);
    mixed.clear();
    EXPECT_TRUE(mixed.empty());
}

TEST_F(SparseLinearCombinationTest, ZeroPaddingDoesNotPersist) {
    LabelCombination padded({ { X0, 0.0 } });
    EXPECT_TRUE(padded.empty());
    EXPECT_EQ(padded[X0], Scalar(0.0, 0.0));
    EXPECT_EQ(padded, LabelCombination());
}

TEST(SparseLinearCombinationKeys, CompositeStandardKeys) {
    // boost::hash covers pairs and tuples, so composite keys work without extra hashers
    using PairKey = std::pair<std::string, int>;
    lincomb::SparseLinearCombination<PairKey> c({ { { "q", 0 }, 1.0 }, { { "q", 1 }, -1.0 } });
    c += lincomb::SparseLinearCombination<PairKey>({ { { "q", 0 }, 1.0 } });
    EXPECT_EQ(c[PairKey("q", 0)], lincomb::Scalar(2.0, 0.0));
    EXPECT_EQ(c.size(), 2u);

    using TupleKey = std::tuple<int, int, int>;
    lincomb::SparseLinearCombination<TupleKey> t;
    t.set(TupleKey(1, 2, 3), 0.5);
    EXPECT_TRUE(t.contains(TupleKey(1, 2, 3)));
    EXPECT_FALSE(t.contains(TupleKey(3, 2, 1)));
}
