#include "gbcore.hpp"
#include "test_fixtures.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <limits>

using namespace gbcore;
using gbcore::test::simulate_genomes;
using gbcore::test::simulate_phenomes;

TEST(Container, EmptyConstructionHasBlankNamesMissingValuesUsableMask) {
  Phenomes y(3, 2);
  EXPECT_EQ(y.n, 3);
  EXPECT_EQ(y.p, 2);
  EXPECT_EQ(y.entries, std::vector<std::string>(3, ""));
  EXPECT_EQ(y.populations, std::vector<std::string>(3, ""));
  EXPECT_EQ(y.features, std::vector<std::string>(2, ""));
  ASSERT_EQ(y.values.size(), 6u);
  for (const auto& v : y.values) EXPECT_FALSE(v.has_value());
  for (int i = 0; i < 3; ++i)
    for (int j = 0; j < 2; ++j) EXPECT_TRUE(y.usable(i, j));
}

TEST(Container, NegativeDimensionsAreRejected) {
  EXPECT_THROW(Phenomes(-1, 2), std::invalid_argument);
  EXPECT_THROW(Genomes(2, -3), std::invalid_argument);
}

TEST(Container, CheckdimsAcceptsValidContainers) {
  EXPECT_TRUE(checkdims(simulate_phenomes(10, 4)));
  EXPECT_TRUE(checkdims(simulate_genomes(10, 5)));
  EXPECT_TRUE(checkdims(Phenomes(0, 0)));
}

TEST(Container, CheckdimsDetectsEachBrokenInvariant) {
  const Phenomes good = simulate_phenomes(5, 3);

  Phenomes dup_entries = clone(good);
  dup_entries.entries[1] = dup_entries.entries[0];
  EXPECT_FALSE(checkdims(dup_entries));

  Phenomes dup_features = clone(good);
  dup_features.features[2] = dup_features.features[0];
  EXPECT_FALSE(checkdims(dup_features));

  Phenomes short_pops = clone(good);
  short_pops.populations.pop_back();
  EXPECT_FALSE(checkdims(short_pops));

  Phenomes short_values = clone(good);
  short_values.values.pop_back();
  EXPECT_FALSE(checkdims(short_values));

  Phenomes short_mask = clone(good);
  short_mask.mask.pop_back();
  EXPECT_FALSE(checkdims(short_mask));

  Phenomes wrong_n = clone(good);
  wrong_n.n = 4;
  EXPECT_FALSE(checkdims(wrong_n));
}

TEST(Container, CloneIsDeepAndEqual) {
  const Phenomes y = simulate_phenomes(6, 3);
  Phenomes z = clone(y);
  EXPECT_TRUE(z == y);

  z.value(0, 0) = -1.0;
  z.set_usable(1, 1, false);
  z.entries[2] = "changed";
  EXPECT_TRUE(z != y);
  EXPECT_NE(y.value(0, 0), Cell(-1.0));
  EXPECT_TRUE(y.usable(1, 1));
  EXPECT_EQ(y.entries[2], "entry_3");
}

TEST(Container, EqualityTreatsMissingAndNaNAsStates) {
  Phenomes a = simulate_phenomes(3, 2);
  a.value(0, 0) = std::nullopt;
  a.value(1, 1) = std::numeric_limits<double>::quiet_NaN();
  const Phenomes b = clone(a);
  EXPECT_TRUE(a == b);

  Phenomes c = clone(a);
  c.value(0, 0) = std::numeric_limits<double>::quiet_NaN();
  EXPECT_FALSE(a == c);
}

TEST(Container, EqualityComparesMaskAndPopulations) {
  const Phenomes a = simulate_phenomes(3, 2);
  Phenomes b = clone(a);
  b.set_usable(2, 1, false);
  EXPECT_FALSE(a == b);

  Phenomes c = clone(a);
  c.populations[0] = "elsewhere";
  EXPECT_FALSE(a == c);
}

TEST(Container, PhenomesDimensionsCountCellStates) {
  Phenomes y = simulate_phenomes(4, 3);
  y.populations = {"p1", "p1", "p2", "p2"};
  y.value(0, 0) = 0.0;
  y.value(0, 1) = 0.0;
  y.value(1, 0) = std::nullopt;
  y.value(2, 2) = std::numeric_limits<double>::quiet_NaN();
  y.value(3, 0) = std::numeric_limits<double>::infinity();
  y.value(3, 1) = -std::numeric_limits<double>::infinity();

  const auto d = dimensions(y);
  EXPECT_EQ(d.at("n_entries"), 4);
  EXPECT_EQ(d.at("n_populations"), 2);
  EXPECT_EQ(d.at("n_traits"), 3);
  EXPECT_EQ(d.at("n_total"), 12);
  EXPECT_EQ(d.at("n_zeroes"), 2);
  EXPECT_EQ(d.at("n_missing"), 1);
  EXPECT_EQ(d.at("n_nan"), 1);
  EXPECT_EQ(d.at("n_inf"), 2);
}

TEST(Container, DimensionsRejectCorruptedContainers) {
  Phenomes y = simulate_phenomes(4, 3);
  y.features.pop_back();
  EXPECT_THROW(dimensions(y), std::invalid_argument);
}

TEST(Container, TabulariseLaysOutOneRowPerEntry) {
  Phenomes y = simulate_phenomes(3, 2);
  y.value(1, 0) = std::nullopt;
  const Table t = tabularise(y);

  ASSERT_EQ(t.header.size(), 5u);
  EXPECT_EQ(t.header[0], "id");
  EXPECT_EQ(t.header[1], "entries");
  EXPECT_EQ(t.header[2], "populations");
  EXPECT_EQ(t.header[3], "trait_1");
  EXPECT_EQ(t.header[4], "trait_2");
  EXPECT_EQ(t.id, (std::vector<int>{1, 2, 3}));
  EXPECT_EQ(t.entries, y.entries);
  EXPECT_EQ(t.populations, y.populations);
  ASSERT_EQ(t.columns.size(), 2u);
  EXPECT_EQ(t.columns[1][2], y.value(2, 1));
  EXPECT_FALSE(t.columns[0][1].has_value());

  EXPECT_EQ(t.feature_column("trait_2"), 1);
  EXPECT_EQ(t.feature_column("entries"), -1);
  EXPECT_EQ(t.feature_column("nope"), -1);
}

TEST(Container, TraitsAccessorAliasesFeatures) {
  Phenomes y = simulate_phenomes(2, 2);
  traits(y)[0] = "height";
  EXPECT_EQ(y.features[0], "height");
}
