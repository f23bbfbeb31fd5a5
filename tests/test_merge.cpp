#include "merge_engine.hpp"
#include "slice_engine.hpp"
#include "test_fixtures.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <set>

using namespace gbcore;
using gbcore::test::simulate_genomes;
using gbcore::test::simulate_phenomes;

static std::vector<int> range1(int from, int to) {
  std::vector<int> v;
  for (int i = from; i <= to; ++i) v.push_back(i);
  return v;
}

static Phenomes two_by_one(const std::string& e1, const std::string& e2, const std::string& f,
                           Cell v1, Cell v2) {
  Phenomes y(2, 1);
  y.entries = {e1, e2};
  y.populations = {"pop", "pop"};
  y.features = {f};
  y.value(0, 0) = v1;
  y.value(1, 0) = v2;
  return y;
}

TEST(Merge, SelfMergeIsIdentity) {
  const Phenomes a = simulate_phenomes(9, 4);
  const Phenomes m = merge(a, a, {0.5, 0.5});
  EXPECT_EQ(m.entries, a.entries);
  EXPECT_EQ(m.features, a.features);
  EXPECT_EQ(m.populations, a.populations);
  EXPECT_EQ(m.values, a.values);
  EXPECT_EQ(m.mask, a.mask);

  const Genomes g = simulate_genomes(5, 3);
  EXPECT_TRUE(merge(g, g) == g);
}

TEST(Merge, UnionOfEntriesAndFeatures) {
  const Phenomes src = simulate_phenomes(12, 5);
  const Phenomes a = slice(src, range1(1, 8), range1(1, 3));
  const Phenomes b = slice(src, range1(6, 12), range1(2, 5));
  const Phenomes m = merge(a, b);

  std::set<std::string> ents(a.entries.begin(), a.entries.end());
  ents.insert(b.entries.begin(), b.entries.end());
  std::set<std::string> feas(a.features.begin(), a.features.end());
  feas.insert(b.features.begin(), b.features.end());

  EXPECT_EQ(m.n, static_cast<int>(ents.size()));
  EXPECT_EQ(m.p, static_cast<int>(feas.size()));
  EXPECT_EQ(std::set<std::string>(m.entries.begin(), m.entries.end()), ents);
  EXPECT_EQ(std::set<std::string>(m.features.begin(), m.features.end()), feas);
  EXPECT_TRUE(checkdims(m));

  // first's order, then the second's new names
  EXPECT_EQ(m.entries.front(), "entry_1");
  EXPECT_EQ(m.entries.back(), "entry_12");
  EXPECT_EQ(m.features, (std::vector<std::string>{"trait_1", "trait_2", "trait_3", "trait_4", "trait_5"}));
}

TEST(Merge, OverlappingSlicesLeaveOnlyUncoveredCellsMissing) {
  const Phenomes src = simulate_phenomes(10, 3);
  const Phenomes a = slice(src, range1(1, 7), range1(1, 2));
  const Phenomes b = slice(src, range1(5, 10), range1(2, 3));
  const Phenomes m = merge(a, b);

  ASSERT_EQ(m.n, 10);
  ASSERT_EQ(m.p, 3);
  int n_missing = 0;
  for (const auto& v : m.values) n_missing += v.has_value() ? 0 : 1;
  EXPECT_EQ(n_missing, 7);

  // the merged cells agree with the common source
  for (int i = 0; i < m.n; ++i)
    for (int j = 0; j < m.p; ++j)
      if (m.value(i, j)) EXPECT_EQ(*m.value(i, j), *src.value(i, j));
  // uncovered cells are missing and unusable
  EXPECT_FALSE(m.value(9, 0).has_value());
  EXPECT_FALSE(m.usable(9, 0));
  EXPECT_FALSE(m.value(0, 2).has_value());
}

TEST(Merge, EqualValuesKeepFirstValueAndMask) {
  Phenomes a = two_by_one("e1", "e2", "f", 1.0, 2.0);
  Phenomes b = two_by_one("e1", "e2", "f", 1.0, 2.0);
  a.set_usable(0, 0, false);
  const Phenomes m = merge(a, b, {0.2, 0.8});
  EXPECT_EQ(m.value(0, 0), Cell(1.0));
  EXPECT_FALSE(m.usable(0, 0));
  EXPECT_TRUE(m.usable(1, 0));
}

TEST(Merge, NaNInBothSourcesKeepsFirstMask) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  Phenomes a = two_by_one("e1", "e2", "f", nan, 1.0);
  Phenomes b = two_by_one("e1", "e2", "f", nan, 1.0);
  b.set_usable(0, 0, false);
  const Phenomes m = merge(a, b, {0.5, 0.5});
  ASSERT_TRUE(m.value(0, 0).has_value());
  EXPECT_TRUE(std::isnan(*m.value(0, 0)));
  EXPECT_TRUE(m.usable(0, 0));

  // the other way round the first (unusable) mask wins too
  const Phenomes r = merge(b, a, {0.5, 0.5});
  EXPECT_FALSE(r.usable(0, 0));
}

TEST(Merge, DifferingValuesAreWeighted) {
  const Phenomes a = two_by_one("e1", "e2", "f", 10.0, std::nullopt);
  const Phenomes b = two_by_one("e1", "e2", "f", 20.0, 4.0);
  const Phenomes m = merge(a, b, {0.25, 0.75});
  ASSERT_TRUE(m.value(0, 0).has_value());
  EXPECT_DOUBLE_EQ(*m.value(0, 0), 0.25 * 10.0 + 0.75 * 20.0);
  // exactly one missing -> the present value
  EXPECT_EQ(m.value(1, 0), Cell(4.0));
}

TEST(Merge, MaskVoteFollowsTheHeavierWeight) {
  Phenomes a = two_by_one("e1", "e2", "f", 1.0, 1.0);
  Phenomes b = two_by_one("e1", "e2", "f", 2.0, 2.0);
  a.set_usable(0, 0, false);
  b.set_usable(1, 0, false);

  const Phenomes m = merge(a, b, {0.3, 0.7});
  EXPECT_TRUE(m.usable(0, 0));    // 0.3*0 + 0.7*1
  EXPECT_FALSE(m.usable(1, 0));   // 0.3*1 + 0.7*0

  // 0.5 rounds to even
  const Phenomes tie = merge(a, b, {0.5, 0.5});
  EXPECT_FALSE(tie.usable(0, 0));
  EXPECT_FALSE(tie.usable(1, 0));
}

TEST(Merge, CellsFromOneSourceAreCopied) {
  Phenomes a = two_by_one("e1", "e2", "f1", 1.0, 2.0);
  Phenomes b = two_by_one("e3", "e4", "f2", 3.0, 4.0);
  b.set_usable(1, 0, false);
  const Phenomes m = merge(a, b);
  ASSERT_EQ(m.n, 4);
  ASSERT_EQ(m.p, 2);
  EXPECT_EQ(m.value(0, 0), Cell(1.0));
  EXPECT_EQ(m.value(2, 1), Cell(3.0));
  EXPECT_FALSE(m.usable(3, 1));
  EXPECT_FALSE(m.value(0, 1).has_value());
  EXPECT_FALSE(m.usable(0, 1));
}

TEST(Merge, PopulationConflictsAreMarked) {
  Phenomes a = two_by_one("e1", "e2", "f", 1.0, 2.0);
  Phenomes b = two_by_one("e1", "e3", "f", 1.0, 3.0);
  a.populations = {"north", "north"};
  b.populations = {"south", "east"};
  const Phenomes m = merge(a, b);
  EXPECT_EQ(m.populations, (std::vector<std::string>{"CONFLICT (north, south)", "north", "east"}));
}

TEST(Merge, InvalidWeightsAreRejected) {
  const Phenomes a = simulate_phenomes(3, 2);
  EXPECT_THROW(merge(a, a, {0.5, 0.6}), std::invalid_argument);
  EXPECT_THROW(merge(a, a, {1.0}), std::invalid_argument);
  EXPECT_THROW(merge(a, a, {0.2, 0.3, 0.5}), std::invalid_argument);
  EXPECT_THROW(merge(a, a, {1.5, -0.5}), std::invalid_argument);
  EXPECT_NO_THROW(merge(a, a, {1.0, 0.0}));
}

TEST(Merge, CorruptedInputsAreNamed) {
  const Phenomes good = simulate_phenomes(3, 2);
  Phenomes bad = clone(good);
  bad.features[1] = bad.features[0];

  auto message = [](const Phenomes& x, const Phenomes& y) {
    try {
      merge(x, y);
    } catch (const std::invalid_argument& e) {
      return std::string(e.what());
    }
    return std::string();
  };
  EXPECT_NE(message(bad, bad).find("Both"), std::string::npos);
  EXPECT_NE(message(bad, good).find("first"), std::string::npos);
  EXPECT_NE(message(good, bad).find("second"), std::string::npos);
}

TEST(Merge, EngineMatchesFreeFunction) {
  const Phenomes src = simulate_phenomes(6, 3, 7);
  const Phenomes a = slice(src, range1(1, 4));
  Phenomes b = slice(src, range1(3, 6));
  b.value(0, 0) = -5.0;

  MergeConfig cfg;
  cfg.conflict_resolution = {0.9, 0.1};
  EXPECT_TRUE(MergeEngine(cfg).run(a, b) == merge(a, b, {0.9, 0.1}));
}
