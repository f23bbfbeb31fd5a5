#include "slice_engine.hpp"
#include "test_fixtures.hpp"

#include <gtest/gtest.h>

using namespace gbcore;
using gbcore::test::simulate_genomes;
using gbcore::test::simulate_phenomes;

TEST(Slice, AllIndicesEqualsClone) {
  const Phenomes y = simulate_phenomes(8, 4);
  std::vector<int> rows{1, 2, 3, 4, 5, 6, 7, 8};
  std::vector<int> cols{1, 2, 3, 4};
  EXPECT_TRUE(slice(y, rows, cols) == clone(y));
  EXPECT_TRUE(slice(y) == clone(y));

  const Genomes g = simulate_genomes(5, 3);
  EXPECT_TRUE(slice(g) == clone(g));
}

TEST(Slice, IndicesAreSortedAndDeduplicated) {
  Phenomes y = simulate_phenomes(6, 3);
  y.set_usable(4, 2, false);
  const Phenomes s = slice(y, std::vector<int>{5, 2, 5, 1}, std::vector<int>{3, 1, 3});

  EXPECT_EQ(s.n, 3);
  EXPECT_EQ(s.p, 2);
  EXPECT_EQ(s.entries, (std::vector<std::string>{"entry_1", "entry_2", "entry_5"}));
  EXPECT_EQ(s.populations, (std::vector<std::string>{"pop_1", "pop_2", "pop_2"}));
  EXPECT_EQ(s.features, (std::vector<std::string>{"trait_1", "trait_3"}));
  EXPECT_EQ(s.value(2, 1), y.value(4, 2));
  EXPECT_FALSE(s.usable(2, 1));
  EXPECT_TRUE(checkdims(s));
}

TEST(Slice, OutputIsIndependentOfInput) {
  const Phenomes y = simulate_phenomes(4, 2);
  Phenomes s = slice(y, std::vector<int>{1, 2});
  s.value(0, 0) = 123.0;
  EXPECT_NE(y.value(0, 0), Cell(123.0));
}

TEST(Slice, OutOfRangeIndicesAreInvalidArguments) {
  const Phenomes y = simulate_phenomes(4, 2);
  EXPECT_THROW(slice(y, std::vector<int>{0}), std::invalid_argument);
  EXPECT_THROW(slice(y, std::vector<int>{5}), std::invalid_argument);
  EXPECT_THROW(slice(y, std::nullopt, std::vector<int>{3}), std::invalid_argument);
  EXPECT_THROW(slice(y, std::nullopt, std::vector<int>{-1}), std::invalid_argument);
}

TEST(Slice, CorruptedInputIsRejected) {
  Phenomes y = simulate_phenomes(4, 2);
  y.populations.push_back("extra");
  EXPECT_THROW(slice(y), std::invalid_argument);
  EXPECT_THROW(filter(y), std::invalid_argument);
}

TEST(Slice, EmptyIndexListSelectsNothing) {
  const Phenomes y = simulate_phenomes(4, 2);
  const Phenomes s = slice(y, std::vector<int>{}, std::nullopt);
  EXPECT_EQ(s.n, 0);
  EXPECT_EQ(s.p, 2);
  EXPECT_TRUE(checkdims(s));
}

TEST(Filter, AllUsableMaskLeavesContainerUnchanged) {
  const Phenomes y = simulate_phenomes(7, 3);
  EXPECT_TRUE(filter(y) == y);
}

TEST(Filter, DropsAnyRowOrColumnWithAFalseCell) {
  Phenomes y = simulate_phenomes(5, 4);
  y.set_usable(1, 2, false);
  y.set_usable(3, 0, false);
  const Phenomes f = filter(y);
  EXPECT_EQ(f.entries, (std::vector<std::string>{"entry_1", "entry_3", "entry_5"}));
  EXPECT_EQ(f.features, (std::vector<std::string>{"trait_2", "trait_4"}));
  EXPECT_TRUE(checkdims(f));
  for (int i = 0; i < f.n; ++i)
    for (int j = 0; j < f.p; ++j) EXPECT_TRUE(f.usable(i, j));
}

TEST(Filter, DecisionUsesTheFullMask) {
  // Row 1 is dropped only because of column 1, which is itself dropped;
  // the row still goes.
  Phenomes y = simulate_phenomes(3, 3);
  y.set_usable(0, 0, false);
  const Phenomes f = filter(y);
  EXPECT_EQ(f.entries, (std::vector<std::string>{"entry_2", "entry_3"}));
  EXPECT_EQ(f.features, (std::vector<std::string>{"trait_2", "trait_3"}));
}

TEST(Filter, SparseMaskCanEmptyTheContainer) {
  Phenomes y = simulate_phenomes(3, 3);
  for (int i = 0; i < 3; ++i) y.set_usable(i, i, false);
  const Phenomes f = filter(y);
  EXPECT_EQ(f.n, 0);
  EXPECT_EQ(f.p, 0);
  EXPECT_TRUE(checkdims(f));
}

TEST(Filter, WorksOnGenomes) {
  Genomes g = simulate_genomes(4, 3);
  g.set_usable(0, 1, false);
  const Genomes f = filter(g);
  EXPECT_EQ(f.n, 3);
  EXPECT_EQ(f.p, 3);
}
