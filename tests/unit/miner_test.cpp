////////////////////////////////////////////////////////////////////////////////
// Copyright (C) 2020 Mohammad Motallebi
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
////////////////////////////////////////////////////////////////////////////////
#include <catch2/catch.hpp>

#include <cmath>
#include <limits>

#include "apriori.h"
#include "fixtures.h"

TEST_CASE("scenario A frequent itemsets", "[miner]") {
  auto encoded = encode(scenario_a());
  REQUIRE(encoded.first == vector<string>{"a", "b", "c"});

  FrequentItemsets itemsets = mine(encoded.second, 0.5);

  CHECK(itemsets.size() == 5);
  CHECK(itemsets.get_transaction_count() == 4);
  CHECK(itemsets.get_support({0}) == Approx(0.75));
  CHECK(itemsets.get_support({1}) == Approx(0.75));
  CHECK(itemsets.get_support({2}) == Approx(0.5));
  CHECK(itemsets.get_support({0, 1}) == Approx(0.5));
  CHECK(itemsets.get_support({1, 2}) == Approx(0.5));
  CHECK_FALSE(itemsets.contains({0, 2}));
  CHECK_FALSE(itemsets.contains({0, 1, 2}));

  CHECK(itemsets.get_level(1).size() == 3);
  CHECK(itemsets.get_level(2).size() == 2);
  CHECK(itemsets.get_level(3).empty());
  CHECK(itemsets.max_level() == 2);
  CHECK_THROWS_AS(itemsets.get_support({0, 2}), out_of_range);

  const Itemset& ab = itemsets.get_level(2)[0];
  CHECK(ab.get_items() == vector<int>{0, 1});
  CHECK(ab.get_count() == 2);
  CHECK(ab.get_names(encoded.first) == vector<string>{"a", "b"});
}

TEST_CASE("support threshold is inclusive", "[miner]") {
  // x in 3 of 10 transactions
  vector<vector<string>> transactions(10, vector<string>{"y"});
  for (size_t i = 0; i < 3; i++) transactions[i].push_back("x");
  auto encoded = encode(transactions);

  FrequentItemsets at = mine(encoded.second, 0.3);
  CHECK(at.contains({0}));
  CHECK(at.get_support({0}) == 0.3);

  FrequentItemsets above = mine(encoded.second, nextafter(0.3, 1.0));
  CHECK_FALSE(above.contains({0}));
  CHECK(above.contains({1}));
}

TEST_CASE("invalid min_support is rejected", "[miner]") {
  auto encoded = encode(scenario_a());
  CHECK_THROWS_AS(mine(encoded.second, 0.0), InvalidThreshold);
  CHECK_THROWS_AS(mine(encoded.second, 1.5), InvalidThreshold);
  CHECK_THROWS_AS(mine(encoded.second, -0.1), InvalidThreshold);
  CHECK_THROWS_AS(mine(encoded.second, numeric_limits<double>::quiet_NaN()),
                  InvalidThreshold);
  CHECK_NOTHROW(mine(encoded.second, 1.0));
}

TEST_CASE("empty input mines nothing", "[miner]") {
  auto encoded = encode({});
  CHECK(encoded.first.empty());
  FrequentItemsets itemsets = mine(encoded.second, 0.1);
  CHECK(itemsets.empty());
  CHECK(generate_rules(itemsets, 0.5).empty());

  // transactions without items
  auto blank = encode({{}, {}});
  CHECK(blank.second.size() == 2);
  CHECK(mine(blank.second, 0.1).empty());
}

TEST_CASE("ragged matrix rows are invalid", "[miner]") {
  BoolMatrix matrix{{true, false}, {true}};
  CHECK_THROWS_AS(mine(matrix, 0.5), InvalidTransaction);
}

TEST_CASE("max_len caps itemset size", "[miner]") {
  auto encoded = encode(scenario_a());
  FrequentItemsets itemsets = mine(encoded.second, 0.5, 1);
  CHECK(itemsets.size() == 3);
  CHECK(itemsets.max_level() == 1);
}

TEST_CASE("candidate join and pruning", "[miner]") {
  vector<vector<int>> level{{0, 1}, {0, 2}, {1, 2}, {1, 3}};
  vector<vector<int>> joined = AprioriMiner::generate_candidates(level);
  CHECK(joined == vector<vector<int>>{{0, 1, 2}, {1, 2, 3}});

  // {2,3} is not in the level, so {1,2,3} can not be frequent
  vector<vector<int>> pruned = AprioriMiner::prune_candidates(joined, level);
  CHECK(pruned == vector<vector<int>>{{0, 1, 2}});

  CHECK(AprioriMiner::generate_candidates({{0}, {1}, {2}}) ==
        vector<vector<int>>{{0, 1}, {0, 2}, {1, 2}});
  CHECK(AprioriMiner::generate_candidates({{0, 1}, {2, 3}}).empty());
}

TEST_CASE("support counting over the prefix tree", "[miner]") {
  auto encoded = encode(scenario_a());
  AprioriMiner miner(0.5);
  miner.mine(encoded.second);

  CHECK(miner.count_support({{0, 1}, {0, 2}, {1, 2}}) ==
        vector<int>{2, 1, 2});
  CHECK(miner.count_support({{0, 1, 2}}) == vector<int>{1});
  CHECK(miner.count_support({{2}, {0}}) == vector<int>{2, 3});
}

TEST_CASE("mined supports match exhaustive counting", "[miner]") {
  const size_t items = 6;
  auto encoded = encode(random_transactions(7, 60, items));
  const BoolMatrix& matrix = encoded.second;
  size_t width = encoded.first.size();
  const double min_support = 0.1;

  FrequentItemsets itemsets = mine(matrix, min_support);

  size_t expected = 0;
  for (unsigned mask = 1; mask < (1u << width); mask++) {
    vector<int> itemset;
    for (size_t i = 0; i < width; i++)
      if (mask & (1u << i)) itemset.push_back(i);
    int count = 0;
    for (auto& row : matrix) {
      bool has_all = true;
      for (auto x : itemset) has_all = has_all && row[x];
      if (has_all) count++;
    }
    double support = (double)count / matrix.size();
    if (support >= min_support) {
      expected++;
      REQUIRE(itemsets.contains(itemset));
      CHECK(itemsets.get_support(itemset) == support);
    } else {
      CHECK_FALSE(itemsets.contains(itemset));
    }
  }
  CHECK(itemsets.size() == expected);
}

TEST_CASE("downward closure and support monotonicity", "[miner]") {
  auto encoded = encode(random_transactions(11, 80, 7));
  FrequentItemsets itemsets = mine(encoded.second, 0.05);
  REQUIRE(itemsets.max_level() >= 2);

  for (auto& itemset : itemsets.get_all()) {
    CHECK(itemset.get_support() >= 0.05);
    const vector<int>& items = itemset.get_items();
    for (unsigned mask = 1; mask + 1 < (1u << items.size()); mask++) {
      vector<int> subset;
      for (size_t i = 0; i < items.size(); i++)
        if (mask & (1u << i)) subset.push_back(items[i]);
      REQUIRE(itemsets.contains(subset));
      CHECK(itemsets.get_support(subset) >= itemset.get_support());
    }
  }
}

TEST_CASE("mining is idempotent", "[miner]") {
  auto encoded = encode(random_transactions(3, 50, 6));
  FrequentItemsets first = mine(encoded.second, 0.08);
  FrequentItemsets second = mine(encoded.second, 0.08);
  CHECK(first.get_supports() == second.get_supports());
}
