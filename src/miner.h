/*******************************************************************************
 * Copyright (C) 2020 Mohammad Motallebi
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 ******************************************************************************/
#ifndef _MINER
#define _MINER

#include <cstdint>
#include <vector>

#include "encoder.h"
#include "errors.h"
#include "itemset.h"
#include "node.h"
using namespace std;

class AprioriMiner {
 private:
  double min_support;
  uint16_t max_len;  // 0: unbounded

  vector<vector<int>> transactions;  // present columns per row, ascending
  int d_size;
  size_t n_columns;

  /* Dataset preparation */
  void preprocess_data(const BoolMatrix&);

  /* Support counting */
  void step_traverse(const vector<int>&, Node*, uint16_t, const uint16_t&,
                     size_t) const;

 public:
  AprioriMiner(double min_support, uint16_t max_len = 0);
  ~AprioriMiner();

  FrequentItemsets mine(const BoolMatrix&);

  // throws InvalidThreshold unless the value is in (0, 1]
  static void check_min_support(double);

  // apriori-gen join: pairs of k-1 itemsets sharing their first k-2 items
  static vector<vector<int>> generate_candidates(const vector<vector<int>>&);
  // drop candidates with a (k-1)-subset missing from the previous level
  static vector<vector<int>> prune_candidates(const vector<vector<int>>&,
                                              const vector<vector<int>>&);
  // support counts of candidates over the preprocessed transactions
  vector<int> count_support(const vector<vector<int>>&) const;

  double get_min_support() const;
  uint16_t get_max_len() const;
};

#endif
