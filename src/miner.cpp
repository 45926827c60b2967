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
#include "miner.h"

#include <plog/Log.h>

#include <algorithm>
#include <stdexcept>
#include <string>
using namespace std;

void AprioriMiner::check_min_support(double min_support) {
  // written as a negation so that NaN is rejected as well
  if (!(min_support > 0.0 && min_support <= 1.0))
    throw InvalidThreshold("min_support must be in (0, 1], got " +
                           to_string(min_support));
}

AprioriMiner::AprioriMiner(double min_support, uint16_t max_len) {
  check_min_support(min_support);
  this->min_support = min_support;
  this->max_len = max_len;
  this->d_size = 0;
  this->n_columns = 0;
}

AprioriMiner::~AprioriMiner() {}

double AprioriMiner::get_min_support() const { return this->min_support; }

uint16_t AprioriMiner::get_max_len() const { return this->max_len; }

/* Dataset preparation */
void AprioriMiner::preprocess_data(const BoolMatrix &matrix) {
  /* convert each boolean row to the ascending list of its present columns */
  vector<vector<int>> temp_transactions;
  size_t width = matrix.empty() ? 0 : matrix[0].size();
  for (size_t t = 0; t < matrix.size(); t++) {
    if (matrix[t].size() != width)
      throw InvalidTransaction("row " + to_string(t) + " has " +
                               to_string(matrix[t].size()) +
                               " columns, expected " + to_string(width));
    vector<int> temp;
    for (size_t i = 0; i < width; i++)
      if (matrix[t][i]) temp.push_back(i);
    temp_transactions.push_back(temp);
  }

  this->transactions = temp_transactions;
  this->d_size = matrix.size();
  this->n_columns = width;
}

FrequentItemsets AprioriMiner::mine(const BoolMatrix &matrix) {
  /* args:
   * 	matrix: one row per transaction, one column per item
   * return:
   * 	every itemset with support >= min_support, grouped by size
   */
  preprocess_data(matrix);

  FrequentItemsets ret(this->d_size);
  if (this->d_size == 0 || this->n_columns == 0) {
    PLOG_WARNING << "empty universe (" << this->d_size << " transactions, "
                 << this->n_columns << " items), nothing to mine";
    return ret;
  }

  vector<vector<int>> candidates;
  for (size_t i = 0; i < this->n_columns; i++)
    candidates.push_back(vector<int>(1, i));

  vector<vector<int>> level;
  size_t k = 1;
  while (!candidates.empty()) {
    vector<int> counts = count_support(candidates);

    level.clear();
    for (size_t i = 0; i < candidates.size(); i++) {
      double support = (double)counts[i] / this->d_size;
      if (support >= this->min_support) {
        ret.add(Itemset(candidates[i], counts[i], support));
        level.push_back(candidates[i]);
      }
    }
    PLOG_INFO << k << " ---candidates: " << candidates.size()
              << " frequent: " << level.size();

    if (level.empty()) break;
    if (this->max_len > 0 && k >= this->max_len) break;
    if (k >= this->n_columns) break;

    vector<vector<int>> joined = generate_candidates(level);
    candidates = prune_candidates(joined, level);
    PLOG_INFO << k + 1 << " ---joined: " << joined.size()
               << " pruned: " << joined.size() - candidates.size();
    k++;
  }
  return ret;
}

vector<vector<int>> AprioriMiner::generate_candidates(
    const vector<vector<int>> &level) {
  vector<vector<int>> sorted_level(level);
  sort(sorted_level.begin(), sorted_level.end());

  vector<vector<int>> ret;
  for (size_t i = 0; i < sorted_level.size(); i++) {
    const vector<int> &a = sorted_level[i];
    if (a.empty() || a.size() != sorted_level[0].size())
      throw invalid_argument("itemsets of one level must share a size > 0");
    for (size_t j = i + 1; j < sorted_level.size(); j++) {
      const vector<int> &b = sorted_level[j];
      // sorted, so the shared prefix block ends at the first mismatch
      if (b.size() != a.size() || !equal(a.begin(), a.end() - 1, b.begin()))
        break;
      if (a.back() == b.back()) continue;  // duplicate entry
      vector<int> candidate(a);
      candidate.push_back(b.back());
      ret.push_back(candidate);
    }
  }
  return ret;
}

vector<vector<int>> AprioriMiner::prune_candidates(
    const vector<vector<int>> &candidates, const vector<vector<int>> &level) {
  Node root;
  for (auto &itemset : level) root.insert_path(itemset);

  vector<vector<int>> ret;
  for (auto &candidate : candidates) {
    bool is_valid = true;
    for (size_t ignore_index = 0; ignore_index < candidate.size();
         ignore_index++) {
      if (root.get_path(candidate, ignore_index) == NULL) {
        is_valid = false;
        break;
      }
    }
    if (is_valid) ret.push_back(candidate);
  }
  return ret;
}

/* Support counting */
vector<int> AprioriMiner::count_support(
    const vector<vector<int>> &candidates) const {
  vector<int> ret(candidates.size(), 0);
  if (candidates.empty()) return ret;

  Node root;
  vector<Node *> leaves;
  uint16_t max_depth = candidates[0].size();
  for (auto &candidate : candidates) {
    if (candidate.size() != max_depth)
      throw invalid_argument("candidates of one level must share a size");
    vector<int> temp(candidate);
    sort(temp.begin(), temp.end());
    leaves.push_back(root.insert_path(temp));
  }
  root.shrink_vectors();

  for (size_t i = 0; i < this->transactions.size(); i++)
    step_traverse(this->transactions[i], &root, 0, max_depth, 0);

  for (size_t i = 0; i < leaves.size(); i++) ret[i] = leaves[i]->get_count();
  return ret;
}

void AprioriMiner::step_traverse(const vector<int> &transaction,
                                 Node *current_node, uint16_t current_depth,
                                 const uint16_t &max_depth,
                                 size_t index) const {
  /* process one transaction, counting every candidate leaf it contains */
  if (current_depth == max_depth) {
    current_node->increase_count();
    return;
  }

  // stop once too few items remain to reach max_depth
  for (size_t i = index;
       i + (max_depth - current_depth) <= transaction.size(); i++) {
    Node *next_node = current_node->get_child(transaction[i]);
    if (next_node != NULL)
      step_traverse(transaction, next_node, current_depth + 1, max_depth,
                    i + 1);
  }
}
