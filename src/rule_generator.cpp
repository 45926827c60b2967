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
#include "rule_generator.h"

#include <plog/Log.h>

#include <algorithm>
#include <iterator>
#include <string>

#include "miner.h"
using namespace std;

void check_threshold(Metric metric, double min_threshold) {
  /* comparisons are written so that NaN never passes */
  bool is_valid = false;
  switch (metric) {
    case Metric::support:
    case Metric::confidence:
      is_valid = min_threshold > 0.0 && min_threshold <= 1.0;
      break;
    case Metric::lift:
    case Metric::conviction:
      is_valid = min_threshold > 0.0;
      break;
    case Metric::leverage:
      is_valid = min_threshold >= -0.25 && min_threshold <= 0.25;
      break;
    case Metric::zhangs_metric:
      is_valid = min_threshold >= -1.0 && min_threshold <= 1.0;
      break;
  }
  if (!is_valid)
    throw InvalidThreshold("min_threshold " + to_string(min_threshold) +
                           " is out of range for " + metric_name(metric));
}

RuleGenerator::RuleGenerator(Metric metric, double min_threshold,
                             PruneStrategy prune_strategy) {
  check_threshold(metric, min_threshold);
  this->metric = metric;
  this->min_threshold = min_threshold;
  this->prune_strategy = prune_strategy;
}

RuleGenerator::~RuleGenerator() {}

Metric RuleGenerator::get_metric() const { return this->metric; }

double RuleGenerator::get_min_threshold() const {
  return this->min_threshold;
}

PruneStrategy RuleGenerator::get_prune_strategy() const {
  return this->prune_strategy;
}

bool RuleGenerator::is_accepted(const Rule &rule) const {
  return rule.get_metric(this->metric) >= this->min_threshold;
}

Rule RuleGenerator::make_rule(const vector<int> &itemset,
                              const vector<int> &consequent,
                              const FrequentItemsets &frequent_itemsets) const {
  vector<int> antecedent;
  set_difference(itemset.begin(), itemset.end(), consequent.begin(),
                 consequent.end(), back_inserter(antecedent));
  // subsets of a frequent itemset are frequent, so every lookup succeeds
  return Rule(antecedent, consequent, frequent_itemsets.get_support(antecedent),
              frequent_itemsets.get_support(consequent),
              frequent_itemsets.get_support(itemset));
}

vector<Rule> RuleGenerator::generate(
    const FrequentItemsets &frequent_itemsets) const {
  /* args:
   * 	frequent_itemsets: output of the miner, sizes >= 2 yield rules
   * return:
   * 	rules whose metric is >= min_threshold, in itemset order
   */
  // confidence is the only metric that is anti-monotone in the consequent
  bool use_anti_monotone =
      this->prune_strategy == PruneStrategy::anti_monotone &&
      this->metric == Metric::confidence;

  vector<Rule> ret;
  for (size_t k = 2; k <= frequent_itemsets.max_level(); k++) {
    size_t level_rules = 0;
    for (auto &itemset : frequent_itemsets.get_level(k)) {
      vector<Rule> rules = use_anti_monotone
                               ? rules_anti_monotone(itemset, frequent_itemsets)
                               : rules_brute_force(itemset, frequent_itemsets);
      level_rules += rules.size();
      ret.insert(ret.end(), rules.begin(), rules.end());
    }
    PLOG_INFO << k << " ---itemsets: " << frequent_itemsets.get_level(k).size()
              << " rules: " << level_rules;
  }

  if (ret.empty())
    PLOG_WARNING << "no rule reached " << metric_name(this->metric)
                 << " >= " << this->min_threshold;
  return ret;
}

vector<Rule> RuleGenerator::rules_brute_force(
    const Itemset &itemset, const FrequentItemsets &frequent_itemsets) const {
  const vector<int> &items = itemset.get_items();
  vector<Rule> ret;
  for (size_t m = 1; m < items.size(); m++) {
    // walk every selection of m consequent items
    vector<bool> selected(items.size(), false);
    fill(selected.begin(), selected.begin() + m, true);
    do {
      vector<int> consequent;
      for (size_t i = 0; i < items.size(); i++)
        if (selected[i]) consequent.push_back(items[i]);
      Rule rule = make_rule(items, consequent, frequent_itemsets);
      if (is_accepted(rule)) ret.push_back(rule);
    } while (prev_permutation(selected.begin(), selected.end()));
  }
  return ret;
}

vector<Rule> RuleGenerator::rules_anti_monotone(
    const Itemset &itemset, const FrequentItemsets &frequent_itemsets) const {
  /* if X --> Y fails the threshold, so does any rule moving more of X into
   * the consequent, since the antecedent support can only grow. */
  const vector<int> &items = itemset.get_items();
  vector<Rule> ret;

  vector<vector<int>> consequents;
  for (auto x : items) consequents.push_back(vector<int>(1, x));

  while (!consequents.empty() && consequents[0].size() < items.size()) {
    vector<vector<int>> passed;
    for (auto &consequent : consequents) {
      Rule rule = make_rule(items, consequent, frequent_itemsets);
      if (is_accepted(rule)) {
        ret.push_back(rule);
        passed.push_back(consequent);
      }
    }
    if (passed.empty() || passed[0].size() + 1 >= items.size()) break;
    consequents = AprioriMiner::prune_candidates(
        AprioriMiner::generate_candidates(passed), passed);
  }
  return ret;
}
