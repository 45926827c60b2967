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
#ifndef _RULE_GENERATOR
#define _RULE_GENERATOR

#include <vector>

#include "config.h"
#include "errors.h"
#include "itemset.h"
#include "rule.h"
using namespace std;

class RuleGenerator {
 private:
  Metric metric;
  double min_threshold;
  PruneStrategy prune_strategy;

  bool is_accepted(const Rule&) const;
  Rule make_rule(const vector<int>&, const vector<int>&,
                 const FrequentItemsets&) const;

 public:
  RuleGenerator(Metric metric = Metric::confidence, double min_threshold = 0.8,
                PruneStrategy prune_strategy = PruneStrategy::anti_monotone);
  ~RuleGenerator();

  vector<Rule> generate(const FrequentItemsets&) const;

  // every non-empty proper subset of the itemset as antecedent
  vector<Rule> rules_brute_force(const Itemset&, const FrequentItemsets&) const;
  // consequents grown level-wise from those whose rule passed
  vector<Rule> rules_anti_monotone(const Itemset&,
                                   const FrequentItemsets&) const;

  Metric get_metric() const;
  double get_min_threshold() const;
  PruneStrategy get_prune_strategy() const;
};

void check_threshold(Metric, double);

#endif
