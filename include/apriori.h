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
#ifndef _APRIORI
#define _APRIORI

#include <plog/Initializers/RollingFileInitializer.h>
#include <plog/Log.h>

#include <atomic>
#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "config.h"
#include "encoder.h"
#include "errors.h"
#include "itemset.h"
#include "miner.h"
#include "rule.h"
#include "rule_generator.h"
using namespace std;

class CPPApriori {
 private:
  static atomic<uint16_t> debug_counter;
  struct numbers config;

  TransactionEncoder encoder;
  FrequentItemsets frequent_itemsets;
  vector<Rule> rules;

  void init_logging();

 public:
  CPPApriori(double, double, Metric metric = Metric::confidence,
             uint16_t max_len = 0);
  explicit CPPApriori(const struct numbers&);
  CPPApriori();
  ~CPPApriori();

  // encode, mine and derive rules; returns # itemsets, # rules
  pair<int, int> fit(const vector<vector<string>>&);

  const vector<string>& get_columns() const;
  const FrequentItemsets& get_frequent_itemsets() const;
  const vector<Rule>& get_rules() const;
  const struct numbers& get_config() const;

  void print_itemsets(ostream&) const;
  void print_rules(ostream&) const;
};

/* function-call boundary of the core, one step each */
pair<vector<string>, BoolMatrix> encode(const vector<vector<string>>&);
FrequentItemsets mine(const BoolMatrix&, double, uint16_t max_len = 0);
vector<Rule> generate_rules(const FrequentItemsets&, double,
                            Metric metric = Metric::confidence);

#endif
