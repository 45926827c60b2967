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
#include "apriori.h"

#include <algorithm>
#include <iomanip>
using namespace std;

atomic<uint16_t> CPPApriori::debug_counter(0);

void CPPApriori::init_logging() {
  // the first instance decides where the process logs
  static bool once = [this]() {
    plog::init(this->config.log_severity, this->config.log_filename.c_str(),
               1000000, 1);
    return true;
  }();
  if (false && once)
    ;  // get rid of warning
  PLOG_INFO << "NEW RUN: " << ++CPPApriori::debug_counter;
}

CPPApriori::CPPApriori(double min_support, double min_confidence,
                       Metric metric, uint16_t max_len) {
  init_logging();

  // reject bad thresholds here, before any fit
  AprioriMiner::check_min_support(min_support);
  check_threshold(metric, min_confidence);

  this->config.min_support = min_support;
  this->config.min_confidence = min_confidence;
  this->config.metric = metric;
  this->config.max_len = max_len;
}

CPPApriori::CPPApriori(const struct numbers &config) {
  this->config = config;
  init_logging();

  AprioriMiner::check_min_support(config.min_support);
  check_threshold(config.metric, config.min_confidence);
}

CPPApriori::CPPApriori() { init_logging(); }

CPPApriori::~CPPApriori() {}

pair<int, int> CPPApriori::fit(const vector<vector<string>> &transactions) {
  /* args:
   * 	transactions: item labels per transaction, duplicates allowed
   * return:
   * 	pair<int,int>: # frequent itemsets, # rules
   */
  AprioriMiner miner(this->config.min_support, this->config.max_len);
  RuleGenerator generator(this->config.metric, this->config.min_confidence,
                          this->config.prune_strategy);

  TransactionEncoder temp_encoder;
  BoolMatrix matrix = temp_encoder.fit_transform(transactions);
  PLOG_INFO << "transactions: " << matrix.size()
            << " items: " << temp_encoder.get_columns().size();

  FrequentItemsets temp_itemsets = miner.mine(matrix);
  vector<Rule> temp_rules = generator.generate(temp_itemsets);

  this->encoder = temp_encoder;
  this->frequent_itemsets = temp_itemsets;
  this->rules = temp_rules;

  PLOG_INFO << "frequent itemsets: " << this->frequent_itemsets.size()
            << " rules: " << this->rules.size();
  return pair<int, int>(this->frequent_itemsets.size(), this->rules.size());
}

const vector<string> &CPPApriori::get_columns() const {
  return this->encoder.get_columns();
}

const FrequentItemsets &CPPApriori::get_frequent_itemsets() const {
  return this->frequent_itemsets;
}

const vector<Rule> &CPPApriori::get_rules() const { return this->rules; }

const struct numbers &CPPApriori::get_config() const { return this->config; }

void CPPApriori::print_itemsets(ostream &fout) const {
  /* one itemset per line, support descending: 0.6667	{a, b} */
  vector<Itemset> itemsets = this->frequent_itemsets.get_all();
  stable_sort(itemsets.begin(), itemsets.end(),
              [](const Itemset &lhs, const Itemset &rhs) {
                return lhs.get_support() > rhs.get_support();
              });
  for (auto &itemset : itemsets) {
    vector<string> names = itemset.get_names(get_columns());
    fout << fixed << setprecision(4) << itemset.get_support() << "\t{";
    for (size_t i = 0; i < names.size(); i++)
      fout << (i > 0 ? ", " : "") << names[i];
    fout << "}" << endl;
  }
}

void CPPApriori::print_rules(ostream &fout) const {
  for (auto &rule : this->rules) rule.print_rule(get_columns(), fout);
}

pair<vector<string>, BoolMatrix> encode(
    const vector<vector<string>> &transactions) {
  TransactionEncoder encoder;
  BoolMatrix matrix = encoder.fit_transform(transactions);
  return make_pair(encoder.get_columns(), matrix);
}

FrequentItemsets mine(const BoolMatrix &matrix, double min_support,
                      uint16_t max_len) {
  AprioriMiner miner(min_support, max_len);
  return miner.mine(matrix);
}

vector<Rule> generate_rules(const FrequentItemsets &frequent_itemsets,
                            double min_threshold, Metric metric) {
  RuleGenerator generator(metric, min_threshold);
  return generator.generate(frequent_itemsets);
}
