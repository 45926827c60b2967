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
#include <ctime>
#include <iostream>
#include <string>
#include <vector>

#include "apriori.h"
#include "dataset.h"

using namespace std;

double min_confidence = 0.4;
double support_step = 0.01;

int check_rules(const CPPApriori& apriori) {
  /* count rules that break the confidence bound or come from an itemset
   * the miner did not report */
  int violations = 0;
  const FrequentItemsets& itemsets = apriori.get_frequent_itemsets();
  for (auto& rule : apriori.get_rules()) {
    if (rule.get_confidence() <= 0.0 || rule.get_confidence() > 1.0)
      violations++;
    if (rule.get_confidence() < min_confidence) violations++;
    if (!itemsets.contains(rule.get_items())) violations++;
  }
  return violations;
}

int main(int argc, char* argv[]) {
  /* Input example: ./apriori_test cafe_order_dataset.csv
   * It will mine the orders from min_support 0.01 to 0.1 and output counts.
   * Alternatively, the sweep bounds could be passed as additional args:
   * ./apriori_test cafe_order_dataset.csv 0.05 0.08 */
  double start_support = 0.01;
  double end_support = 0.1;
  if (argc < 2) {
    cout << "filename not provided! terminating..." << endl;
    return 1;
  } else if (argc > 4) {
    cout << "too many arguments! terminating..." << endl;
    return 1;
  } else if (argc == 3) {
    start_support = stod(argv[2]);
  } else if (argc == 4) {
    start_support = stod(argv[2]);
    end_support = stod(argv[3]);
  }

  clock_t begin = clock();
  int total_itemset_count = 0;
  int total_rule_count = 0;
  int total_violations = 0;
  int runs = 0;
  cout << argv[1] << endl;

  vector<vector<string>> transactions;
  try {
    OrderTable table = load_orders(argv[1]);
    transactions = group_transactions(table.records);
  } catch (exception& e) {
    cout << "Exception: " << e.what() << endl;
    return 1;
  }

  // integer steps so that the last bound is not lost to rounding
  int steps = (int)((end_support - start_support) / support_step + 0.5);
  for (int step = 0; step <= steps; step++) {
    double min_support = start_support + step * support_step;
    try {
      CPPApriori apriori(min_support, min_confidence);
      auto p = apriori.fit(transactions);
      total_itemset_count += p.first;
      total_rule_count += p.second;
      total_violations += check_rules(apriori);
      cout << "min_support " << min_support << ": " << p.first
           << " itemsets, " << p.second << " rules" << endl;
    } catch (exception& e) {
      cout << "Exception: " << e.what() << endl;
      return 1;
    }
    runs++;
  }

  if (runs > 0)
    cout << "Average ITEMSETS/RULES: " << (float)total_itemset_count / runs
         << " " << (float)total_rule_count / runs << endl;
  clock_t end = clock();
  double elapsed_secs = double(end - begin) / CLOCKS_PER_SEC;
  cout << "TIME: " << elapsed_secs << endl << endl;

  if (total_violations > 0) {
    cout << total_violations << " rule violations" << endl;
    return 1;
  }
  return 0;
}
