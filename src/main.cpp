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
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "apriori.h"
#include "dataset.h"
#include "network.h"

using namespace std;

static void usage() {
  cout << "usage: cafe_apriori <orders.csv> [min_support] [min_confidence] "
          "[max_len] [-v] [--metric name] [--dot file]"
       << endl;
}

static uint16_t parse_max_len(const string& arg) {
  long value = stol(arg);
  if (value < 0 || value > UINT16_MAX)
    throw invalid_argument("max_len must be in [0, " + to_string(UINT16_MAX) +
                           "], got " + arg);
  return (uint16_t)value;
}

static string join(const vector<string>& items, const string& sep) {
  string ret;
  for (size_t i = 0; i < items.size(); i++) {
    if (i > 0) ret += sep;
    ret += items[i];
  }
  return ret;
}

static void print_preview(const OrderTable& table, size_t rows) {
  cout << endl << "== Dataset Preview" << endl;
  cout << join(table.header, "\t") << endl;
  for (size_t i = 0; i < table.records.size() && i < rows; i++)
    cout << join(table.records[i].fields, "\t") << endl;
}

static void print_itemsets(const CPPApriori& apriori) {
  cout << endl << "== Frequent Itemsets" << endl;
  if (apriori.get_frequent_itemsets().empty()) {
    cout << "no frequent itemsets at this minimum support" << endl;
    return;
  }
  cout << "support\titemsets" << endl;
  apriori.print_itemsets(cout);
}

static void print_rules(const CPPApriori& apriori) {
  cout << endl << "== Association Rules" << endl;
  vector<Rule> rules = apriori.get_rules();
  if (rules.empty()) {
    cout << "no association rules at these thresholds" << endl;
    return;
  }
  stable_sort(rules.begin(), rules.end(), [](const Rule& lhs, const Rule& rhs) {
    return lhs.get_lift() > rhs.get_lift();
  });
  const vector<string>& columns = apriori.get_columns();
  cout << "antecedents\tconsequents\tsupport\tconfidence\tlift" << endl;
  for (auto& rule : rules) {
    vector<string> antecedent, consequent;
    for (auto x : rule.get_antecedent()) antecedent.push_back(columns[x]);
    for (auto x : rule.get_consequent()) consequent.push_back(columns[x]);
    cout << "{" << join(antecedent, ", ") << "}\t{" << join(consequent, ", ")
         << "}\t" << fixed << setprecision(4) << rule.get_support() << "\t"
         << rule.get_confidence() << "\t" << rule.get_lift() << endl;
  }
}

static void print_top_items(const OrderTable& table, size_t n) {
  cout << endl << "== Top " << n << " Most Ordered Coffee Items" << endl;
  vector<pair<string, int>> items = top_items(table.records, n);
  if (items.empty()) return;
  size_t width = 0;
  for (auto& p : items) width = max(width, p.first.size());
  int max_count = items[0].second;
  for (auto& p : items) {
    int bar = max_count > 0 ? (40 * p.second) / max_count : 0;
    cout << left << setw(width) << p.first << " | " << string(bar, '#') << " "
         << p.second << endl;
  }
}

static void print_network(const CPPApriori& apriori, const string& dot_file) {
  cout << endl << "== Association Rules Network" << endl;
  RuleNetwork network;
  network.add_rules(apriori.get_rules(), apriori.get_columns());
  if (network.empty()) {
    cout << "no edges to draw" << endl;
    return;
  }
  if (dot_file.empty()) {
    for (auto& p : network.get_edges())
      cout << p.first.first << " -> " << p.first.second << " (lift "
           << fixed << setprecision(4) << p.second << ")" << endl;
    return;
  }
  ofstream fout(dot_file);
  if (!fout) throw DatasetError("could not write " + dot_file);
  network.write_dot(fout);
  cout << network.get_nodes().size() << " nodes, "
       << network.get_edges().size() << " edges written to " << dot_file
       << endl;
}

int main(int argc, char* argv[]) {
  /* Input example: ./cafe_apriori cafe_order_dataset.csv 0.02 0.4
   * positional arguments after the file override min_support,
   * min_confidence and max_len, in that order. */
  struct numbers config;
  string filename, dot_file;
  bool verbose = false;
  vector<string> positional;

  try {
    for (int i = 1; i < argc; i++) {
      string arg = argv[i];
      if (arg == "-v") {
        verbose = true;
      } else if (arg == "--dot" || arg == "--metric") {
        if (i + 1 >= argc) {
          cout << arg << " needs a value! terminating..." << endl;
          usage();
          return 1;
        }
        if (arg == "--dot")
          dot_file = argv[++i];
        else
          config.metric = parse_metric(argv[++i]);
      } else if (arg == "-h" || arg == "--help") {
        usage();
        return 0;
      } else {
        positional.push_back(arg);
      }
    }
    if (positional.empty()) {
      cout << "filename not provided! terminating..." << endl;
      usage();
      return 1;
    } else if (positional.size() > 4) {
      cout << "too many arguments! terminating..." << endl;
      usage();
      return 1;
    }
    filename = positional[0];
    if (positional.size() > 1) config.min_support = stod(positional[1]);
    if (positional.size() > 2) config.min_confidence = stod(positional[2]);
    if (positional.size() > 3) config.max_len = parse_max_len(positional[3]);

    CPPApriori apriori(config);
    if (verbose) {
      static plog::ConsoleAppender<plog::TxtFormatter> console_appender;
      plog::get()->addAppender(&console_appender);
    }

    DatasetCache cache;
    shared_ptr<const OrderTable> table = cache.get(filename);
    vector<vector<string>> transactions = group_transactions(table->records);

    auto p = apriori.fit(transactions);
    cout << "transactions: " << transactions.size()
         << " items: " << apriori.get_columns().size()
         << " frequent itemsets: " << p.first << " rules: " << p.second
         << endl;

    print_preview(*table, config.preview_rows);
    print_itemsets(apriori);
    print_rules(apriori);
    print_top_items(*table, config.top_items);
    print_network(apriori, dot_file);
  } catch (exception& e) {
    cout << "Exception: " << e.what() << endl;
    return 1;
  }
  return 0;
}
