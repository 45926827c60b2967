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
#ifndef _ITEMSET
#define _ITEMSET

#include <map>
#include <string>
#include <vector>
using namespace std;

class Itemset {
 private:
  vector<int> items;  // ascending column indices
  int count;          // transactions containing every item
  double support;     // count / number of transactions

 public:
  Itemset(vector<int>, int, double);

  const vector<int>& get_items() const;
  size_t size() const;
  int get_count() const;
  double get_support() const;
  vector<string> get_names(const vector<string>&) const;
};

/* frequent itemsets grouped by size, with an itemset --> support lookup */
class FrequentItemsets {
 private:
  map<size_t, vector<Itemset>> levels;
  map<vector<int>, double> supports;
  int d_size;

 public:
  FrequentItemsets();
  explicit FrequentItemsets(int);

  void add(const Itemset&);
  const vector<Itemset>& get_level(size_t) const;
  vector<Itemset> get_all() const;
  size_t max_level() const;
  size_t size() const;
  bool empty() const;
  int get_transaction_count() const;

  bool contains(const vector<int>&) const;
  double get_support(const vector<int>&) const;
  const map<vector<int>, double>& get_supports() const;
};

#endif
