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
#include "itemset.h"

#include <stdexcept>
using namespace std;

Itemset::Itemset(vector<int> items, int count, double support) {
  this->items = items;
  this->count = count;
  this->support = support;
}

const vector<int>& Itemset::get_items() const { return this->items; }

size_t Itemset::size() const { return this->items.size(); }

int Itemset::get_count() const { return this->count; }

double Itemset::get_support() const { return this->support; }

vector<string> Itemset::get_names(const vector<string>& columns) const {
  vector<string> ret;
  for (auto x : this->items) ret.push_back(columns.at(x));
  return ret;
}

FrequentItemsets::FrequentItemsets() { this->d_size = 0; }

FrequentItemsets::FrequentItemsets(int d_size) { this->d_size = d_size; }

void FrequentItemsets::add(const Itemset& itemset) {
  this->levels[itemset.size()].push_back(itemset);
  this->supports[itemset.get_items()] = itemset.get_support();
}

const vector<Itemset>& FrequentItemsets::get_level(size_t k) const {
  static const vector<Itemset> empty_level;
  auto p = this->levels.find(k);
  if (p == this->levels.end()) return empty_level;
  return p->second;
}

vector<Itemset> FrequentItemsets::get_all() const {
  vector<Itemset> ret;
  for (auto& p : this->levels)
    ret.insert(ret.end(), p.second.begin(), p.second.end());
  return ret;
}

size_t FrequentItemsets::max_level() const {
  if (this->levels.empty()) return 0;
  return this->levels.rbegin()->first;
}

size_t FrequentItemsets::size() const { return this->supports.size(); }

bool FrequentItemsets::empty() const { return this->supports.empty(); }

int FrequentItemsets::get_transaction_count() const { return this->d_size; }

bool FrequentItemsets::contains(const vector<int>& items) const {
  return this->supports.find(items) != this->supports.end();
}

double FrequentItemsets::get_support(const vector<int>& items) const {
  auto p = this->supports.find(items);
  if (p == this->supports.end())
    throw out_of_range("itemset is not frequent");
  return p->second;
}

const map<vector<int>, double>& FrequentItemsets::get_supports() const {
  return this->supports;
}
