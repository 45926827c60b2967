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
#include "encoder.h"

#include <algorithm>
#include <set>
using namespace std;

TransactionEncoder::TransactionEncoder() {}

TransactionEncoder::~TransactionEncoder() {}

void TransactionEncoder::fit(const vector<vector<string>> &transactions) {
  /* build the column universe: every distinct label, lexicographic order */
  set<string> universe;
  for (size_t t = 0; t < transactions.size(); t++) {
    for (auto &item : transactions[t]) {
      if (item.empty())
        throw InvalidTransaction("empty item label in transaction " +
                                 to_string(t));
      universe.insert(item);
    }
  }

  this->columns.assign(universe.begin(), universe.end());
  this->item_map.clear();
  for (size_t i = 0; i < this->columns.size(); i++)
    this->item_map[this->columns[i]] = i;
}

BoolMatrix TransactionEncoder::transform(
    const vector<vector<string>> &transactions) const {
  /* one row per transaction, duplicates collapse to a single true cell.
   * labels unseen at fit time have no column and are skipped. */
  BoolMatrix matrix(transactions.size(),
                    vector<bool>(this->columns.size(), false));
  for (size_t t = 0; t < transactions.size(); t++) {
    for (auto &item : transactions[t]) {
      if (item.empty())
        throw InvalidTransaction("empty item label in transaction " +
                                 to_string(t));
      auto p = this->item_map.find(item);
      if (p != this->item_map.end()) matrix[t][p->second] = true;
    }
  }
  return matrix;
}

BoolMatrix TransactionEncoder::fit_transform(
    const vector<vector<string>> &transactions) {
  fit(transactions);
  return transform(transactions);
}

vector<vector<string>> TransactionEncoder::inverse_transform(
    const BoolMatrix &matrix) const {
  vector<vector<string>> ret;
  for (size_t t = 0; t < matrix.size(); t++) {
    if (matrix[t].size() != this->columns.size())
      throw InvalidTransaction("row " + to_string(t) + " has " +
                               to_string(matrix[t].size()) +
                               " columns, expected " +
                               to_string(this->columns.size()));
    vector<string> temp;
    for (size_t i = 0; i < matrix[t].size(); i++)
      if (matrix[t][i]) temp.push_back(this->columns[i]);
    ret.push_back(temp);
  }
  return ret;
}

const vector<string> &TransactionEncoder::get_columns() const {
  return this->columns;
}

int TransactionEncoder::get_column(const string &item) const {
  auto p = this->item_map.find(item);
  if (p == this->item_map.end()) return -1;
  return p->second;
}
