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
#ifndef _ENCODER
#define _ENCODER

#include <string>
#include <unordered_map>
#include <vector>

#include "errors.h"
using namespace std;

typedef vector<vector<bool>> BoolMatrix;

class TransactionEncoder {
 private:
  vector<string> columns;              // sorted, distinct item labels
  unordered_map<string, int> item_map;  // label --> column index

 public:
  TransactionEncoder();
  ~TransactionEncoder();

  void fit(const vector<vector<string>>&);
  BoolMatrix transform(const vector<vector<string>>&) const;
  BoolMatrix fit_transform(const vector<vector<string>>&);
  vector<vector<string>> inverse_transform(const BoolMatrix&) const;

  const vector<string>& get_columns() const;
  int get_column(const string&) const;  // -1 if unseen
};

#endif
