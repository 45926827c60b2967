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
#ifndef _FIXTURES
#define _FIXTURES

#include <random>
#include <string>
#include <vector>
using namespace std;

// {a,b} {a,b,c} {a} {b,c}
inline vector<vector<string>> scenario_a() {
  return {{"a", "b"}, {"a", "b", "c"}, {"a"}, {"b", "c"}};
}

inline vector<vector<string>> random_transactions(unsigned seed, size_t count,
                                                  size_t items) {
  mt19937 gen(seed);
  bernoulli_distribution present(0.45);
  vector<vector<string>> ret;
  for (size_t t = 0; t < count; t++) {
    vector<string> transaction;
    for (size_t i = 0; i < items; i++)
      if (present(gen)) transaction.push_back(string(1, (char)('a' + i)));
    ret.push_back(transaction);
  }
  return ret;
}

#endif
