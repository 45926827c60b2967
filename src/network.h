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
#ifndef _NETWORK
#define _NETWORK

#include <iostream>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "rule.h"
using namespace std;

/* directed item graph: antecedent item --> consequent item, weighted by lift.
 * layout is left to whoever renders it. */
class RuleNetwork {
 private:
  set<string> nodes;
  map<pair<string, string>, double> edges;

 public:
  RuleNetwork();
  ~RuleNetwork();

  void add_edge(const string&, const string&, double);
  void add_rules(const vector<Rule>&, const vector<string>&);

  const set<string>& get_nodes() const;
  const map<pair<string, string>, double>& get_edges() const;
  double get_weight(const string&, const string&) const;
  bool empty() const;

  void write_dot(ostream&) const;
};

#endif
