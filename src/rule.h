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
#ifndef _RULE
#define _RULE

#include <iostream>
#include <string>
#include <vector>

#include "config.h"
using namespace std;

class Rule {
 private:
  vector<int> antecedent;  // ascending column indices
  vector<int> consequent;  // ascending column indices
  double antecedent_support;
  double consequent_support;
  double support;  // support of antecedent + consequent
  double confidence;
  double lift;
  double leverage;
  double conviction;
  double zhangs_metric;

 public:
  Rule(vector<int>, vector<int>, double, double, double);

  const vector<int>& get_antecedent() const;
  const vector<int>& get_consequent() const;
  vector<int> get_items() const;
  double get_antecedent_support() const;
  double get_consequent_support() const;
  double get_support() const;
  double get_confidence() const;
  double get_lift() const;
  double get_leverage() const;
  double get_conviction() const;
  double get_zhangs_metric() const;
  double get_metric(Metric) const;

  void print_rule(const vector<string>&, ostream&) const;
};

string metric_name(Metric);
Metric parse_metric(const string&);

#endif
