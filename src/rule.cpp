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
#include "rule.h"

#include <algorithm>
#include <limits>
#include <stdexcept>
using namespace std;

Rule::Rule(vector<int> antecedent, vector<int> consequent,
           double antecedent_support, double consequent_support,
           double support) {
  this->antecedent = antecedent;
  this->consequent = consequent;
  this->antecedent_support = antecedent_support;
  this->consequent_support = consequent_support;
  this->support = support;

  // antecedent_support >= support > 0 for any rule drawn from a frequent set
  this->confidence = support / antecedent_support;
  this->lift = this->confidence / consequent_support;
  this->leverage = support - antecedent_support * consequent_support;
  if (this->confidence >= 1.0)
    this->conviction = numeric_limits<double>::infinity();
  else
    this->conviction = (1.0 - consequent_support) / (1.0 - this->confidence);

  double denominator = max(support * (1.0 - antecedent_support),
                           antecedent_support * (consequent_support - support));
  if (denominator == 0.0)
    this->zhangs_metric = 0.0;
  else
    this->zhangs_metric = this->leverage / denominator;
}

const vector<int> &Rule::get_antecedent() const { return this->antecedent; }

const vector<int> &Rule::get_consequent() const { return this->consequent; }

vector<int> Rule::get_items() const {
  vector<int> ret(this->antecedent);
  ret.insert(ret.end(), this->consequent.begin(), this->consequent.end());
  sort(ret.begin(), ret.end());
  return ret;
}

double Rule::get_antecedent_support() const {
  return this->antecedent_support;
}

double Rule::get_consequent_support() const {
  return this->consequent_support;
}

double Rule::get_support() const { return this->support; }

double Rule::get_confidence() const { return this->confidence; }

double Rule::get_lift() const { return this->lift; }

double Rule::get_leverage() const { return this->leverage; }

double Rule::get_conviction() const { return this->conviction; }

double Rule::get_zhangs_metric() const { return this->zhangs_metric; }

double Rule::get_metric(Metric metric) const {
  switch (metric) {
    case Metric::support:
      return this->support;
    case Metric::confidence:
      return this->confidence;
    case Metric::lift:
      return this->lift;
    case Metric::leverage:
      return this->leverage;
    case Metric::conviction:
      return this->conviction;
    case Metric::zhangs_metric:
      return this->zhangs_metric;
  }
  throw invalid_argument("wrong metric provided!");
}

void Rule::print_rule(const vector<string> &columns, ostream &fout) const {
  for (auto x : this->antecedent) fout << columns.at(x) << " ";
  fout << "--> ";
  for (auto x : this->consequent) fout << columns.at(x) << " ";
  fout << "|| " << get_support() << " " << get_confidence() << " "
       << get_lift() << endl;
}

string metric_name(Metric metric) {
  switch (metric) {
    case Metric::support:
      return "support";
    case Metric::confidence:
      return "confidence";
    case Metric::lift:
      return "lift";
    case Metric::leverage:
      return "leverage";
    case Metric::conviction:
      return "conviction";
    case Metric::zhangs_metric:
      return "zhangs_metric";
  }
  throw invalid_argument("wrong metric provided!");
}

Metric parse_metric(const string &name) {
  if (name == "support") return Metric::support;
  if (name == "confidence") return Metric::confidence;
  if (name == "lift") return Metric::lift;
  if (name == "leverage") return Metric::leverage;
  if (name == "conviction") return Metric::conviction;
  if (name == "zhangs_metric") return Metric::zhangs_metric;
  throw invalid_argument("unknown metric: " + name);
}
