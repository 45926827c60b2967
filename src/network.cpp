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
#include "network.h"

#include <stdexcept>
using namespace std;

RuleNetwork::RuleNetwork() {}

RuleNetwork::~RuleNetwork() {}

void RuleNetwork::add_edge(const string &from, const string &to,
                           double weight) {
  this->nodes.insert(from);
  this->nodes.insert(to);
  // a later edge between the same items replaces the weight
  this->edges[make_pair(from, to)] = weight;
}

void RuleNetwork::add_rules(const vector<Rule> &rules,
                            const vector<string> &columns) {
  for (auto &rule : rules) {
    for (auto a : rule.get_antecedent())
      for (auto c : rule.get_consequent())
        add_edge(columns.at(a), columns.at(c), rule.get_lift());
  }
}

const set<string> &RuleNetwork::get_nodes() const { return this->nodes; }

const map<pair<string, string>, double> &RuleNetwork::get_edges() const {
  return this->edges;
}

double RuleNetwork::get_weight(const string &from, const string &to) const {
  auto p = this->edges.find(make_pair(from, to));
  if (p == this->edges.end())
    throw out_of_range("no edge " + from + " -> " + to);
  return p->second;
}

bool RuleNetwork::empty() const { return this->edges.empty(); }

static string quote(const string &s) {
  string ret = "\"";
  for (auto c : s) {
    if (c == '"' || c == '\\') ret += '\\';
    ret += c;
  }
  return ret + "\"";
}

void RuleNetwork::write_dot(ostream &fout) const {
  fout << "digraph rules {" << endl;
  for (auto &node : this->nodes) fout << "  " << quote(node) << ";" << endl;
  for (auto &p : this->edges)
    fout << "  " << quote(p.first.first) << " -> " << quote(p.first.second)
         << " [weight=" << p.second << ", label=\"" << p.second << "\"];"
         << endl;
  fout << "}" << endl;
}
