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
#ifndef _NODE
#define _NODE

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <vector>
using namespace std;

/* prefix tree over ascending column indices. a node at depth k stands for the
 * itemset spelled by the path from the root, count is its support count. */
class Node {
 private:
  vector<int> children_ids;
  vector<Node*> children_nodes;

  uint32_t count;

 public:
  Node();
  Node(const Node&) = delete;
  Node& operator=(const Node&) = delete;
  ~Node();

  uint32_t get_count() const;
  void add_count(uint32_t);
  void increase_count();
  const vector<int>& get_children() const;
  Node* get_child(const int&) const;
  bool has_child(const int&) const;
  Node* add_child(int);
  void remove_child(int);

  // walk items from this node, skipping ignore_index (-1: skip nothing)
  const Node* get_path(const vector<int>&, int ignore_index = -1) const;
  Node* insert_path(const vector<int>&);
  void shrink_vectors();
};

#endif
