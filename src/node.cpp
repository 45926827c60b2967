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
#include "node.h"
using namespace std;

Node::Node() { this->count = 0; }

Node::~Node() {
  for (auto p : this->children_nodes) {
    delete p;
  }
  this->children_ids.clear();
  this->children_nodes.clear();
}

void Node::shrink_vectors() {
  this->children_ids.shrink_to_fit();
  this->children_nodes.shrink_to_fit();
}

uint32_t Node::get_count() const { return this->count; }

void Node::add_count(uint32_t count) { this->count += count; }

void Node::increase_count() { this->count++; }

const vector<int>& Node::get_children() const { return this->children_ids; }

Node* Node::get_child(const int& item) const {
  auto it = find(this->children_ids.begin(), this->children_ids.end(), item);
  if (it == this->children_ids.end()) return NULL;
  return this->children_nodes[distance(this->children_ids.begin(), it)];
}

bool Node::has_child(const int& item) const {
  return find(this->children_ids.begin(), this->children_ids.end(), item) !=
         this->children_ids.end();
}

Node* Node::add_child(int item) {
  Node* child = get_child(item);
  if (child != NULL) return child;
  child = new Node();
  this->children_ids.push_back(item);
  this->children_nodes.push_back(child);
  return child;
}

void Node::remove_child(int item) {
  auto it = find(this->children_ids.begin(), this->children_ids.end(), item);
  if (it == this->children_ids.end()) return;
  auto index = distance(this->children_ids.begin(), it);
  delete this->children_nodes[index];
  this->children_nodes.erase(this->children_nodes.begin() + index);
  this->children_ids.erase(it);
}

const Node* Node::get_path(const vector<int>& items,
                           int ignore_index) const {
  const Node* curr_node = this;
  for (size_t i = 0; i < items.size(); i++) {
    if ((int)i == ignore_index) continue;
    curr_node = curr_node->get_child(items[i]);
    if (curr_node == NULL) return NULL;
  }
  return curr_node;
}

Node* Node::insert_path(const vector<int>& items) {
  Node* curr_node = this;
  for (auto item : items) curr_node = curr_node->add_child(item);
  return curr_node;
}
