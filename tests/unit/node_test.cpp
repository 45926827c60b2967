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
#include <catch2/catch.hpp>

#include <type_traits>

#include "node.h"

TEST_CASE("prefix tree paths", "[node]") {
  Node root;
  Node* leaf = root.insert_path({0, 2, 5});
  root.insert_path({0, 3});

  CHECK(root.get_children() == vector<int>{0});
  CHECK(root.get_path({0, 2, 5}) == leaf);
  CHECK(root.get_path({0, 3}) != nullptr);
  CHECK(root.get_path({2, 5}) == nullptr);
  // skipping index 1 of {0, 9, 3} walks 0 --> 3
  CHECK(root.get_path({0, 9, 3}, 1) == root.get_path({0, 3}));

  // lookups do not hand out mutable nodes
  static_assert(is_same<decltype(root.get_path({0})), const Node*>::value,
                "get_path returns a const node");

  // inserting an existing path reuses its nodes
  CHECK(root.insert_path({0, 2, 5}) == leaf);
}

TEST_CASE("counts and child removal", "[node]") {
  Node root;
  Node* child = root.add_child(4);
  child->increase_count();
  child->add_count(2);
  CHECK(child->get_count() == 3);
  CHECK(root.has_child(4));

  root.remove_child(4);
  CHECK_FALSE(root.has_child(4));
  CHECK(root.get_child(4) == nullptr);
  root.remove_child(7);  // absent, no-op
  CHECK(root.get_children().empty());
}
