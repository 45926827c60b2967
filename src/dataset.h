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
#ifndef _DATASET
#define _DATASET

#include <sys/types.h>

#include <ctime>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "errors.h"
using namespace std;

struct OrderRecord {
  string date;
  string cash_type;
  string coffee_name;     // lower-cased
  vector<string> fields;  // raw row, in header order
};

struct OrderTable {
  vector<string> header;
  vector<OrderRecord> records;
};

vector<string> split_csv_line(const string&, const char& delim = ',');
OrderTable load_orders(const string&);

// one transaction per (date, cash_type), keys ascending
vector<vector<string>> group_transactions(const vector<OrderRecord>&);
// order count per item, count descending then name ascending
vector<pair<string, int>> top_items(const vector<OrderRecord>&, size_t);

/* loaded tables keyed by path, reloaded when the file's modification time
 * or size changes */
class DatasetCache {
 private:
  struct entry {
    time_t mtime_sec;
    long mtime_nsec;
    off_t size;
    shared_ptr<const OrderTable> table;
  };
  unordered_map<string, entry> entries;
  size_t load_count;

 public:
  DatasetCache();
  ~DatasetCache();

  shared_ptr<const OrderTable> get(const string&);
  void clear();
  size_t get_load_count() const;
};

#endif
