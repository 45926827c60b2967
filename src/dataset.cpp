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
#include "dataset.h"

#include <plog/Log.h>
#include <sys/stat.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <map>
using namespace std;

vector<string> split_csv_line(const string &line, const char &delim) {
  /* split one line, honouring double-quoted fields ("" is a literal quote) */
  vector<string> ret;
  string token;
  bool in_quotes = false;
  for (size_t i = 0; i < line.size(); i++) {
    char c = line[i];
    if (in_quotes) {
      if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
        token += '"';
        i++;
      } else if (c == '"') {
        in_quotes = false;
      } else {
        token += c;
      }
    } else if (c == '"') {
      in_quotes = true;
    } else if (c == delim) {
      ret.push_back(token);
      token.clear();
    } else if (c != '\r') {
      token += c;
    }
  }
  ret.push_back(token);
  return ret;
}

static bool has_open_quote(const string &line) {
  // "" inside a quoted field adds two, so odd parity means still open
  return count(line.begin(), line.end(), '"') % 2 == 1;
}

static int find_column(const vector<string> &header, const string &name,
                       const string &filename) {
  auto it = find(header.begin(), header.end(), name);
  if (it == header.end())
    throw DatasetError(filename + ": missing column '" + name + "'");
  return distance(header.begin(), it);
}

OrderTable load_orders(const string &filename) {
  ifstream infile;
  infile.open(filename, ios::in);
  if (!infile) {
    throw DatasetError("could not open order data file: " + filename);
  }

  OrderTable table;
  string s;
  if (!getline(infile, s))
    throw DatasetError(filename + ": missing header row");
  table.header = split_csv_line(s);

  int date_index = find_column(table.header, "date", filename);
  int cash_index = find_column(table.header, "cash_type", filename);
  int name_index = find_column(table.header, "coffee_name", filename);

  size_t line_number = 1;
  while (getline(infile, s)) {
    line_number++;
    size_t first_line = line_number;
    // a quoted field may span lines
    string next;
    while (has_open_quote(s) && getline(infile, next)) {
      line_number++;
      s += "\n" + next;
    }
    if (has_open_quote(s))
      throw InvalidTransaction(filename + ":" + to_string(first_line) +
                               ": unterminated quoted field");
    if (s.empty() || s == "\r") continue;
    OrderRecord record;
    record.fields = split_csv_line(s);
    if (record.fields.size() != table.header.size())
      throw InvalidTransaction(filename + ":" + to_string(first_line) +
                               ": expected " + to_string(table.header.size()) +
                               " fields, got " +
                               to_string(record.fields.size()));
    record.date = record.fields[date_index];
    record.cash_type = record.fields[cash_index];
    record.coffee_name = record.fields[name_index];
    if (record.coffee_name.empty())
      throw InvalidTransaction(filename + ":" + to_string(first_line) +
                               ": empty coffee_name");
    transform(record.coffee_name.begin(), record.coffee_name.end(),
              record.coffee_name.begin(),
              [](unsigned char c) { return tolower(c); });
    table.records.push_back(record);
  }

  PLOG_INFO << "loaded " << table.records.size() << " orders from "
            << filename;
  return table;
}

vector<vector<string>> group_transactions(
    const vector<OrderRecord> &records) {
  map<pair<string, string>, vector<string>> groups;
  for (auto &record : records)
    groups[make_pair(record.date, record.cash_type)].push_back(
        record.coffee_name);

  vector<vector<string>> ret;
  for (auto &p : groups) ret.push_back(p.second);
  return ret;
}

vector<pair<string, int>> top_items(const vector<OrderRecord> &records,
                                    size_t n) {
  map<string, int> freqs_map;
  for (auto &record : records) freqs_map[record.coffee_name]++;

  vector<pair<string, int>> ret(freqs_map.begin(), freqs_map.end());
  stable_sort(ret.begin(), ret.end(), [](const auto &lhs, const auto &rhs) {
    return lhs.second > rhs.second;
  });
  if (ret.size() > n) ret.resize(n);
  return ret;
}

DatasetCache::DatasetCache() { this->load_count = 0; }

DatasetCache::~DatasetCache() {}

shared_ptr<const OrderTable> DatasetCache::get(const string &filename) {
  struct stat st;
  if (stat(filename.c_str(), &st) != 0)
    throw DatasetError("could not stat order data file: " + filename);

  auto p = this->entries.find(filename);
  if (p != this->entries.end() && p->second.mtime_sec == st.st_mtim.tv_sec &&
      p->second.mtime_nsec == st.st_mtim.tv_nsec &&
      p->second.size == st.st_size) {
    PLOG_DEBUG << "cache hit: " << filename;
    return p->second.table;
  }

  entry e;
  e.mtime_sec = st.st_mtim.tv_sec;
  e.mtime_nsec = st.st_mtim.tv_nsec;
  e.size = st.st_size;
  e.table = make_shared<OrderTable>(load_orders(filename));
  this->entries[filename] = e;
  this->load_count++;
  return e.table;
}

void DatasetCache::clear() { this->entries.clear(); }

size_t DatasetCache::get_load_count() const { return this->load_count; }
