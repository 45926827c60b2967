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
#ifndef _ERRORS
#define _ERRORS

#include <stdexcept>
#include <string>

/* min_support / min_threshold outside the valid range of its metric */
class InvalidThreshold : public std::invalid_argument {
 public:
  explicit InvalidThreshold(const std::string& what)
      : std::invalid_argument(what) {}
};

/* empty item label, ragged matrix row, incomplete dataset record */
class InvalidTransaction : public std::invalid_argument {
 public:
  explicit InvalidTransaction(const std::string& what)
      : std::invalid_argument(what) {}
};

/* dataset file cannot be opened or lacks a required column */
class DatasetError : public std::runtime_error {
 public:
  explicit DatasetError(const std::string& what)
      : std::runtime_error(what) {}
};

#endif
