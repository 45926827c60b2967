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
#ifndef _CONFIG
#define _CONFIG

#include <plog/Log.h>

#include <cstdint>
#include <string>

// metric gating rule inclusion (metric >= min_threshold)
enum class Metric { support = 1, confidence, lift, leverage, conviction, zhangs_metric };

// brute_force: every non-empty proper antecedent of an itemset.
// anti_monotone: level-wise consequent growth, confidence only.
enum class PruneStrategy { brute_force = 1, anti_monotone };

struct numbers {
  plog::Severity log_severity = plog::info;
  std::string log_filename{"apriori.log"};

  double min_support = 0.02;     // slider range 0.01 - 0.1
  double min_confidence = 0.40;  // slider range 0.1 - 1.0
  Metric metric = Metric::confidence;
  uint16_t max_len = 0;  // 0 means no cap on itemset size
  PruneStrategy prune_strategy = PruneStrategy::anti_monotone;

  uint16_t top_items = 10;
  uint16_t preview_rows = 20;
};

#endif
