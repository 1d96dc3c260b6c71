/*
 * Copyright 2018- The Pixie Authors.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 * SPDX-License-Identifier: Apache-2.0
 */


#include "src/planner/io/table_source.h"

#include <algorithm>

namespace tessera {
namespace planner {

TableSource::TableSource(std::shared_ptr<const TableReader> reader, int64_t cache_capacity)
    : reader_(std::move(reader)),
      layouts_([this](LayoutKey key) { return ComputeLayout(key); }, cache_capacity) {
  DCHECK(reader_ != nullptr);
}

std::shared_ptr<const TableLayout> TableSource::Layout(int64_t npartitions, bool sort) const {
  return layouts_[LayoutKey(npartitions, sort)].value();
}

std::shared_ptr<const TableLayout> TableSource::ComputeLayout(LayoutKey key) const {
  auto [npartitions, sort] = key;
  ++layouts_computed_;
  std::vector<types::Scalar> index = reader_->IndexValues();
  auto layout = std::make_shared<TableLayout>();
  if (sort) {
    std::stable_sort(index.begin(), index.end(),
                     [](const Scalar& a, const Scalar& b) { return a.OrderedBefore(b); });
    DivisionLocations locations = SortedDivisionLocations(index, npartitions);
    layout->divisions = std::move(locations.divisions);
    layout->locations = std::move(locations.locations);
  } else {
    // Even chunks in row order. Small tables get fewer partitions.
    int64_t nrows = index.size();
    int64_t chunk = std::max<int64_t>(1, (nrows + npartitions - 1) / npartitions);
    for (int64_t start = 0; start < nrows; start += chunk) {
      layout->locations.push_back(start);
    }
    if (layout->locations.empty()) {
      layout->locations.push_back(0);
    }
    layout->locations.push_back(nrows);
    layout->divisions = Divisions::Unknown(layout->locations.size() - 1);
  }
  VLOG(1) << "Table " << token() << ": " << layout->divisions.npartitions()
          << " partitions for " << npartitions << " requested, sort=" << sort;
  return layout;
}

}  // namespace planner
}  // namespace tessera
