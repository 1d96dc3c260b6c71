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


#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "src/planner/io/source_cache.h"
#include "src/planner/io/source_handle.h"
#include "src/planner/io/table_reader.h"
#include "src/planner/meta/divisions.h"

namespace tessera {
namespace planner {

struct TableLayout {
  Divisions divisions;
  // Partition i holds rows [locations[i], locations[i + 1]), counted in index order when
  // the layout is sorted and in row order otherwise.
  std::vector<int64_t> locations;
};

/**
 * @brief The source of FromTable: a TableReader plus a cache of partition layouts.
 */
class TableSource : public SourceHandle {
 public:
  explicit TableSource(std::shared_ptr<const TableReader> reader,
                       int64_t cache_capacity = FLAGS_source_cache_capacity);

  std::string token() const override { return reader_->token(); }
  const Meta& meta() const { return reader_->meta(); }

  // The layout for a partition count, computed on first use.
  std::shared_ptr<const TableLayout> Layout(int64_t npartitions, bool sort) const;

  int64_t layouts_computed() const { return layouts_computed_; }

 private:
  using LayoutKey = std::pair<int64_t, bool>;
  std::shared_ptr<const TableLayout> ComputeLayout(LayoutKey key) const;

  std::shared_ptr<const TableReader> reader_;
  mutable std::atomic<int64_t> layouts_computed_{0};
  mutable SourceCache<LayoutKey, std::shared_ptr<const TableLayout>> layouts_;
};

}  // namespace planner
}  // namespace tessera
