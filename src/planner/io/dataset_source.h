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
#include <optional>
#include <string>
#include <vector>

#include "src/planner/io/source_cache.h"
#include "src/planner/io/source_handle.h"
#include "src/planner/io/storage_reader.h"
#include "src/planner/ir/predicate.h"
#include "src/planner/meta/divisions.h"

namespace tessera {
namespace planner {

// The fragments a read touches, one partition each.
struct DatasetPlan {
  std::vector<FragmentInfo> fragments;
  // Unknown(1) with a single empty partition when every fragment was pruned.
  Divisions divisions;
};
using DatasetPlanPtr = std::shared_ptr<const DatasetPlan>;

/**
 * @brief The source of ReadDataset: a StorageReader, its schema and a cache of plans.
 *
 * Plans are keyed by (filters, index, calculate_divisions) so that rewriting a read with a
 * different column projection never lists the fragments again.
 */
class DatasetSource : public SourceHandle {
 public:
  static StatusOr<std::shared_ptr<const DatasetSource>> Open(
      std::shared_ptr<const StorageReader> reader,
      int64_t cache_capacity = FLAGS_source_cache_capacity);

  std::string token() const override { return reader_->token(); }
  const std::vector<ColumnSchema>& schema() const { return schema_; }

  // The frame a read produces: every column, with the index column moved to the index.
  StatusOr<Meta> FrameMeta(const std::optional<std::string>& index) const;

  StatusOr<DatasetPlanPtr> Plan(const PredicateList& filters,
                                const std::optional<std::string>& index,
                                bool calculate_divisions) const;

  int64_t plans_computed() const { return plans_computed_; }

  // Public for std::make_shared.
  DatasetSource(std::shared_ptr<const StorageReader> reader, std::vector<ColumnSchema> schema,
                int64_t cache_capacity);

 private:
  struct PlanKey {
    PredicateList filters;
    std::optional<std::string> index;
    bool calculate_divisions = true;
    std::string fingerprint;

    bool operator<(const PlanKey& other) const { return fingerprint < other.fingerprint; }
  };

  StatusOr<DatasetPlanPtr> ComputePlan(const PlanKey& key) const;

  std::shared_ptr<const StorageReader> reader_;
  std::vector<ColumnSchema> schema_;
  mutable std::atomic<int64_t> plans_computed_{0};
  mutable SourceCache<PlanKey, StatusOr<DatasetPlanPtr>> plans_;
};

}  // namespace planner
}  // namespace tessera
