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


#include "src/planner/io/dataset_source.h"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

namespace tessera {
namespace planner {

namespace {

bool KeepFragment(const FragmentInfo& fragment, const PredicateList& filters) {
  if (fragment.num_rows.has_value() && *fragment.num_rows == 0) {
    return false;
  }
  for (const auto& predicate : filters) {
    auto stats = fragment.statistics.find(predicate.column());
    if (stats == fragment.statistics.end()) {
      continue;
    }
    if (!predicate.MayMatch(stats->second.min, stats->second.max)) {
      return false;
    }
  }
  return true;
}

// Known only when every fragment has index statistics and the ranges are strictly ordered.
Divisions FragmentDivisions(const std::vector<FragmentInfo>& fragments,
                            const std::string& index) {
  int64_t n = fragments.size();
  std::vector<Scalar> values;
  const FragmentStatistics* prev = nullptr;
  for (const auto& fragment : fragments) {
    auto it = fragment.statistics.find(index);
    if (it == fragment.statistics.end()) {
      return Divisions::Unknown(n);
    }
    const FragmentStatistics& stats = it->second;
    auto in_order = stats.min.Compare(stats.max);
    if (!in_order.has_value() || *in_order > 0) {
      return Divisions::Unknown(n);
    }
    if (prev != nullptr) {
      auto cmp = prev->max.Compare(stats.min);
      if (!cmp.has_value() || *cmp >= 0) {
        return Divisions::Unknown(n);
      }
    }
    values.push_back(stats.min);
    prev = &stats;
  }
  values.push_back(prev->max);
  auto divisions = Divisions::Known(std::move(values));
  if (!divisions.ok()) {
    return Divisions::Unknown(n);
  }
  return divisions.ConsumeValueOrDie();
}

}  // namespace

StatusOr<std::shared_ptr<const DatasetSource>> DatasetSource::Open(
    std::shared_ptr<const StorageReader> reader, int64_t cache_capacity) {
  if (reader == nullptr) {
    return error::InvalidArgument("DatasetSource needs a storage reader");
  }
  TESSERA_ASSIGN_OR_RETURN(std::vector<ColumnSchema> schema, reader->ReadManifest());
  return std::make_shared<const DatasetSource>(std::move(reader), std::move(schema),
                                               cache_capacity);
}

DatasetSource::DatasetSource(std::shared_ptr<const StorageReader> reader,
                             std::vector<ColumnSchema> schema, int64_t cache_capacity)
    : reader_(std::move(reader)),
      schema_(std::move(schema)),
      plans_([this](PlanKey key) { return ComputePlan(key); }, cache_capacity) {}

StatusOr<Meta> DatasetSource::FrameMeta(const std::optional<std::string>& index) const {
  if (!index.has_value()) {
    return Meta::MakeFrame(schema_);
  }
  std::vector<ColumnSchema> columns;
  std::optional<IndexSchema> index_schema;
  for (const auto& column : schema_) {
    if (column.name == *index) {
      index_schema = IndexSchema{column.name, column.dtype};
    } else {
      columns.push_back(column);
    }
  }
  if (!index_schema.has_value()) {
    return error::InvalidArgument("Index column '$0' is not in dataset $1", *index, token());
  }
  return Meta::MakeFrame(std::move(columns), *index_schema);
}

StatusOr<DatasetPlanPtr> DatasetSource::Plan(const PredicateList& filters,
                                             const std::optional<std::string>& index,
                                             bool calculate_divisions) const {
  PlanKey key{filters, index, calculate_divisions, ""};
  key.fingerprint = absl::StrCat(
      absl::StrJoin(filters, "&",
                    [](std::string* out, const Predicate& p) { out->append(p.ToString()); }),
      "|", index.value_or(""), "|", index.has_value(), "|", calculate_divisions);
  return plans_[key].value();
}

StatusOr<DatasetPlanPtr> DatasetSource::ComputePlan(const PlanKey& key) const {
  ++plans_computed_;
  for (const auto& predicate : key.filters) {
    bool found = false;
    for (const auto& column : schema_) {
      found |= column.name == predicate.column();
    }
    if (!found) {
      return error::InvalidArgument("Filter column '$0' is not in dataset $1",
                                    predicate.column(), token());
    }
  }
  TESSERA_ASSIGN_OR_RETURN(std::vector<FragmentInfo> fragments, reader_->ListFragments());
  size_t listed = fragments.size();

  auto plan = std::make_shared<DatasetPlan>();
  for (auto& fragment : fragments) {
    if (KeepFragment(fragment, key.filters)) {
      plan->fragments.push_back(std::move(fragment));
    }
  }
  if (plan->fragments.empty()) {
    plan->divisions = Divisions::Unknown(1);
  } else if (key.calculate_divisions && key.index.has_value()) {
    plan->divisions = FragmentDivisions(plan->fragments, *key.index);
  } else {
    plan->divisions = Divisions::Unknown(plan->fragments.size());
  }
  VLOG(1) << "Dataset " << token() << ": kept " << plan->fragments.size() << " of " << listed
          << " fragments, divisions " << plan->divisions;
  return DatasetPlanPtr(std::move(plan));
}

}  // namespace planner
}  // namespace tessera
