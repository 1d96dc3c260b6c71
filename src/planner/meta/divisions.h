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

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "src/common/base/base.h"
#include "src/shared/types/scalar.h"

namespace tessera {
namespace planner {

using types::Scalar;

/**
 * @brief Partition boundaries of a partitioned collection.
 *
 * Holds npartitions + 1 values. Partition i covers [values[i], values[i + 1]), the last one
 * includes its upper bound. Either every boundary is known and the sequence is
 * non-decreasing, or every boundary is null (unknown).
 */
class Divisions {
 public:
  // Zero partitions.
  Divisions() = default;

  static Divisions Unknown(int64_t npartitions);
  // Fails unless there are at least two non-null, non-decreasing, comparable values.
  static StatusOr<Divisions> Known(std::vector<Scalar> values);

  bool known() const;
  int64_t npartitions() const {
    return values_.empty() ? 0 : static_cast<int64_t>(values_.size()) - 1;
  }
  const std::vector<Scalar>& values() const { return values_; }

  // The first n partitions.
  Divisions Prefix(int64_t n) const;
  // Boundaries of a partition subset. partitions must be ascending and unique.
  Divisions Select(const std::vector<int64_t>& partitions) const;
  // Adds a numeric delta to every known boundary.
  StatusOr<Divisions> Shift(const Scalar& delta) const;

  bool operator==(const Divisions& other) const { return values_ == other.values_; }
  bool operator!=(const Divisions& other) const { return !(*this == other); }

  std::string DebugString() const;

 private:
  explicit Divisions(std::vector<Scalar> values) : values_(std::move(values)) {}

  std::vector<Scalar> values_;
};

inline std::ostream& operator<<(std::ostream& os, const Divisions& divisions) {
  return os << divisions.DebugString();
}

struct DivisionLocations {
  Divisions divisions;
  // Row offsets; partition i holds rows [locations[i], locations[i + 1]).
  std::vector<int64_t> locations;
};

/**
 * @brief Chunks a sorted index into at most npartitions partitions.
 *
 * Rows with equal index values always land in the same partition, so the result may have
 * fewer partitions than requested. Empty input yields one empty partition with unknown
 * divisions.
 */
DivisionLocations SortedDivisionLocations(const std::vector<Scalar>& sorted_values,
                                          int64_t npartitions);

}  // namespace planner
}  // namespace tessera
