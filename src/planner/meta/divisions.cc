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


#include "src/planner/meta/divisions.h"

#include <algorithm>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

namespace tessera {
namespace planner {

namespace {

bool ScalarLess(const Scalar& lhs, const Scalar& rhs) { return lhs.OrderedBefore(rhs); }

}  // namespace

Divisions Divisions::Unknown(int64_t npartitions) {
  return Divisions(std::vector<Scalar>(npartitions + 1));
}

StatusOr<Divisions> Divisions::Known(std::vector<Scalar> values) {
  if (values.size() < 2) {
    return error::InvalidArgument("Divisions need at least 2 values, got $0", values.size());
  }
  for (size_t i = 0; i < values.size(); ++i) {
    if (values[i].is_null()) {
      return error::InvalidArgument("Known divisions cannot contain None (position $0)", i);
    }
    if (i == 0) {
      continue;
    }
    auto cmp = values[i - 1].Compare(values[i]);
    if (!cmp.has_value()) {
      return error::InvalidArgument("Division values $0 and $1 are not comparable",
                                    values[i - 1].ToString(), values[i].ToString());
    }
    if (cmp.value() > 0) {
      return error::InvalidArgument("Divisions must be non-decreasing, got $0 after $1",
                                    values[i].ToString(), values[i - 1].ToString());
    }
  }
  return Divisions(std::move(values));
}

bool Divisions::known() const {
  return !values_.empty() &&
         std::none_of(values_.begin(), values_.end(), [](const Scalar& v) { return v.is_null(); });
}

Divisions Divisions::Prefix(int64_t n) const {
  n = std::min(n, npartitions());
  return Divisions(std::vector<Scalar>(values_.begin(), values_.begin() + n + 1));
}

Divisions Divisions::Select(const std::vector<int64_t>& partitions) const {
  if (partitions.empty()) {
    return Divisions();
  }
  std::vector<Scalar> values;
  values.reserve(partitions.size() + 1);
  for (int64_t p : partitions) {
    DCHECK_LT(p, npartitions());
    values.push_back(values_[p]);
  }
  values.push_back(values_[partitions.back() + 1]);
  return Divisions(std::move(values));
}

StatusOr<Divisions> Divisions::Shift(const Scalar& delta) const {
  if (!known()) {
    return *this;
  }
  std::vector<Scalar> values;
  values.reserve(values_.size());
  for (const auto& v : values_) {
    TESSERA_ASSIGN_OR_RETURN(Scalar shifted, Scalar::Add(v, delta));
    values.push_back(std::move(shifted));
  }
  return Divisions(std::move(values));
}

std::string Divisions::DebugString() const {
  return absl::StrCat("(", absl::StrJoin(values_, ", ", [](std::string* out, const Scalar& v) {
                        absl::StrAppend(out, v.ToString());
                      }),
                      ")");
}

DivisionLocations SortedDivisionLocations(const std::vector<Scalar>& sorted_values,
                                          int64_t npartitions) {
  int64_t n = sorted_values.size();
  if (n == 0) {
    return {Divisions::Unknown(1), {0, 0}};
  }
  npartitions = std::max<int64_t>(1, npartitions);
  int64_t chunksize = (n + npartitions - 1) / npartitions;

  std::vector<int64_t> locations = {0};
  std::vector<Scalar> values = {sorted_values[0]};
  int64_t pos = 0;
  while (true) {
    int64_t next = pos + chunksize;
    if (next >= n) {
      break;
    }
    const Scalar& boundary = sorted_values[next];
    // Move the cut back to the first row holding the boundary value, or past the run of
    // duplicates when the whole chunk holds one value.
    int64_t cut = std::lower_bound(sorted_values.begin(), sorted_values.end(), boundary,
                                   ScalarLess) -
                  sorted_values.begin();
    if (cut <= pos) {
      cut = std::upper_bound(sorted_values.begin(), sorted_values.end(), boundary, ScalarLess) -
            sorted_values.begin();
    }
    if (cut >= n) {
      break;
    }
    locations.push_back(cut);
    values.push_back(sorted_values[cut]);
    pos = cut;
  }
  locations.push_back(n);
  values.push_back(sorted_values[n - 1]);

  auto divisions_or = Divisions::Known(std::move(values));
  if (!divisions_or.ok()) {
    // Values that do not order (mixed kinds) still split, but the boundaries are unusable.
    VLOG(1) << "Index values do not form valid divisions: " << divisions_or.msg();
    return {Divisions::Unknown(locations.size() - 1), std::move(locations)};
  }
  return {divisions_or.ConsumeValueOrDie(), std::move(locations)};
}

}  // namespace planner
}  // namespace tessera
