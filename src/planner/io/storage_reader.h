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

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "src/common/base/base.h"
#include "src/planner/meta/meta.h"
#include "src/shared/types/scalar.h"

namespace tessera {
namespace planner {

struct FragmentStatistics {
  types::Scalar min;
  types::Scalar max;
};

// One file (or row group) of a stored dataset.
struct FragmentInfo {
  std::string path;
  // nullopt when the footer does not record it.
  std::optional<int64_t> num_rows;
  // Per column min/max, only for the columns the writer collected statistics for.
  std::map<std::string, FragmentStatistics> statistics;
};

/**
 * @brief Access to a dataset of fragments in a columnar storage format.
 *
 * The planner reads the manifest and fragment footers only; fragment contents are read by
 * the compute backend.
 */
class StorageReader {
 public:
  virtual ~StorageReader() = default;

  virtual std::string token() const = 0;
  virtual StatusOr<std::vector<ColumnSchema>> ReadManifest() const = 0;
  // Fragments in storage order.
  virtual StatusOr<std::vector<FragmentInfo>> ListFragments() const = 0;
};

}  // namespace planner
}  // namespace tessera
