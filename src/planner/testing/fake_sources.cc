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


#include "src/planner/testing/fake_sources.h"

namespace tessera {
namespace planner {
namespace testutils {

void FakeStorage::AddFragment(const std::string& path, TestFrame rows, bool with_statistics,
                              bool with_num_rows) {
  FragmentInfo info;
  info.path = path;
  if (with_num_rows) {
    info.num_rows = rows.num_rows();
  }
  if (with_statistics && rows.num_rows() > 0) {
    for (size_t c = 0; c < rows.columns.size(); ++c) {
      FragmentStatistics stats{rows.data[c][0], rows.data[c][0]};
      for (const auto& v : rows.data[c]) {
        if (v.Compare(stats.min).value_or(0) < 0) {
          stats.min = v;
        }
        if (v.Compare(stats.max).value_or(0) > 0) {
          stats.max = v;
        }
      }
      info.statistics[rows.columns[c]] = stats;
    }
  }
  fragments_.push_back(std::move(info));
  rows_[path] = std::move(rows);
}

StatusOr<std::vector<FragmentInfo>> FakeStorage::ListFragments() const {
  ++listings_;
  return fragments_;
}

StatusOr<TestFrame> FakeStorage::Fragment(const std::string& path) const {
  auto it = rows_.find(path);
  if (it == rows_.end()) {
    return error::NotFound("No fragment '$0' in dataset $1", path, token_);
  }
  return it->second;
}

}  // namespace testutils
}  // namespace planner
}  // namespace tessera
