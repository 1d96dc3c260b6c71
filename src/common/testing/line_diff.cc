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

#include "src/common/testing/line_diff.h"

#include <algorithm>
#include <utility>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/strings/str_split.h>

namespace tessera {
namespace testing {

namespace {

// Index pairs of the longest common subsequence, in order.
std::vector<std::pair<size_t, size_t>> CommonLines(const std::vector<std::string>& lhs,
                                                   const std::vector<std::string>& rhs) {
  // lengths[i][j] is the LCS length of lhs[i:] and rhs[j:].
  std::vector<std::vector<size_t>> lengths(lhs.size() + 1, std::vector<size_t>(rhs.size() + 1));
  for (size_t i = lhs.size(); i-- > 0;) {
    for (size_t j = rhs.size(); j-- > 0;) {
      lengths[i][j] = lhs[i] == rhs[j] ? lengths[i + 1][j + 1] + 1
                                       : std::max(lengths[i + 1][j], lengths[i][j + 1]);
    }
  }

  std::vector<std::pair<size_t, size_t>> pairs;
  size_t i = 0;
  size_t j = 0;
  while (i < lhs.size() && j < rhs.size()) {
    if (lhs[i] == rhs[j]) {
      pairs.emplace_back(i++, j++);
    } else if (lengths[i + 1][j] >= lengths[i][j + 1]) {
      ++i;
    } else {
      ++j;
    }
  }
  return pairs;
}

}  // namespace

std::string Diff(const std::vector<std::string>& lhs, const std::vector<std::string>& rhs) {
  std::vector<std::string> diffs;
  size_t l = 0;
  size_t r = 0;
  for (const auto& [common_l, common_r] : CommonLines(lhs, rhs)) {
    while (l < common_l) {
      diffs.push_back(absl::StrCat("l:", lhs[l++]));
    }
    while (r < common_r) {
      diffs.push_back(absl::StrCat("r:", rhs[r++]));
    }
    diffs.push_back(absl::StrCat("  ", lhs[common_l]));
    l = common_l + 1;
    r = common_r + 1;
  }
  while (l < lhs.size()) {
    diffs.push_back(absl::StrCat("l:", lhs[l++]));
  }
  while (r < rhs.size()) {
    diffs.push_back(absl::StrCat("r:", rhs[r++]));
  }
  return absl::StrJoin(diffs, "\n");
}

std::string DiffLines(const std::string& lhs, const std::string& rhs, DiffPolicy policy) {
  switch (policy) {
    case DiffPolicy::kDefault: {
      std::vector<std::string> lhs_lines = absl::StrSplit(lhs, "\n");
      std::vector<std::string> rhs_lines = absl::StrSplit(rhs, "\n");
      return Diff(lhs_lines, rhs_lines);
    }
    case DiffPolicy::kIgnoreBlankLines: {
      std::vector<std::string> lhs_lines = absl::StrSplit(lhs, "\n", absl::SkipEmpty());
      std::vector<std::string> rhs_lines = absl::StrSplit(rhs, "\n", absl::SkipEmpty());
      return Diff(lhs_lines, rhs_lines);
    }
  }
  // GCC does not recognize that the above switch statement is exhaustive.
  return {};
}

}  // namespace testing
}  // namespace tessera
