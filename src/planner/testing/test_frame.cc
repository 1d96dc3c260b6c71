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


#include "src/planner/testing/test_frame.h"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

namespace tessera {
namespace planner {
namespace testutils {

namespace {

struct ScalarFormatter {
  void operator()(std::string* out, const Scalar& v) const { out->append(v.ToString()); }
};

}  // namespace

int64_t TestFrame::ColumnIndex(std::string_view name) const {
  for (size_t i = 0; i < columns.size(); ++i) {
    if (columns[i] == name) {
      return i;
    }
  }
  return -1;
}

TestFrame TestFrame::Take(const std::vector<int64_t>& rows) const {
  TestFrame out;
  out.columns = columns;
  out.is_series = is_series;
  out.data.resize(columns.size());
  for (int64_t row : rows) {
    out.index.push_back(index[row]);
    for (size_t c = 0; c < columns.size(); ++c) {
      out.data[c].push_back(data[c][row]);
    }
  }
  return out;
}

StatusOr<TestFrame> TestFrame::Select(const std::vector<std::string>& names, bool series) const {
  if (series && names.size() != 1) {
    return error::InvalidArgument("A series holds one column, got $0", names.size());
  }
  TestFrame out;
  out.index = index;
  out.is_series = series;
  for (const auto& name : names) {
    int64_t c = ColumnIndex(name);
    if (c < 0) {
      return error::InvalidArgument("No column '$0' in [$1]", name, absl::StrJoin(columns, ","));
    }
    out.columns.push_back(name);
    out.data.push_back(data[c]);
  }
  return out;
}

std::string TestFrame::DebugString() const {
  std::string out = absl::StrCat(is_series ? "Series" : "Frame", "[index=",
                                 absl::StrJoin(index, ",", ScalarFormatter()));
  for (size_t c = 0; c < columns.size(); ++c) {
    absl::StrAppend(&out, "; ", columns[c], "=", absl::StrJoin(data[c], ",", ScalarFormatter()));
  }
  return absl::StrCat(out, "]");
}

TestFrame MakeFrame(std::vector<std::string> columns, std::vector<std::vector<Scalar>> data) {
  TestFrame frame;
  frame.columns = std::move(columns);
  frame.data = std::move(data);
  int64_t rows = frame.data.empty() ? 0 : frame.data[0].size();
  for (int64_t i = 0; i < rows; ++i) {
    frame.index.emplace_back(i);
  }
  return frame;
}

std::vector<Scalar> Ints(const std::vector<int64_t>& values) {
  std::vector<Scalar> out;
  for (int64_t v : values) {
    out.emplace_back(v);
  }
  return out;
}

std::vector<Scalar> Strings(const std::vector<std::string>& values) {
  std::vector<Scalar> out;
  for (const auto& v : values) {
    out.emplace_back(v);
  }
  return out;
}

std::string TestDatum::DebugString() const {
  if (Is<Scalar>()) {
    return Get<Scalar>().ToString();
  }
  if (Is<std::vector<Scalar>>()) {
    return absl::StrCat("[", absl::StrJoin(Get<std::vector<Scalar>>(), ",", ScalarFormatter()),
                        "]");
  }
  if (Is<TestFrame>()) {
    return Get<TestFrame>().DebugString();
  }
  return absl::StrCat("List(", Get<std::vector<DatumPtr>>().size(), ")");
}

StatusOr<TestFrame> AsFrame(const DatumPtr& datum) {
  const auto* value = dynamic_cast<const TestDatum*>(datum.get());
  if (value == nullptr || !value->Is<TestFrame>()) {
    return error::InvalidArgument("Expected a frame or series, got $0",
                                  datum == nullptr ? "null" : datum->DebugString());
  }
  return value->Get<TestFrame>();
}

StatusOr<Scalar> AsScalar(const DatumPtr& datum) {
  const auto* value = dynamic_cast<const TestDatum*>(datum.get());
  if (value == nullptr || !value->Is<Scalar>()) {
    return error::InvalidArgument("Expected a scalar, got $0",
                                  datum == nullptr ? "null" : datum->DebugString());
  }
  return value->Get<Scalar>();
}

}  // namespace testutils
}  // namespace planner
}  // namespace tessera
