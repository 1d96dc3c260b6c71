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


#include "src/planner/ir/predicate.h"

#include <absl/strings/substitute.h>

namespace tessera {
namespace planner {

std::string CompareOpToString(CompareOp op) {
  switch (op) {
    case CompareOp::kLt:
      return "<";
    case CompareOp::kLe:
      return "<=";
    case CompareOp::kGt:
      return ">";
    case CompareOp::kGe:
      return ">=";
    case CompareOp::kEq:
      return "==";
    case CompareOp::kNe:
      return "!=";
  }
  return "?";
}

StatusOr<CompareOp> CompareOpFromString(std::string_view op) {
  for (CompareOp candidate : {CompareOp::kLt, CompareOp::kLe, CompareOp::kGt, CompareOp::kGe,
                              CompareOp::kEq, CompareOp::kNe}) {
    if (CompareOpToString(candidate) == op) {
      return candidate;
    }
  }
  return error::InvalidArgument("Unknown comparison operator '$0'", op);
}

CompareOp Predicate::Flip(CompareOp op) {
  switch (op) {
    case CompareOp::kLt:
      return CompareOp::kGt;
    case CompareOp::kLe:
      return CompareOp::kGe;
    case CompareOp::kGt:
      return CompareOp::kLt;
    case CompareOp::kGe:
      return CompareOp::kLe;
    default:
      return op;
  }
}

bool Predicate::Evaluate(const Scalar& v) const {
  auto cmp = v.Compare(value_);
  if (!cmp.has_value()) {
    // Nulls and mixed kinds only satisfy inequality.
    return op_ == CompareOp::kNe;
  }
  int c = cmp.value();
  switch (op_) {
    case CompareOp::kLt:
      return c < 0;
    case CompareOp::kLe:
      return c <= 0;
    case CompareOp::kGt:
      return c > 0;
    case CompareOp::kGe:
      return c >= 0;
    case CompareOp::kEq:
      return c == 0;
    case CompareOp::kNe:
      return c != 0;
  }
  return false;
}

bool Predicate::MayMatch(const Scalar& min, const Scalar& max) const {
  auto min_cmp = min.Compare(value_);
  auto max_cmp = max.Compare(value_);
  if (!min_cmp.has_value() || !max_cmp.has_value()) {
    return true;
  }
  switch (op_) {
    case CompareOp::kLt:
      return min_cmp.value() < 0;
    case CompareOp::kLe:
      return min_cmp.value() <= 0;
    case CompareOp::kGt:
      return max_cmp.value() > 0;
    case CompareOp::kGe:
      return max_cmp.value() >= 0;
    case CompareOp::kEq:
      return min_cmp.value() <= 0 && max_cmp.value() >= 0;
    case CompareOp::kNe:
      return !(min_cmp.value() == 0 && max_cmp.value() == 0);
  }
  return true;
}

std::string Predicate::ToString() const {
  return absl::Substitute("($0, $1, $2)", column_, CompareOpToString(op_), value_.ToString());
}

}  // namespace planner
}  // namespace tessera
