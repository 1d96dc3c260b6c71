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

#include <string>
#include <vector>

#include "src/common/base/base.h"
#include "src/shared/types/scalar.h"

namespace tessera {
namespace planner {

using types::Scalar;

enum class CompareOp { kLt, kLe, kGt, kGe, kEq, kNe };

std::string CompareOpToString(CompareOp op);
StatusOr<CompareOp> CompareOpFromString(std::string_view op);

/**
 * @brief A (column, operator, literal) filter that a storage reader applies while reading.
 */
class Predicate {
 public:
  Predicate() = default;
  Predicate(std::string column, CompareOp op, Scalar value)
      : column_(std::move(column)), op_(op), value_(std::move(value)) {}

  const std::string& column() const { return column_; }
  CompareOp op() const { return op_; }
  const Scalar& value() const { return value_; }

  // The operator to use when the column and literal trade places: 5 < a is a > 5.
  static CompareOp Flip(CompareOp op);

  bool Evaluate(const Scalar& v) const;

  /**
   * @brief Whether any value in [min, max] can satisfy the predicate.
   *
   * Only returns false when the statistics prove that no row matches. Incomparable
   * statistics always may match.
   */
  bool MayMatch(const Scalar& min, const Scalar& max) const;

  std::string ToString() const;

  bool operator==(const Predicate& other) const {
    return column_ == other.column_ && op_ == other.op_ && value_ == other.value_;
  }
  bool operator!=(const Predicate& other) const { return !(*this == other); }

 private:
  std::string column_;
  CompareOp op_ = CompareOp::kEq;
  Scalar value_;
};

using PredicateList = std::vector<Predicate>;

}  // namespace planner
}  // namespace tessera
