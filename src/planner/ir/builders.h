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

#include <optional>
#include <string>

#include "src/planner/ir/blockwise.h"
#include "src/planner/ir/expr.h"
#include "src/planner/ir/partitioning.h"
#include "src/planner/ir/reduction.h"

namespace tessera {
namespace planner {
/**
 * Free functions that build expressions, one per user-level operation:
 *
 * ```
 * TESSERA_ASSIGN_OR_RETURN(ExprPtr x, build::ProjectColumn(df, "x"));
 * TESSERA_ASSIGN_OR_RETURN(ExprPtr total, build::Add(x, 1));
 * ```
 */
namespace build {

using ExprOr = StatusOr<ExprPtr>;

// split_every and split_out of a reduction.
struct SplitOptions {
  Operand split_every = Operand::None();
  Operand split_out = Operand(1);
};

ExprOr Project(const ExprPtr& frame, const StringList& columns);
ExprOr ProjectColumn(const ExprPtr& frame, const std::string& column);
ExprOr ProjectIndex(const ExprPtr& frame);
ExprOr Where(const ExprPtr& frame, const ExprPtr& predicate);
ExprOr Assign(const ExprPtr& frame, const std::string& key, const ExprPtr& value);
ExprOr AssignLiteral(const ExprPtr& frame, const std::string& key, Scalar value);
ExprOr AsType(const ExprPtr& frame, const DTypeMap& dtypes);
ExprOr Apply(const ExprPtr& frame, const std::string& function, const Meta& meta,
             const ScalarList& args = {}, const KwargMap& kwargs = {});

// Either side may be a literal.
ExprOr Add(const Operand& left, const Operand& right);
ExprOr Sub(const Operand& left, const Operand& right);
ExprOr Mul(const Operand& left, const Operand& right);
ExprOr Div(const Operand& left, const Operand& right);
ExprOr Lt(const Operand& left, const Operand& right);
ExprOr Le(const Operand& left, const Operand& right);
ExprOr Gt(const Operand& left, const Operand& right);
ExprOr Ge(const Operand& left, const Operand& right);
ExprOr Eq(const Operand& left, const Operand& right);
ExprOr Ne(const Operand& left, const Operand& right);

ExprOr AsUnknown(const ExprPtr& frame);
ExprOr SetCategories(const ExprPtr& frame, const StringList& categories);
ExprOr CategoricalCodes(const ExprPtr& frame);
ExprOr Shift(const ExprPtr& frame, int64_t periods = 1,
             const std::optional<std::string>& freq = std::nullopt);

ExprOr Head(const ExprPtr& frame, int64_t n = 5);
ExprOr SelectPartitions(const ExprPtr& frame, const Int64List& partitions);
ExprOr Concat(const ExprList& frames, const std::string& join = "outer");
ExprOr Repartition(const ExprPtr& frame, int64_t npartitions);
ExprOr RepartitionDivisions(const ExprPtr& frame, const ScalarList& divisions);
ExprOr Literal(Scalar value);

ExprOr Sum(const ExprPtr& frame, const SplitOptions& options = {});
ExprOr Prod(const ExprPtr& frame, const SplitOptions& options = {});
ExprOr Min(const ExprPtr& frame, const SplitOptions& options = {});
ExprOr Max(const ExprPtr& frame, const SplitOptions& options = {});
ExprOr Any(const ExprPtr& frame, const SplitOptions& options = {});
ExprOr All(const ExprPtr& frame, const SplitOptions& options = {});
ExprOr Count(const ExprPtr& frame, const SplitOptions& options = {});
ExprOr Size(const ExprPtr& frame, const SplitOptions& options = {});
ExprOr Mode(const ExprPtr& frame, const SplitOptions& options = {});
ExprOr Len(const ExprPtr& frame);
// Sum divided by Count.
ExprOr Mean(const ExprPtr& frame, const SplitOptions& options = {});
ExprOr DropDuplicates(const ExprPtr& frame, const std::optional<std::string>& subset = std::nullopt,
                      const SplitOptions& options = {});
ExprOr Unique(const ExprPtr& frame, const SplitOptions& options = {});
ExprOr ValueCounts(const ExprPtr& frame, const SplitOptions& options = {});
ExprOr GroupByAgg(const ExprPtr& frame, const std::string& by, const std::string& func,
                  const SplitOptions& options = {});

}  // namespace build
}  // namespace planner
}  // namespace tessera
