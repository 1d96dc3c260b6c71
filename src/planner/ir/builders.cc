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


#include "src/planner/ir/builders.h"

namespace tessera {
namespace planner {
namespace build {

namespace {

NamedOperands SplitOperands(const SplitOptions& options) {
  return {{"split_every", options.split_every}, {"split_out", options.split_out}};
}

}  // namespace

ExprOr Project(const ExprPtr& frame, const StringList& columns) {
  return Expr::Create<planner::Projection>({frame, columns});
}

ExprOr ProjectColumn(const ExprPtr& frame, const std::string& column) {
  return Expr::Create<planner::Projection>({frame, column});
}

ExprOr ProjectIndex(const ExprPtr& frame) {
  return Expr::Create<planner::ProjectIndex>({frame});
}

ExprOr Where(const ExprPtr& frame, const ExprPtr& predicate) {
  return Expr::Create<planner::Filter>({frame, predicate});
}

ExprOr Assign(const ExprPtr& frame, const std::string& key, const ExprPtr& value) {
  return Expr::Create<planner::Assign>({frame, key, value});
}

ExprOr AssignLiteral(const ExprPtr& frame, const std::string& key, Scalar value) {
  return Expr::Create<planner::Assign>({frame, key, std::move(value)});
}

ExprOr AsType(const ExprPtr& frame, const DTypeMap& dtypes) {
  return Expr::Create<planner::AsType>({frame, dtypes});
}

ExprOr Apply(const ExprPtr& frame, const std::string& function, const Meta& meta,
             const ScalarList& args, const KwargMap& kwargs) {
  return Expr::Create<planner::Apply>({frame, function, meta, args, kwargs});
}

#define TESSERA_BINOP_BUILDER(NAME)                                 \
  ExprOr NAME(const Operand& left, const Operand& right) {          \
    return Expr::Create<planner::NAME>({left, right});              \
  }
TESSERA_BINOP_BUILDER(Add)
TESSERA_BINOP_BUILDER(Sub)
TESSERA_BINOP_BUILDER(Mul)
TESSERA_BINOP_BUILDER(Div)
TESSERA_BINOP_BUILDER(Lt)
TESSERA_BINOP_BUILDER(Le)
TESSERA_BINOP_BUILDER(Gt)
TESSERA_BINOP_BUILDER(Ge)
TESSERA_BINOP_BUILDER(Eq)
TESSERA_BINOP_BUILDER(Ne)
#undef TESSERA_BINOP_BUILDER

ExprOr AsUnknown(const ExprPtr& frame) { return Expr::Create<planner::AsUnknown>({frame}); }

ExprOr SetCategories(const ExprPtr& frame, const StringList& categories) {
  return Expr::Create<planner::SetCategories>({frame, categories});
}

ExprOr CategoricalCodes(const ExprPtr& frame) {
  return Expr::Create<planner::CategoricalCodes>({frame});
}

ExprOr Shift(const ExprPtr& frame, int64_t periods, const std::optional<std::string>& freq) {
  if (freq.has_value()) {
    return Expr::Create<planner::Shift>({frame, periods, freq.value()});
  }
  return Expr::Create<planner::Shift>({frame, periods});
}

ExprOr Head(const ExprPtr& frame, int64_t n) { return Expr::Create<planner::Head>({frame, n}); }

ExprOr SelectPartitions(const ExprPtr& frame, const Int64List& partitions) {
  return Expr::Create<planner::Partitions>({frame, partitions});
}

ExprOr Concat(const ExprList& frames, const std::string& join) {
  return Expr::Create<planner::Concat>({frames, join});
}

ExprOr Repartition(const ExprPtr& frame, int64_t npartitions) {
  return Expr::Create<planner::Repartition>({frame}, {{"npartitions", Operand(npartitions)}});
}

ExprOr RepartitionDivisions(const ExprPtr& frame, const ScalarList& divisions) {
  return Expr::Create<planner::Repartition>({frame}, {{"new_divisions", Operand(divisions)}});
}

ExprOr Literal(Scalar value) { return Expr::Create<planner::Literal>({std::move(value)}); }

#define TESSERA_REDUCTION_BUILDER(NAME)                                       \
  ExprOr NAME(const ExprPtr& frame, const SplitOptions& options) {            \
    return Expr::Create<planner::NAME>({frame}, SplitOperands(options));      \
  }
TESSERA_REDUCTION_BUILDER(Sum)
TESSERA_REDUCTION_BUILDER(Prod)
TESSERA_REDUCTION_BUILDER(Min)
TESSERA_REDUCTION_BUILDER(Max)
TESSERA_REDUCTION_BUILDER(Any)
TESSERA_REDUCTION_BUILDER(All)
TESSERA_REDUCTION_BUILDER(Count)
TESSERA_REDUCTION_BUILDER(Size)
TESSERA_REDUCTION_BUILDER(Mode)
TESSERA_REDUCTION_BUILDER(Unique)
TESSERA_REDUCTION_BUILDER(ValueCounts)
#undef TESSERA_REDUCTION_BUILDER

ExprOr Len(const ExprPtr& frame) { return Expr::Create<planner::Len>({frame}); }

ExprOr Mean(const ExprPtr& frame, const SplitOptions& options) {
  TESSERA_ASSIGN_OR_RETURN(ExprPtr sum, Sum(frame, options));
  TESSERA_ASSIGN_OR_RETURN(ExprPtr count, Count(frame, options));
  return Div(sum, count);
}

ExprOr DropDuplicates(const ExprPtr& frame, const std::optional<std::string>& subset,
                      const SplitOptions& options) {
  NamedOperands named = SplitOperands(options);
  if (subset.has_value()) {
    named["subset"] = Operand(subset.value());
  }
  return Expr::Create<planner::DropDuplicates>({frame}, std::move(named));
}

ExprOr GroupByAgg(const ExprPtr& frame, const std::string& by, const std::string& func,
                  const SplitOptions& options) {
  return Expr::Create<planner::GroupByAgg>({frame, by, func}, SplitOperands(options));
}

}  // namespace build
}  // namespace planner
}  // namespace tessera
