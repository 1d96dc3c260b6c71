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

#include "src/planner/ir/blockwise.h"
#include "src/planner/ir/expr.h"

namespace tessera {
namespace planner {

// The first n rows, taken from the first partition only.
class Head : public Expr {
  TESSERA_DECLARE_EXPR(Head, Expr)
  StatusOr<ExprPtr> Simplify() const override;

 protected:
  StatusOr<Meta> ComputeMeta() const override;
  Divisions ComputeDivisions() const override;
  Status BuildTasks(taskgraphpb::Layer* layer) const override;
};

/**
 * @brief An explicit subset of the partitions of a frame, in ascending order.
 *
 * Partition i of the output is partition partitions[i] of the input.
 */
class Partitions : public Expr {
  TESSERA_DECLARE_EXPR(Partitions, Expr)
  StatusOr<ExprPtr> Simplify() const override;

  const Int64List& partitions() const { return operand("partitions").Get<Int64List>(); }

 protected:
  StatusOr<Meta> ComputeMeta() const override;
  Divisions ComputeDivisions() const override;
  Status BuildTasks(taskgraphpb::Layer* layer) const override;
};

/**
 * @brief Stacks frames along the partition axis.
 *
 * The output has the partitions of every input in order. With join "outer" the columns
 * are the union of the inputs' columns, with "inner" their intersection.
 */
class Concat : public Expr {
  TESSERA_DECLARE_EXPR(Concat, Expr)
  StatusOr<ExprPtr> Simplify() const override;
  StatusOr<ExprPtr> SimplifyUp(const ExprPtr& parent) const override;

  const ExprList& frames() const { return operand("frames").Get<ExprList>(); }

 protected:
  StatusOr<Meta> ComputeMeta() const override;
  Divisions ComputeDivisions() const override;
  Status BuildTasks(taskgraphpb::Layer* layer) const override;
};

/**
 * @brief Changes the partitioning to `npartitions` partitions or to `new_divisions`.
 *
 * Fewer partitions concatenate neighbours and keep a subset of the known divisions. More
 * partitions split each input evenly by rows, which loses the divisions. New divisions
 * need known input divisions.
 */
class Repartition : public Expr {
  TESSERA_DECLARE_EXPR(Repartition, Expr)
  StatusOr<ExprPtr> Simplify() const override;
  StatusOr<ExprPtr> SimplifyUp(const ExprPtr& parent) const override;

 protected:
  StatusOr<Meta> ComputeMeta() const override;
  Divisions ComputeDivisions() const override;
  Status BuildTasks(taskgraphpb::Layer* layer) const override;

 private:
  const ExprPtr& frame() const { return operands()[0].expr(); }
  Status BuildCoalesce(taskgraphpb::Layer* layer) const;
  Status BuildSplit(taskgraphpb::Layer* layer) const;
  Status BuildNewDivisions(taskgraphpb::Layer* layer) const;
};

// A single-partition constant.
class Literal : public Expr {
  TESSERA_DECLARE_EXPR(Literal, Expr)

  const Scalar& value() const { return operand("value").scalar(); }

 protected:
  StatusOr<Meta> ComputeMeta() const override;
  Status BuildTasks(taskgraphpb::Layer* layer) const override;
};

/**
 * @brief Wraps an already built layer, e.g. the result of an earlier computation.
 *
 * The expression takes the name of the layer so that the layer's task keys stay valid.
 */
class FromGraph : public Expr {
  TESSERA_DECLARE_EXPR(FromGraph, Expr)

 protected:
  StatusOr<Meta> ComputeMeta() const override;
  Divisions ComputeDivisions() const override;
  std::string ComputeName() const override;
  Status BuildTasks(taskgraphpb::Layer* layer) const override;
};

}  // namespace planner
}  // namespace tessera
