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
#include "src/planner/ir/blockwise.h"
#include "src/planner/ir/expr.h"

DECLARE_int64(split_every);

namespace tessera {
namespace planner {

// Backend functions of the three steps of a tree reduction.
struct ReductionSteps {
  std::string chunk;
  std::string combine;
  std::string aggregate;
};

/**
 * @brief Base of aggregations over all partitions.
 *
 * A reduction is not materialized directly: Lower() expands it into a Chunk per partition
 * and a TreeReduce over the chunks.
 *
 * `split_every` bounds the fan-in of the combine tasks. None takes --split_every, false
 * combines everything in one task. `split_out` is the number of output partitions, true
 * meaning one per input partition.
 */
class Reduction : public Expr {
 public:
  bool IsReduction() const override { return true; }
  StatusOr<ExprPtr> Lower() const override;

  virtual ReductionSteps steps() const = 0;
  // Passed to every step.
  virtual KwargMap step_kwargs() const { return {}; }
  // The column that shards intermediates between outputs. None hashes whole rows.
  virtual Operand shard_by() const { return Operand::None(); }
  virtual bool supports_split_out() const { return false; }

  // 0 for a single combine level.
  StatusOr<int64_t> split_every() const;
  int64_t split_out() const;

 protected:
  Reduction(ExprType type, const Params* params, std::vector<Operand> operands)
      : Expr(type, params, std::move(operands)) {}

  Divisions ComputeDivisions() const override { return Divisions::Unknown(split_out()); }
  Status BuildTasks(taskgraphpb::Layer* layer) const override;

  // Checks the frame operand and the split options.
  Status ValidateInput() const;

  const ExprPtr& frame() const { return operands()[0].expr(); }
};

/**
 * @brief Reductions applied to every column on their own.
 *
 * A frame reduces to a series indexed by column name, a series to a scalar.
 */
class ColumnwiseReduction : public Reduction {
 public:
  StatusOr<ExprPtr> SimplifyUp(const ExprPtr& parent) const override;

 protected:
  ColumnwiseReduction(ExprType type, const Params* params, std::vector<Operand> operands)
      : Reduction(type, params, std::move(operands)) {}

  StatusOr<Meta> ComputeMeta() const override;
  // Result type of one column.
  virtual StatusOr<DataType> ResultType(const ColumnSchema& column) const = 0;
};

#define TESSERA_DECLARE_COLUMNWISE_REDUCTION(NAME)                                    \
  class NAME : public ColumnwiseReduction {                                           \
    TESSERA_DECLARE_EXPR(NAME, ColumnwiseReduction)                                   \
    ReductionSteps steps() const override;                                            \
                                                                                      \
   protected:                                                                         \
    StatusOr<DataType> ResultType(const ColumnSchema& column) const override;         \
  };

TESSERA_DECLARE_COLUMNWISE_REDUCTION(Sum)
TESSERA_DECLARE_COLUMNWISE_REDUCTION(Prod)
TESSERA_DECLARE_COLUMNWISE_REDUCTION(Min)
TESSERA_DECLARE_COLUMNWISE_REDUCTION(Max)
TESSERA_DECLARE_COLUMNWISE_REDUCTION(Any)
TESSERA_DECLARE_COLUMNWISE_REDUCTION(All)
TESSERA_DECLARE_COLUMNWISE_REDUCTION(Count)
#undef TESSERA_DECLARE_COLUMNWISE_REDUCTION

// Number of elements.
class Size : public Reduction {
  TESSERA_DECLARE_EXPR(Size, Reduction)
  ReductionSteps steps() const override { return {"size", "sum", "sum"}; }

 protected:
  StatusOr<Meta> ComputeMeta() const override;
};

// Number of rows.
class Len : public Reduction {
  TESSERA_DECLARE_EXPR(Len, Reduction)
  ReductionSteps steps() const override { return {"len", "sum", "sum"}; }
  StatusOr<ExprPtr> Simplify() const override;

 protected:
  StatusOr<Meta> ComputeMeta() const override;
};

class Mode : public Reduction {
  TESSERA_DECLARE_EXPR(Mode, Reduction)
  ReductionSteps steps() const override { return {"value_counts", "sum_counts", "mode"}; }

 protected:
  StatusOr<Meta> ComputeMeta() const override;
};

class DropDuplicates : public Reduction {
  TESSERA_DECLARE_EXPR(DropDuplicates, Reduction)
  ReductionSteps steps() const override {
    return {"drop_duplicates", "drop_duplicates", "drop_duplicates"};
  }
  KwargMap step_kwargs() const override;
  Operand shard_by() const override { return operand("subset"); }
  bool supports_split_out() const override { return true; }

 protected:
  StatusOr<Meta> ComputeMeta() const override;
};

class Unique : public Reduction {
  TESSERA_DECLARE_EXPR(Unique, Reduction)
  ReductionSteps steps() const override { return {"unique", "unique", "unique"}; }
  bool supports_split_out() const override { return true; }

 protected:
  StatusOr<Meta> ComputeMeta() const override;
};

// Occurrences of each value of a series, as an INT64 series named "count".
class ValueCounts : public Reduction {
  TESSERA_DECLARE_EXPR(ValueCounts, Reduction)
  ReductionSteps steps() const override {
    return {"value_counts", "sum_counts", "sum_counts"};
  }
  bool supports_split_out() const override { return true; }

 protected:
  StatusOr<Meta> ComputeMeta() const override;
};

/**
 * @brief Grouped aggregation of every other column by the column `by`.
 *
 * `func` is one of sum, count, min or max. The result is indexed by the group keys.
 */
class GroupByAgg : public Reduction {
  TESSERA_DECLARE_EXPR(GroupByAgg, Reduction)
  ReductionSteps steps() const override;
  KwargMap step_kwargs() const override;
  Operand shard_by() const override { return operand("by"); }
  bool supports_split_out() const override { return true; }
  StatusOr<ExprPtr> SimplifyUp(const ExprPtr& parent) const override;

 protected:
  StatusOr<Meta> ComputeMeta() const override;
};

// The chunk step of a lowered reduction.
class Chunk : public Blockwise {
  TESSERA_DECLARE_EXPR(Chunk, Blockwise)
  std::string task_op() const override { return "reduction-chunk"; }

 protected:
  StatusOr<Meta> ComputeMeta() const override;
  Status FillTask(int64_t partition, taskgraphpb::Task* task) const override;
};

/**
 * @brief Combines the chunks of a lowered reduction.
 *
 * With one output, chunks are combined in batches of `split_every` into the tasks
 * (<name>-combine-<depth>, i) until at most `split_every` remain, which are aggregated into
 * (<name>, 0). With `split_out` outputs every chunk is first split by `shard_by` into the
 * tasks (<name>-shard, i), and output j runs the same tree over shard j of every chunk.
 */
class TreeReduce : public Expr {
  TESSERA_DECLARE_EXPR(TreeReduce, Expr)

 protected:
  StatusOr<Meta> ComputeMeta() const override;
  Divisions ComputeDivisions() const override;
  std::string ComputeName() const override;
  Status BuildTasks(taskgraphpb::Layer* layer) const override;

 private:
  // Adds the combine levels and the aggregate task over the inputs of one output.
  void BuildTree(std::vector<taskgraphpb::TaskArg> inputs, int64_t output,
                 taskgraphpb::Layer* layer) const;
};

}  // namespace planner
}  // namespace tessera
