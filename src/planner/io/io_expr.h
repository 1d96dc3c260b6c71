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

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "src/planner/io/dataset_source.h"
#include "src/planner/io/table_source.h"
#include "src/planner/ir/blockwise.h"

namespace tessera {
namespace planner {

/**
 * @brief Base of the leaves that read a source.
 *
 * Every IO expression has the operands `source`, `columns` (None reads every column),
 * `_partitions` (None reads every partition of the source) and `_series` (the single
 * column is read as a series). The last two are only set by rewrites.
 */
class IOExpr : public Blockwise {
 public:
  bool IsIO() const override { return true; }

  // Absorbs projections and partition subsets.
  StatusOr<ExprPtr> SimplifyUp(const ExprPtr& parent) const override;
  // One read of the union of the columns read by similar leaves under root.
  StatusOr<ExprPtr> CombineSimilar(const ExprPtr& root) const override;

  const SourcePtr& source() const { return operand("source").Get<SourcePtr>(); }
  bool reads_series() const { return operand("_series").bool_value(); }
  bool reads_all_partitions() const { return operand("_partitions").is_none(); }
  // The source partitions read, in output order.
  Int64List selected_partitions() const;

 protected:
  IOExpr(ExprType type, const Params* params, std::vector<Operand> operands)
      : Blockwise(type, params, std::move(operands)) {}

  // Partitions and divisions of the source before any partition subset is applied.
  virtual const Divisions& source_divisions() const = 0;
  Divisions ComputeDivisions() const override;
  // Validates `_partitions` against the source; for use from Prepare.
  Status CheckPartitions() const;
  // The frame of every column narrowed to `columns` and `_series`.
  StatusOr<Meta> ProjectedMeta(const Meta& full) const;
  Status SetColumnsKwarg(taskgraphpb::Task* task) const;

 private:
  // Whether other reads the same data as this up to the column selection.
  bool IsSimilar(const IOExpr& other) const;
};

// A table held by the backend, split into partitions by index value or by row.
class FromTable : public IOExpr {
  TESSERA_DECLARE_EXPR(FromTable, IOExpr)
  StatusOr<ExprPtr> SimplifyUp(const ExprPtr& parent) const override;
  std::string task_op() const override { return "read_table"; }

  const TableSource& table() const { return static_cast<const TableSource&>(*source()); }
  const TableLayout& layout() const { return *layout_; }

 protected:
  Status Prepare() override;
  StatusOr<Meta> ComputeMeta() const override;
  const Divisions& source_divisions() const override { return layout_->divisions; }
  Status FillTask(int64_t partition, taskgraphpb::Task* task) const override;

 private:
  std::shared_ptr<const TableLayout> layout_;
};

/**
 * @brief A stored dataset read one fragment per partition.
 *
 * Filters prune fragments by their statistics when the plan is built and are applied to
 * rows by the backend.
 */
class ReadDataset : public IOExpr {
  TESSERA_DECLARE_EXPR(ReadDataset, IOExpr)
  StatusOr<ExprPtr> SimplifyUp(const ExprPtr& parent) const override;

  const DatasetSource& dataset() const { return static_cast<const DatasetSource&>(*source()); }
  const DatasetPlan& plan() const { return *plan_; }
  const PredicateList& filters() const { return operand("filters").Get<PredicateList>(); }
  std::optional<std::string> index_column() const;

 protected:
  Status Prepare() override;
  StatusOr<Meta> ComputeMeta() const override;
  const Divisions& source_divisions() const override { return plan_->divisions; }
  Status FillTask(int64_t partition, taskgraphpb::Task* task) const override;

 private:
  StatusOr<ExprPtr> AbsorbFilter(const Expr& filter) const;

  DatasetPlanPtr plan_;
};

namespace build {

StatusOr<ExprPtr> FromTable(std::shared_ptr<const TableSource> source, int64_t npartitions = 1,
                            bool sort = true);
StatusOr<ExprPtr> ReadDataset(std::shared_ptr<const DatasetSource> source,
                              const PredicateList& filters = {},
                              const std::optional<std::string>& index = std::nullopt,
                              bool calculate_divisions = true);

}  // namespace build

}  // namespace planner
}  // namespace tessera
