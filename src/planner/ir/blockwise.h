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

#include "src/planner/ir/expr.h"

namespace tessera {
namespace planner {

/**
 * @brief Base of expressions that run one task per partition, where task i only reads
 * partition i of each dependency (or partition 0 of a broadcast dependency).
 *
 * Blockwise expressions are the candidates for fusion.
 */
class Blockwise : public Expr {
 public:
  bool IsBlockwise() const override { return true; }

  // The task computing one partition, keyed (name(), partition).
  Status BuildBlockwiseTask(int64_t partition, taskgraphpb::Task* task) const;

  // The backend operation, snake_case of the type by default.
  virtual std::string task_op() const;

  // Fails unless every non-broadcast dependency has this expression's partitioning.
  Status CheckAligned() const;

 protected:
  Blockwise(ExprType type, const Params* params, std::vector<Operand> operands)
      : Expr(type, params, std::move(operands)) {}

  // Divisions of the first dependency that is not broadcast.
  Divisions ComputeDivisions() const override;
  Status BuildTasks(taskgraphpb::Layer* layer) const override;

  // Sets the op and arguments. By default every operand becomes a positional argument.
  virtual Status FillTask(int64_t partition, taskgraphpb::Task* task) const;
  void AddDepArg(const ExprPtr& dep, int64_t partition, taskgraphpb::Task* task) const;
  Status AddArg(const Operand& operand, int64_t partition, taskgraphpb::Task* task) const;

  const ExprPtr& frame() const { return operands()[0].expr(); }
};

// Selects a column (a string operand) or a list of columns.
class Projection : public Blockwise {
  TESSERA_DECLARE_EXPR(Projection, Blockwise)
  bool IsElemwise() const override { return true; }
  StatusOr<ExprPtr> Simplify() const override;

  // The selected column names as a list.
  StringList selected_columns() const;
  bool selects_series() const { return operand("columns").is_string(); }

 protected:
  StatusOr<Meta> ComputeMeta() const override;
};

class ProjectIndex : public Blockwise {
  TESSERA_DECLARE_EXPR(ProjectIndex, Blockwise)
  bool IsElemwise() const override { return true; }

 protected:
  StatusOr<Meta> ComputeMeta() const override;
};

// Keeps the rows where a boolean series is true.
class Filter : public Blockwise {
  TESSERA_DECLARE_EXPR(Filter, Blockwise)
  StatusOr<ExprPtr> SimplifyUp(const ExprPtr& parent) const override;

 protected:
  StatusOr<Meta> ComputeMeta() const override;
};

// Adds or replaces column `key` with a series or a literal.
class Assign : public Blockwise {
  TESSERA_DECLARE_EXPR(Assign, Blockwise)
  bool IsElemwise() const override { return true; }
  StatusOr<ExprPtr> SimplifyUp(const ExprPtr& parent) const override;

 protected:
  StatusOr<Meta> ComputeMeta() const override;
};

class AsType : public Blockwise {
  TESSERA_DECLARE_EXPR(AsType, Blockwise)
  bool IsElemwise() const override { return true; }

 protected:
  StatusOr<Meta> ComputeMeta() const override;
  Status FillTask(int64_t partition, taskgraphpb::Task* task) const override;
};

/**
 * @brief Runs a named backend function on every partition.
 *
 * A function cannot be replayed on a zero-row input here, so the output Meta is given.
 */
class Apply : public Blockwise {
  TESSERA_DECLARE_EXPR(Apply, Blockwise)

 protected:
  StatusOr<Meta> ComputeMeta() const override;
  Status FillTask(int64_t partition, taskgraphpb::Task* task) const override;
};

// Arithmetic and comparison. Either operand may be a literal.
class Binop : public Blockwise {
 public:
  virtual BinaryOp op() const = 0;
  bool IsElemwise() const override { return true; }
  StatusOr<ExprPtr> Simplify() const override;
  StatusOr<ExprPtr> SimplifyUp(const ExprPtr& parent) const override;

  const Operand& left() const { return operands()[0]; }
  const Operand& right() const { return operands()[1]; }

 protected:
  Binop(ExprType type, const Params* params, std::vector<Operand> operands)
      : Blockwise(type, params, std::move(operands)) {}
  StatusOr<Meta> ComputeMeta() const override;
};

#define TESSERA_DECLARE_BINOP(NAME, OP)                \
  class NAME : public Binop {                          \
    TESSERA_DECLARE_EXPR(NAME, Binop)                  \
    BinaryOp op() const override { return OP; }        \
  };

TESSERA_DECLARE_BINOP(Add, BinaryOp::kAdd)
TESSERA_DECLARE_BINOP(Sub, BinaryOp::kSub)
TESSERA_DECLARE_BINOP(Mul, BinaryOp::kMul)
TESSERA_DECLARE_BINOP(Div, BinaryOp::kDiv)
TESSERA_DECLARE_BINOP(Lt, BinaryOp::kLt)
TESSERA_DECLARE_BINOP(Le, BinaryOp::kLe)
TESSERA_DECLARE_BINOP(Gt, BinaryOp::kGt)
TESSERA_DECLARE_BINOP(Ge, BinaryOp::kGe)
TESSERA_DECLARE_BINOP(Eq, BinaryOp::kEq)
TESSERA_DECLARE_BINOP(Ne, BinaryOp::kNe)
#undef TESSERA_DECLARE_BINOP

// Forgets the categories of categorical columns.
class AsUnknown : public Blockwise {
  TESSERA_DECLARE_EXPR(AsUnknown, Blockwise)
  bool IsElemwise() const override { return true; }
  StatusOr<ExprPtr> SimplifyUp(const ExprPtr& parent) const override;

 protected:
  StatusOr<Meta> ComputeMeta() const override;
};

class SetCategories : public Blockwise {
  TESSERA_DECLARE_EXPR(SetCategories, Blockwise)
  bool IsElemwise() const override { return true; }
  StatusOr<ExprPtr> SimplifyUp(const ExprPtr& parent) const override;

 protected:
  StatusOr<Meta> ComputeMeta() const override;
};

// Integer codes of categorical columns. Needs known categories.
class CategoricalCodes : public Blockwise {
  TESSERA_DECLARE_EXPR(CategoricalCodes, Blockwise)
  bool IsElemwise() const override { return true; }

 protected:
  StatusOr<Meta> ComputeMeta() const override;
};

/**
 * @brief Shifts by `periods`.
 *
 * With a frequency the index moves and the values stay, which is blockwise. Fixed
 * frequencies (ns, us, ms, s, min/T, h/H, D, optionally with a multiple such as "2h") shift
 * known divisions, any other frequency makes them unknown. Without a frequency the values
 * move between rows, so every task also reads the neighbouring partition.
 */
class Shift : public Blockwise {
  TESSERA_DECLARE_EXPR(Shift, Blockwise)
  bool IsBlockwise() const override { return !operand("freq").is_none(); }
  bool IsElemwise() const override { return IsBlockwise(); }
  StatusOr<ExprPtr> SimplifyUp(const ExprPtr& parent) const override;

 protected:
  StatusOr<Meta> ComputeMeta() const override;
  Divisions ComputeDivisions() const override;
  Status BuildTasks(taskgraphpb::Layer* layer) const override;
};

// The column selection of parent when it is a projection of child, else nullptr.
const Projection* ProjectionOf(const ExprPtr& parent, const Expr& child);

// child rebuilt on top of its projected "frame" operand. Declines unless that is a frame.
StatusOr<ExprPtr> ProjectFrameOperand(const Expr& child, const Projection& projection);

// Length of one tick of a fixed frequency, in nanoseconds.
std::optional<int64_t> FixedFrequencyNanos(std::string_view freq);

// The Meta of an operand: the expression's, or a scalar of the literal's type.
Meta OperandMeta(const Operand& operand);

}  // namespace planner
}  // namespace tessera
