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

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>  // NOLINT
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "src/common/base/base.h"
#include "src/planner/graph/taskgraphpb/task_graph.pb.h"
#include "src/planner/ir/operand.h"
#include "src/planner/meta/divisions.h"
#include "src/planner/meta/meta.h"

namespace tessera {
namespace planner {

enum class ExprType {
#undef TESSERA_EXPR_NODE
#define TESSERA_EXPR_NODE(NAME) k##NAME,
#include "src/planner/ir/expr_nodes.inl"
#undef TESSERA_EXPR_NODE
  number_of_types  // Not a real type, keeps the strings in line with the enum.
};

static constexpr const char* kExprTypeStrings[] = {
#undef TESSERA_EXPR_NODE
#define TESSERA_EXPR_NODE(NAME) #NAME,
// NOLINTNEXTLINE : build/include
#include "src/planner/ir/expr_nodes.inl"
#undef TESSERA_EXPR_NODE
};

inline std::ostream& operator<<(std::ostream& out, ExprType type) {
  return out << kExprTypeStrings[static_cast<int64_t>(type)];
}

// A declared parameter. Parameters without a default are required.
struct ParamSpec {
  std::string name;
  std::optional<Operand> default_value;
};
using Params = std::vector<ParamSpec>;

using NamedOperands = absl::flat_hash_map<std::string, Operand>;
using ExprMap = absl::flat_hash_map<std::string, ExprPtr>;

/**
 * @brief Immutable node of the expression tree.
 *
 * An expression is an operator type plus an ordered list of operands, bound against the
 * type's declared parameters. Expressions are only created through Expr::Create, which
 * binds the operands and infers the output Meta, and are never modified afterwards: every
 * rewrite builds new expressions.
 *
 * Two expressions with the same type and operands have the same name(), a fingerprint of
 * both that identifies the expression in rewrites and in the task graph.
 */
class Expr : public std::enable_shared_from_this<Expr>, public NotCopyable {
 public:
  virtual ~Expr() = default;

  /**
   * @brief Creates an expression of type T.
   *
   * Positional operands bind to the leading parameters, named operands by name, and the
   * remaining parameters take their defaults.
   *
   * @return the expression, or INVALID_ARGUMENT when binding or Meta inference fails.
   */
  template <typename T>
  static StatusOr<std::shared_ptr<const T>> Create(std::vector<Operand> positional,
                                                   NamedOperands named = {}) {
    TESSERA_ASSIGN_OR_RETURN(
        std::vector<Operand> operands,
        BindOperands(T::kType, T::params(), std::move(positional), std::move(named)));
    auto expr = std::make_shared<T>(std::move(operands));
    TESSERA_RETURN_IF_ERROR(expr->Init());
    return std::shared_ptr<const T>(std::move(expr));
  }

  ExprType type() const { return type_; }
  std::string type_string() const { return TypeString(type_); }
  static std::string TypeString(ExprType type) {
    return kExprTypeStrings[static_cast<int64_t>(type)];
  }

  const Params& parameters() const { return *params_; }
  const std::vector<Operand>& operands() const { return operands_; }
  // Index of a declared parameter, or -1.
  int64_t ParamIndex(std::string_view param) const;
  // The operand bound to a declared parameter. The parameter must exist.
  const Operand& operand(std::string_view param) const;

  const std::string& name() const;
  const Meta& meta() const { return meta_; }
  const Divisions& divisions() const;
  int64_t npartitions() const { return divisions().npartitions(); }
  int64_t ndim() const { return meta_.ndim(); }
  bool known_divisions() const { return divisions().known(); }
  std::vector<std::string> columns() const { return meta_.column_names(); }

  // The child expressions, without duplicates. These are the edges of the task graph.
  virtual ExprList dependencies() const;
  // Opaque operands hold expressions that are not children (e.g. the members of a fused
  // group) and are left alone by tree traversals.
  virtual bool IsOpaqueOperand(size_t) const { return false; }

  // One task per partition reading only the matching partition of each dependency.
  virtual bool IsBlockwise() const { return false; }
  // Blockwise and row preserving.
  virtual bool IsElemwise() const { return false; }
  virtual bool IsIO() const { return false; }
  virtual bool IsReduction() const { return false; }

  // A dependency with one partition and fewer dimensions is sent whole to every partition.
  bool IsBroadcastDep(const ExprPtr& dep) const {
    return dep->npartitions() == 1 && dep->ndim() < ndim();
  }

  /**
   * @brief Looks up a property (name, npartitions, ndim, columns, known_divisions,
   * divisions, meta) and then an operand by name.
   *
   * @return NOT_FOUND when neither exists.
   */
  StatusOr<Operand> Lookup(std::string_view attr) const;

  // A copy with some operands replaced by name. Returns this expression when nothing changed.
  StatusOr<ExprPtr> SubstituteParameters(const NamedOperands& changes) const;
  // Replaces every subexpression whose name is a key of the map.
  StatusOr<ExprPtr> Substitute(const ExprMap& replacements) const;
  // Rebuilds this expression with each child replaced by fn(child), skipping opaque operands.
  StatusOr<ExprPtr> TransformChildren(
      const std::function<StatusOr<ExprPtr>(const ExprPtr&)>& fn) const;
  // A new expression of the same type with the given operands.
  virtual StatusOr<ExprPtr> Rebuild(std::vector<Operand> operands) const = 0;

  // Rewrite hooks. A null result declines.
  // Replacement for this expression in terms of its own operands.
  virtual StatusOr<ExprPtr> Simplify() const { return ExprPtr(); }
  // Replacement for parent, one of this expression's dependents.
  virtual StatusOr<ExprPtr> SimplifyUp(const ExprPtr& /*parent*/) const { return ExprPtr(); }
  // Replacement that shares work with similar expressions found under root.
  virtual StatusOr<ExprPtr> CombineSimilar(const ExprPtr& /*root*/) const { return ExprPtr(); }
  // Expansion into lower level expressions.
  virtual StatusOr<ExprPtr> Lower() const { return ExprPtr(); }

  // Fills in the tasks of this expression, keyed (name(), partition).
  Status BuildLayer(taskgraphpb::Layer* layer) const;

  // Tree representation, one expression per line.
  std::string DebugString() const;

  ExprPtr self() const { return shared_from_this(); }

 protected:
  Expr(ExprType type, const Params* params, std::vector<Operand> operands)
      : type_(type), params_(params), operands_(std::move(operands)) {}

  // Runs before Meta inference; the place to load source metadata.
  virtual Status Prepare() { return Status::OK(); }
  virtual StatusOr<Meta> ComputeMeta() const = 0;
  // Called once, after construction succeeded. The default takes the first dependency's.
  virtual Divisions ComputeDivisions() const;
  virtual std::string ComputeName() const;
  virtual Status BuildTasks(taskgraphpb::Layer* layer) const = 0;

  // Fails unless the operand holds an expression.
  Status ExpectExprOperand(std::string_view param) const;

  // <lower case type>-<fingerprint of type and operands>.
  std::string DefaultName(std::string_view prefix) const;

 private:
  static StatusOr<std::vector<Operand>> BindOperands(ExprType type, const Params& params,
                                                     std::vector<Operand> positional,
                                                     NamedOperands named);
  Status Init();
  void DebugStringImpl(int depth, std::string* out) const;

  ExprType type_;
  const Params* params_;
  std::vector<Operand> operands_;
  Meta meta_;

  mutable std::once_flag name_once_;
  mutable std::string name_;
  mutable std::once_flag divisions_once_;
  mutable Divisions divisions_;
};

inline std::ostream& operator<<(std::ostream& out, const Expr& expr) {
  return out << expr.DebugString();
}

// Every distinct expression under root (by name), dependencies before dependents.
ExprList TopologicalOrder(const ExprPtr& root);

// Declares the type tag, constructor, parameter list and Rebuild of an expression class.
#define TESSERA_DECLARE_EXPR(NAME, BASE)                                             \
 public:                                                                             \
  static constexpr ExprType kType = ExprType::k##NAME;                               \
  explicit NAME(std::vector<Operand> operands)                                       \
      : BASE(kType, &params(), std::move(operands)) {}                               \
  static const Params& params();                                                     \
  StatusOr<ExprPtr> Rebuild(std::vector<Operand> operands) const override {          \
    return ::tessera::planner::Expr::Create<NAME>(std::move(operands));              \
  }

}  // namespace planner
}  // namespace tessera
