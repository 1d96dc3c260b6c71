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

#include <absl/container/flat_hash_map.h>

#include "src/planner/ir/expr.h"
#include "src/planner/rules/planner_state.h"

namespace tessera {
namespace planner {

// The tree a rule executor rewrites. Rules replace the root with the rewritten tree.
struct ExprPlan {
  ExprPtr root;
};

template <typename TPlan>
class BaseRule {
 public:
  BaseRule() = delete;
  explicit BaseRule(const PlannerOptions* options) : options_(options) {}

  virtual ~BaseRule() = default;

  /**
   * @brief Rewrites the plan.
   *
   * @return true if the plan changed, an error if a rewrite failed.
   */
  virtual StatusOr<bool> Execute(TPlan* plan) = 0;

 protected:
  const PlannerOptions* options_;
};

using Rule = BaseRule<ExprPlan>;

/**
 * @brief A rule applied to every expression of the tree, dependencies first.
 *
 * Each expression is handed to Apply with its dependencies already rewritten, and the
 * result replaces it everywhere in the tree.
 */
class ExprRule : public Rule {
 public:
  explicit ExprRule(const PlannerOptions* options) : Rule(options) {}

  StatusOr<bool> Execute(ExprPlan* plan) override;

 protected:
  /**
   * @brief Applies the rule to an expression.
   *
   * @return the replacement, or null to keep the expression.
   */
  virtual StatusOr<ExprPtr> Apply(const ExprPtr& expr) = 0;

  // The root of the plan before this execution.
  const ExprPtr& root() const { return root_; }

 private:
  ExprPtr root_;
};

/**
 * @brief One pass of local and parent-context simplification over the whole tree.
 *
 * Every expression is first simplified in place, by its own Simplify and by the SimplifyUp
 * of its dependencies, and then its dependencies are simplified recursively. Run it to a
 * fixed point with a FailOnMax batch.
 */
class SimplifyRule : public Rule {
 public:
  explicit SimplifyRule(const PlannerOptions* options) : Rule(options) {}

  StatusOr<bool> Execute(ExprPlan* plan) override;

 private:
  StatusOr<ExprPtr> SimplifyOnce(const ExprPtr& expr, ExprMap* simplified);
};

// Replaces reads of the same source that differ only in their columns by one read.
class CombineSimilarRule : public ExprRule {
 public:
  explicit CombineSimilarRule(const PlannerOptions* options) : ExprRule(options) {}

 protected:
  StatusOr<ExprPtr> Apply(const ExprPtr& expr) override;
};

// Expands expressions that have no tasks of their own, such as reductions.
class LowerRule : public ExprRule {
 public:
  explicit LowerRule(const PlannerOptions* options) : ExprRule(options) {}

 protected:
  StatusOr<ExprPtr> Apply(const ExprPtr& expr) override;
};

/**
 * @brief Collapses chains of blockwise expressions into Fused groups.
 *
 * A group grows from a root towards its dependencies. A dependency joins when it is
 * fusable, has the partition count of the expression that reads it, is not broadcast, and
 * has no dependents outside the group. The rule replaces one group at a time until no group
 * of two or more members remains.
 */
class FusionRule : public Rule {
 public:
  explicit FusionRule(const PlannerOptions* options) : Rule(options) {}

  StatusOr<bool> Execute(ExprPlan* plan) override;

 private:
  bool IsFusable(const Expr& expr) const;
  // Replaces the first group found. Returns null when there is none.
  StatusOr<ExprPtr> FusionPass(const ExprPtr& root) const;
};

}  // namespace planner
}  // namespace tessera
