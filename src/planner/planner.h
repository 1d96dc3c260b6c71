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
#include <vector>

#include "src/common/base/base.h"
#include "src/planner/exec/executor.h"
#include "src/planner/graph/materialize.h"
#include "src/planner/ir/expr.h"
#include "src/planner/rules/planner_state.h"

namespace tessera {
namespace planner {

/**
 * @brief Entry point that turns an expression tree into computed partitions.
 *
 * Planning is purely functional: every call returns a new tree or graph and leaves its
 * input untouched, so one planner can serve any number of expressions.
 */
class Planner : public NotCopyable {
 public:
  static StatusOr<std::unique_ptr<Planner>> Create(
      const PlannerOptions& options = PlannerOptions::FromFlags());

  /**
   * @brief Runs the local and parent-context rewrites to a fixed point.
   *
   * @return the simplified tree, or DEADLINE_EXCEEDED when the rewrites do not converge
   * within the iteration budget.
   */
  StatusOr<ExprPtr> Simplify(const ExprPtr& expr) const;

  /**
   * @brief Simplifies, combines similar reads, lowers and fuses.
   *
   * Optimizing an optimized tree returns the same tree.
   */
  StatusOr<ExprPtr> Optimize(const ExprPtr& expr) const;

  // The task graph of expr as it is, without optimizing it first.
  StatusOr<MaterializedGraph> Materialize(const ExprPtr& expr) const;

  /**
   * @brief Optimizes and materializes expr, then runs the graph on executor.
   *
   * @return one value per output partition, or the first task error.
   */
  StatusOr<std::vector<DatumPtr>> Compute(const ExprPtr& expr, Executor* executor) const;

  const PlannerOptions& options() const { return options_; }

 protected:
  explicit Planner(const PlannerOptions& options) : options_(options) {}

 private:
  PlannerOptions options_;
};

}  // namespace planner
}  // namespace tessera
