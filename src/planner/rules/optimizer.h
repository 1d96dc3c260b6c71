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

#include "src/planner/rules/planner_state.h"
#include "src/planner/rules/rule_executor.h"
#include "src/planner/rules/rules.h"

namespace tessera {
namespace planner {

// Runs the simplify rules to a fixed point.
class Simplifier : public RuleExecutor<ExprPlan> {
 public:
  static StatusOr<std::unique_ptr<Simplifier>> Create(const PlannerOptions* options) {
    std::unique_ptr<Simplifier> simplifier(new Simplifier(options));
    TESSERA_RETURN_IF_ERROR(simplifier->Init());
    return simplifier;
  }

 private:
  explicit Simplifier(const PlannerOptions* options) : options_(options) {}

  Status Init() {
    RuleBatch* simplify = CreateRuleBatch<FailOnMax>("Simplify", options_->max_iterations);
    simplify->AddRule<SimplifyRule>(options_);
    return Status::OK();
  }

  const PlannerOptions* options_;
};

/**
 * @brief The full optimizer: simplify, combine similar reads, lower, then fuse.
 *
 * The output of Execute is ready to be materialized.
 */
class Optimizer : public RuleExecutor<ExprPlan> {
 public:
  static StatusOr<std::unique_ptr<Optimizer>> Create(const PlannerOptions* options) {
    std::unique_ptr<Optimizer> optimizer(new Optimizer(options));
    TESSERA_RETURN_IF_ERROR(optimizer->Init());
    return optimizer;
  }

 private:
  explicit Optimizer(const PlannerOptions* options) : options_(options) {}

  void CreateSimplifyBatch() {
    RuleBatch* simplify = CreateRuleBatch<FailOnMax>("Simplify", options_->max_iterations);
    simplify->AddRule<SimplifyRule>(options_);
  }

  void CreateCombineSimilarBatch() {
    RuleBatch* combine = CreateRuleBatch<DoOnce>("CombineSimilar");
    combine->AddRule<CombineSimilarRule>(options_);
  }

  void CreateLowerBatch() {
    RuleBatch* lower = CreateRuleBatch<DoOnce>("Lower");
    lower->AddRule<LowerRule>(options_);
  }

  void CreateFusionBatch() {
    RuleBatch* fusion = CreateRuleBatch<DoOnce>("Fusion");
    fusion->AddRule<FusionRule>(options_);
  }

  Status Init() {
    CreateSimplifyBatch();
    CreateCombineSimilarBatch();
    CreateLowerBatch();
    CreateFusionBatch();
    return Status::OK();
  }

  const PlannerOptions* options_;
};

}  // namespace planner
}  // namespace tessera
